#pragma once

#include "editor/command/command_bindings.h"
#include "editor/editor.h"
#include "editor/interaction/tool_controller.h"
#include "editor/persistence/persistence_port.h"

#include <cstdint>
#include <memory>

/**
 * Wires the editor to its input adapters and to host storage.
 *
 * The stored design is loaded once by start(). After every input that
 * changed the undo stacks (commit, undo, redo) the current design is saved;
 * selection, viewport and transient updates never trigger a save.
 * Storage errors are logged, recorded as PersistenceFailed and forwarded to
 * the observer; they never propagate to the caller.
 */
class EditorHost {
public:
    EditorHost(const CatalogLookup& catalog, PersistencePort* persistence, EditorConfig config = EditorConfig{},
               ToolConfig toolConfig = ToolConfig{});

    EditorHost(const EditorHost&) = delete;
    EditorHost& operator=(const EditorHost&) = delete;

    // Returns true when a stored design was restored.
    bool start();

    bool dispatch(const editor::action::Action& action);
    bool pointerDown(const PointerInput& input);
    bool pointerMove(const PointerInput& input);
    bool pointerUp(const PointerInput& input);
    bool pointerCancel(std::int32_t pointerId);
    bool wheel(double x, double y, double deltaY);
    bool pinch(double ratio, double centerX, double centerY);
    bool handleKey(const KeyChord& chord);
    bool execute(const std::string& command);

    // Saves unconditionally; false when the port failed.
    bool saveNow();

    DesignEditor& editor() noexcept { return *editor_; }
    const DesignEditor& editor() const noexcept { return *editor_; }
    ToolController& tools() noexcept { return *tools_; }
    CommandDispatcher& commands() noexcept { return *commands_; }

    std::uint32_t saveCount() const noexcept { return saveCount_; }

private:
    bool afterInput(bool changed);
    void reportPersistenceFailure(const char* operation, const char* what);

    PersistencePort* persistence_ = nullptr;
    std::unique_ptr<DesignEditor> editor_;
    std::unique_ptr<ToolController> tools_;
    std::unique_ptr<CommandDispatcher> commands_;
    std::uint32_t savedHistoryGeneration_ = 0;
    std::uint32_t saveCount_ = 0;
};
