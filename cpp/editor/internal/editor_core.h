#pragma once

#include "editor/core/types.h"
#include "editor/editor.h"
#include "editor/entity/selection_manager.h"
#include "editor/history/history_manager.h"
#include "editor/interaction/action_log.h"
#include "editor/interaction/interaction_session.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

class DesignEditor;

// Private state of a DesignEditor. Owned through a unique_ptr so the public
// header stays free of the manager headers.
struct EditorCore {
    EditorCore(DesignEditor& editor, const EditorConfig& config);

    EditorCore(const EditorCore&) = delete;
    EditorCore& operator=(const EditorCore&) = delete;

    Design design{};
    SelectionManager selectionManager_;
    HistoryManager historyManager_;
    InteractionSession interactionSession_;
    ActionLog actionLog_;

    Viewport viewport{};
    double snapIncrement{0.25};
    ToolKind tool{ToolKind::Select};
    std::optional<PendingPlacement> pendingPlacement{};
    std::vector<PointFt> measurePoints{};

    std::uint32_t nextEntityId_{1};
    std::uint32_t generation{0};
    EditorError lastError{EditorError::Ok};

    static constexpr std::size_t kMaxEvents = 2048;
    std::vector<DesignEditor::EditorEvent> eventQueue_{};
    std::size_t eventHead_{0};
    std::size_t eventTail_{0};
    std::size_t eventCount_{0};
    bool eventOverflowed_{false};
    std::uint32_t eventOverflowGeneration_{0};
    std::vector<DesignEditor::EditorEvent> eventBuffer_{};

    std::uint32_t pendingDocMask_{0};
    bool pendingSelectionChanged_{false};
    bool pendingHistoryChanged_{false};
    bool pendingViewportChanged_{false};
    bool pendingInteractionChanged_{false};
    bool pendingToolChanged_{false};
};
