#pragma once

#include "editor/interaction/interaction_types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class DesignEditor;
class ToolController;

// A key plus modifier mask (see InputModifier). Keys use DOM key names;
// single characters are compared case-insensitively.
struct KeyChord {
    std::string key;
    std::uint32_t modifiers = 0;
};

bool operator<(const KeyChord& a, const KeyChord& b);
bool operator==(const KeyChord& a, const KeyChord& b);

// Lowercases single-character keys so "Z" and "z" bind the same.
KeyChord normalizeChord(const KeyChord& chord);

// Editor command names understood by CommandDispatcher::execute.
namespace editor::command {
constexpr const char* kUndo = "undo";
constexpr const char* kRedo = "redo";
constexpr const char* kDeleteSelection = "delete-selection";
constexpr const char* kNudgeLeft = "nudge-left";
constexpr const char* kNudgeRight = "nudge-right";
constexpr const char* kNudgeUp = "nudge-up";
constexpr const char* kNudgeDown = "nudge-down";
constexpr const char* kRotate = "rotate";
constexpr const char* kCancel = "cancel";
constexpr const char* kToolSelect = "tool-select";
constexpr const char* kToolPan = "tool-pan";
constexpr const char* kToolWall = "tool-wall";
constexpr const char* kToolMeasure = "tool-measure";
constexpr const char* kToolAnnotate = "tool-annotate";
constexpr const char* kCycleNext = "cycle-next";
constexpr const char* kCyclePrevious = "cycle-previous";
} // namespace editor::command

class KeyBindingTable {
public:
    KeyBindingTable() = default;

    static KeyBindingTable defaults();

    // Replaces any existing binding for the chord.
    void bind(const KeyChord& chord, const std::string& command);
    bool unbind(const KeyChord& chord);
    void clear() { bindings_.clear(); }

    std::optional<std::string> lookup(const KeyChord& chord) const;
    std::vector<KeyChord> chordsFor(const std::string& command) const;
    std::size_t size() const noexcept { return bindings_.size(); }

private:
    std::map<KeyChord, std::string> bindings_;
};

/**
 * Runs named editor commands and resolves key chords through a swappable
 * binding table. The tool controller is optional; without one, Escape and
 * tool commands dispatch straight to the editor.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(DesignEditor& editor, ToolController* tools = nullptr);

    void setBindings(KeyBindingTable bindings) { bindings_ = std::move(bindings); }
    const KeyBindingTable& bindings() const noexcept { return bindings_; }

    // Returns true when the editor state changed.
    bool execute(const std::string& command);
    bool handleKey(const KeyChord& chord);

    // Whether the chord resolves to a command.
    bool isBound(const KeyChord& chord) const { return bindings_.lookup(chord).has_value(); }

private:
    bool cancelCascade();
    bool deleteSelection();
    bool nudge(double dx, double dy);
    bool rotate();
    bool switchTool(ToolKind tool);

    DesignEditor& editor_;
    ToolController* tools_ = nullptr;
    KeyBindingTable bindings_;
};
