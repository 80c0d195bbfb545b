#include "editor/command/command_bindings.h"
#include "editor/core/logging.h"
#include "editor/editor.h"
#include "editor/interaction/tool_controller.h"

#include <algorithm>
#include <cctype>
#include <tuple>

namespace act = editor::action;
namespace cmd = editor::command;

// ==============================================================================
// KeyChord
// ==============================================================================

KeyChord normalizeChord(const KeyChord& chord) {
    KeyChord out = chord;
    if (out.key.size() == 1) {
        out.key[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out.key[0])));
    }
    return out;
}

bool operator<(const KeyChord& a, const KeyChord& b) {
    return std::tie(a.key, a.modifiers) < std::tie(b.key, b.modifiers);
}

bool operator==(const KeyChord& a, const KeyChord& b) {
    return a.key == b.key && a.modifiers == b.modifiers;
}

// ==============================================================================
// KeyBindingTable
// ==============================================================================

KeyBindingTable KeyBindingTable::defaults() {
    KeyBindingTable t;
    for (std::uint32_t primary : {kCtrlMask, kMetaMask}) {
        t.bind({"z", primary}, cmd::kUndo);
        t.bind({"y", primary}, cmd::kRedo);
        t.bind({"z", primary | kShiftMask}, cmd::kRedo);
    }
    t.bind({"Delete", 0}, cmd::kDeleteSelection);
    t.bind({"Backspace", 0}, cmd::kDeleteSelection);
    t.bind({"ArrowLeft", 0}, cmd::kNudgeLeft);
    t.bind({"ArrowRight", 0}, cmd::kNudgeRight);
    t.bind({"ArrowUp", 0}, cmd::kNudgeUp);
    t.bind({"ArrowDown", 0}, cmd::kNudgeDown);
    t.bind({"r", 0}, cmd::kRotate);
    t.bind({"Escape", 0}, cmd::kCancel);
    t.bind({"v", 0}, cmd::kToolSelect);
    t.bind({"h", 0}, cmd::kToolPan);
    t.bind({"w", 0}, cmd::kToolWall);
    t.bind({"m", 0}, cmd::kToolMeasure);
    t.bind({"a", 0}, cmd::kToolAnnotate);
    t.bind({"Tab", 0}, cmd::kCycleNext);
    t.bind({"Tab", kShiftMask}, cmd::kCyclePrevious);
    return t;
}

void KeyBindingTable::bind(const KeyChord& chord, const std::string& command) {
    bindings_[normalizeChord(chord)] = command;
}

bool KeyBindingTable::unbind(const KeyChord& chord) {
    return bindings_.erase(normalizeChord(chord)) > 0;
}

std::optional<std::string> KeyBindingTable::lookup(const KeyChord& chord) const {
    const auto it = bindings_.find(normalizeChord(chord));
    if (it == bindings_.end()) return std::nullopt;
    return it->second;
}

std::vector<KeyChord> KeyBindingTable::chordsFor(const std::string& command) const {
    std::vector<KeyChord> out;
    for (const auto& [chord, name] : bindings_) {
        if (name == command) out.push_back(chord);
    }
    return out;
}

// ==============================================================================
// CommandDispatcher
// ==============================================================================

CommandDispatcher::CommandDispatcher(DesignEditor& editor, ToolController* tools)
    : editor_(editor)
    , tools_(tools)
    , bindings_(KeyBindingTable::defaults()) {}

bool CommandDispatcher::handleKey(const KeyChord& chord) {
    const auto command = bindings_.lookup(chord);
    if (!command) return false;
    return execute(*command);
}

bool CommandDispatcher::execute(const std::string& command) {
    const double step = editor_.snapIncrement();
    if (command == cmd::kUndo) return editor_.dispatch(act::Undo{});
    if (command == cmd::kRedo) return editor_.dispatch(act::Redo{});
    if (command == cmd::kDeleteSelection) return deleteSelection();
    if (command == cmd::kNudgeLeft) return nudge(-step, 0.0);
    if (command == cmd::kNudgeRight) return nudge(step, 0.0);
    if (command == cmd::kNudgeUp) return nudge(0.0, -step);
    if (command == cmd::kNudgeDown) return nudge(0.0, step);
    if (command == cmd::kRotate) return rotate();
    if (command == cmd::kCancel) return cancelCascade();
    if (command == cmd::kToolSelect) return switchTool(ToolKind::Select);
    if (command == cmd::kToolPan) return switchTool(ToolKind::Pan);
    if (command == cmd::kToolWall) return switchTool(ToolKind::Wall);
    if (command == cmd::kToolMeasure) return switchTool(ToolKind::Measure);
    if (command == cmd::kToolAnnotate) return switchTool(ToolKind::Annotate);
    if (command == cmd::kCycleNext) return editor_.dispatch(act::CycleSelection{false});
    if (command == cmd::kCyclePrevious) return editor_.dispatch(act::CycleSelection{true});

    EDITOR_LOG_WARN("unknown command '%s'", command.c_str());
    editor_.reportError(EditorError::InvalidArgument);
    return false;
}

// Escape peels one layer per press: placement, transient, annotation, then
// the fixture selection together with a return to the select tool.
bool CommandDispatcher::cancelCascade() {
    if (editor_.pendingPlacement()) {
        return editor_.dispatch(act::CancelPlacement{});
    }
    if (editor_.transientKind() == TransientKind::WallDraw) {
        if (tools_) tools_->cancelGesture();
        return editor_.dispatch(act::CancelWallDraw{});
    }
    if (editor_.isInteractionActive() || (tools_ && tools_->hasCapture())) {
        if (tools_) return tools_->cancelGesture();
        return editor_.dispatch(act::CancelInteraction{});
    }
    if (editor_.selectedAnnotationId() != kNoId) {
        return editor_.dispatch(act::SelectAnnotation{kNoId});
    }
    bool changed = editor_.dispatch(act::ClearSelection{});
    changed |= switchTool(ToolKind::Select);
    return changed;
}

bool CommandDispatcher::deleteSelection() {
    if (editor_.selectedAnnotationId() != kNoId) {
        return editor_.dispatch(act::RemoveAnnotation{editor_.selectedAnnotationId()});
    }
    const auto& ids = editor_.selectedIds();
    if (ids.empty()) return false;
    return editor_.dispatch(act::RemoveFixtures{ids});
}

bool CommandDispatcher::nudge(double dx, double dy) {
    if (editor_.selectedIds().empty()) return false;
    return editor_.dispatch(act::NudgeSelection{dx, dy});
}

bool CommandDispatcher::rotate() {
    if (editor_.pendingPlacement()) {
        return editor_.dispatch(act::RotatePlacement{});
    }
    if (editor_.selectedIds().empty()) return false;
    return editor_.dispatch(act::RotateSelection{});
}

bool CommandDispatcher::switchTool(ToolKind tool) {
    if (tools_) return tools_->setTool(tool);
    return editor_.dispatch(act::SetTool{tool});
}
