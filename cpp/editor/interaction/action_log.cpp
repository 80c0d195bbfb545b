#include "editor/interaction/action_log.h"
#include "editor/editor.h"
#include "editor/internal/editor_core.h"
#include "editor/core/logging.h"

ActionLog::ActionLog(DesignEditor& editor)
    : editor_(editor) {}

void ActionLog::setEnabled(bool enabled, std::size_t maxEntries) {
    enabled_ = enabled;
    overflowed_ = false;
    capacity_ = maxEntries;
    entries_.clear();
    if (!enabled) return;
    if (capacity_ > 0) {
        entries_.reserve(capacity_);
    }
    captureInitialState();
}

void ActionLog::clear() {
    entries_.clear();
    overflowed_ = false;
    if (enabled_) captureInitialState();
}

void ActionLog::captureInitialState() {
    const EditorCore& core = *editor_.core_;
    initialDesign_ = core.design;
    initialSelection_ = core.selectionManager_.getOrdered();
    initialViewport_ = core.viewport;
    initialSnapIncrement_ = core.snapIncrement;
    initialTool_ = core.tool;
    initialNextId_ = core.nextEntityId_;
}

void ActionLog::record(const editor::action::Action& action) {
    if (!enabled_ || replaying_ || overflowed_) return;
    if (entries_.size() >= capacity_) {
        EDITOR_LOG_WARN("action log full after %zu entries; replay disabled", entries_.size());
        overflowed_ = true;
        return;
    }
    entries_.push_back(action);
}

bool ActionLog::replay(DesignEditor& target) const {
    if (overflowed_) return false;
    if (target.isInteractionActive()) return false;

    EditorCore& core = *target.core_;
    const bool prevReplaying = target.actionLog().replaying_;
    target.actionLog().replaying_ = true;

    core.interactionSession_.reset();
    core.historyManager_.clear();
    core.design = initialDesign_;
    core.selectionManager_.clear();
    core.selectionManager_.setSelection(initialSelection_, SelectionManager::Mode::Replace, core.design);
    core.viewport = initialViewport_;
    core.snapIncrement = initialSnapIncrement_;
    core.tool = initialTool_;
    core.pendingPlacement.reset();
    core.measurePoints.clear();
    core.nextEntityId_ = initialNextId_;
    target.recordDocChanged(
        static_cast<std::uint32_t>(DesignEditor::ChangeMask::Fixtures)
        | static_cast<std::uint32_t>(DesignEditor::ChangeMask::Zones)
        | static_cast<std::uint32_t>(DesignEditor::ChangeMask::Annotations)
        | static_cast<std::uint32_t>(DesignEditor::ChangeMask::Shell));
    target.recordSelectionChanged();
    target.recordHistoryChanged();
    target.recordViewportChanged();
    target.recordToolChanged();
    core.generation++;
    target.flushPendingEvents();

    for (const auto& action : entries_) {
        target.dispatch(action);
    }

    target.actionLog().replaying_ = prevReplaying;
    EDITOR_LOG_DEBUG("replayed %zu actions", entries_.size());
    return true;
}
