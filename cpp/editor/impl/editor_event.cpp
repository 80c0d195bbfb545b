// DesignEditor event stream: pending change flags coalesced per dispatch and
// flushed into a bounded ring buffer the host drains with pollEvents().

#include "editor/editor.h"
#include "editor/internal/editor_core.h"

#include <algorithm>

namespace {

void clearPending(EditorCore& core) {
    core.pendingDocMask_ = 0;
    core.pendingSelectionChanged_ = false;
    core.pendingHistoryChanged_ = false;
    core.pendingViewportChanged_ = false;
    core.pendingInteractionChanged_ = false;
    core.pendingToolChanged_ = false;
}

} // namespace

void DesignEditor::clearEventState() {
    core_->eventHead_ = 0;
    core_->eventTail_ = 0;
    core_->eventCount_ = 0;
    core_->eventOverflowed_ = false;
    core_->eventOverflowGeneration_ = 0;
    clearPending(*core_);
}

void DesignEditor::recordDocChanged(std::uint32_t mask) {
    core_->pendingDocMask_ |= mask;
}

void DesignEditor::recordSelectionChanged() {
    core_->pendingSelectionChanged_ = true;
}

void DesignEditor::recordHistoryChanged() {
    core_->pendingHistoryChanged_ = true;
}

void DesignEditor::recordViewportChanged() {
    core_->pendingViewportChanged_ = true;
}

void DesignEditor::recordInteractionChanged() {
    core_->pendingInteractionChanged_ = true;
}

void DesignEditor::recordToolChanged() {
    core_->pendingToolChanged_ = true;
}

bool DesignEditor::hasPendingChanges() const noexcept {
    return core_->pendingDocMask_ != 0
        || core_->pendingSelectionChanged_
        || core_->pendingHistoryChanged_
        || core_->pendingViewportChanged_
        || core_->pendingInteractionChanged_
        || core_->pendingToolChanged_;
}

bool DesignEditor::pushEvent(const EditorEvent& ev) {
    EditorCore& core = *core_;
    if (core.eventOverflowed_) return false;
    if (core.eventCount_ >= EditorCore::kMaxEvents) {
        core.eventOverflowed_ = true;
        core.eventOverflowGeneration_ = core.generation;
        core.eventHead_ = 0;
        core.eventTail_ = 0;
        core.eventCount_ = 0;
        return false;
    }
    core.eventQueue_[core.eventTail_] = ev;
    core.eventTail_ = (core.eventTail_ + 1) % EditorCore::kMaxEvents;
    core.eventCount_++;
    return true;
}

void DesignEditor::flushPendingEvents() {
    EditorCore& core = *core_;
    if (core.eventOverflowed_ || !hasPendingChanges()) {
        clearPending(core);
        return;
    }

    auto pushOrOverflow = [&](EventType type, std::uint32_t mask) -> bool {
        if (!pushEvent(EditorEvent{type, core.generation, mask})) {
            clearPending(core);
            return false;
        }
        return true;
    };

    if (core.pendingDocMask_ != 0) {
        if (!pushOrOverflow(EventType::DocChanged, core.pendingDocMask_)) return;
    }
    if (core.pendingSelectionChanged_) {
        if (!pushOrOverflow(EventType::SelectionChanged,
                static_cast<std::uint32_t>(core.selectionManager_.getOrdered().size()))) {
            return;
        }
    }
    if (core.pendingHistoryChanged_) {
        if (!pushOrOverflow(EventType::HistoryChanged,
                static_cast<std::uint32_t>(core.historyManager_.pastSize()))) {
            return;
        }
    }
    if (core.pendingViewportChanged_) {
        if (!pushOrOverflow(EventType::ViewportChanged, 0)) return;
    }
    if (core.pendingInteractionChanged_) {
        if (!pushOrOverflow(EventType::InteractionChanged,
                static_cast<std::uint32_t>(core.interactionSession_.activeKind()))) {
            return;
        }
    }
    if (core.pendingToolChanged_) {
        if (!pushOrOverflow(EventType::ToolChanged, static_cast<std::uint32_t>(core.tool))) return;
    }

    clearPending(core);
}

DesignEditor::EventBufferMeta DesignEditor::pollEvents(std::uint32_t maxEvents) {
    flushPendingEvents();

    EditorCore& core = *core_;
    core.eventBuffer_.clear();
    if (core.eventOverflowed_) {
        core.eventBuffer_.push_back(EditorEvent{EventType::Overflow, core.eventOverflowGeneration_, 0});
        return EventBufferMeta{core.generation, static_cast<std::uint32_t>(core.eventBuffer_.size()), true};
    }

    if (core.eventCount_ == 0 || maxEvents == 0) {
        return EventBufferMeta{core.generation, 0, false};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, core.eventCount_);
    core.eventBuffer_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        core.eventBuffer_.push_back(core.eventQueue_[core.eventHead_]);
        core.eventHead_ = (core.eventHead_ + 1) % EditorCore::kMaxEvents;
        core.eventCount_--;
    }
    return EventBufferMeta{core.generation, static_cast<std::uint32_t>(core.eventBuffer_.size()), false};
}

const std::vector<DesignEditor::EditorEvent>& DesignEditor::polledEvents() const noexcept {
    return core_->eventBuffer_;
}

void DesignEditor::ackResync(std::uint32_t resyncGeneration) {
    EditorCore& core = *core_;
    if (!core.eventOverflowed_) return;
    if (resyncGeneration < core.eventOverflowGeneration_) return;
    clearEventState();
}
