#include "editor/interaction/interaction_session.h"
#include "editor/editor.h"
#include "editor/internal/editor_core.h"
#include "editor/geometry/geometry.h"
#include "editor/core/logging.h"

#include <algorithm>
#include <unordered_set>

using editor::geometry::clampAnchorToShell;
using editor::geometry::rectFromFixture;

namespace {
constexpr std::uint32_t kAllDocMask =
    static_cast<std::uint32_t>(DesignEditor::ChangeMask::Fixtures)
    | static_cast<std::uint32_t>(DesignEditor::ChangeMask::Zones)
    | static_cast<std::uint32_t>(DesignEditor::ChangeMask::Annotations);
} // namespace

InteractionSession::InteractionSession(DesignEditor& editor, HistoryManager& historyManager)
    : editor_(editor), historyManager_(historyManager) {}

EditorError InteractionSession::beginGesture(TransientInteraction next, const char* label, bool recordsHistory) {
    if (isInteractionActive()) {
        EDITOR_LOG_DEBUG("%s ignored: %s already active", label, transientKindName(activeKind()));
        return EditorError::InteractionBusy;
    }
    transient_ = std::move(next);
    if (recordsHistory) {
        historyManager_.beginEntry(editor_.design(), label);
    }
    editor_.recordInteractionChanged();
    return EditorError::Ok;
}

void InteractionSession::finishGesture(std::uint32_t docMask) {
    if (historyManager_.isTransactionActive()) {
        if (historyManager_.commitEntry(editor_.design())) {
            editor_.recordHistoryChanged();
            editor_.recordDocChanged(docMask);
        }
    }
    transient_ = std::monostate{};
    editor_.recordInteractionChanged();
}

bool InteractionSession::cancel() {
    if (!isInteractionActive()) return false;
    if (const Design* baseline = historyManager_.transactionBaseline()) {
        if (*baseline != editor_.design()) {
            editor_.mutableDesign() = *baseline;
            editor_.recordDocChanged(kAllDocMask);
        }
    }
    historyManager_.discardEntry();
    EDITOR_LOG_DEBUG("cancelled %s", transientKindName(activeKind()));
    transient_ = std::monostate{};
    editor_.recordInteractionChanged();
    return true;
}

void InteractionSession::reset() {
    historyManager_.discardEntry();
    if (!isInteractionActive()) return;
    transient_ = std::monostate{};
    editor_.recordInteractionChanged();
}

// ==============================================================================
// Fixture drag
// ==============================================================================

EditorError InteractionSession::beginFixtureDrag(std::uint32_t fixtureId, const PointFt& pointer) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Fixture* fixture = editor_.findFixture(fixtureId);
    if (!fixture) return EditorError::UnknownEntity;
    if (fixture->locked) return EditorError::EntityLocked;
    const CatalogItem* item = editor_.catalogItemFor(*fixture);
    if (!item) return EditorError::UnknownCatalogItem;

    FixtureDragState drag{};
    drag.fixtureId = fixtureId;
    drag.pointerOriginFt = pointer;
    drag.startPositionFt = PointFt{fixture->xFt, fixture->yFt};
    drag.startRect = rectFromFixture(*fixture, *item);
    drag.anchor = item->anchor;
    return beginGesture(drag, "drag", true);
}

EditorError InteractionSession::updateFixtureDrag(const PointFt& pointer, bool skipSnap) {
    const auto* drag = std::get_if<FixtureDragState>(&transient_);
    if (!drag) return EditorError::NoActiveInteraction;
    Fixture* fixture = editor_.findFixtureMutable(drag->fixtureId);
    if (!fixture) {
        cancel();
        return EditorError::UnknownEntity;
    }

    const double increment = editor_.snapIncrement();
    PointFt candidate{
        drag->startPositionFt.x + (pointer.x - drag->pointerOriginFt.x),
        drag->startPositionFt.y + (pointer.y - drag->pointerOriginFt.y),
    };
    if (!skipSnap) {
        candidate = editor::geometry::snapPoint(candidate, increment);
    }
    const PointFt clamped = clampAnchorToShell(
        candidate,
        drag->startRect.width,
        drag->startRect.height,
        editor_.design().shell,
        drag->anchor);

    if (clamped.x == fixture->xFt && clamped.y == fixture->yFt) return EditorError::Ok;
    fixture->xFt = clamped.x;
    fixture->yFt = clamped.y;
    editor_.recordDocChanged(static_cast<std::uint32_t>(DesignEditor::ChangeMask::Fixtures));
    return EditorError::Ok;
}

EditorError InteractionSession::commitFixtureDrag() {
    if (!std::holds_alternative<FixtureDragState>(transient_)) return EditorError::NoActiveInteraction;
    finishGesture(static_cast<std::uint32_t>(DesignEditor::ChangeMask::Fixtures));
    return EditorError::Ok;
}

// ==============================================================================
// Marquee
// ==============================================================================

EditorError InteractionSession::beginMarquee(const PointFt& origin, bool append) {
    MarqueeState marquee{};
    marquee.originFt = origin;
    marquee.currentFt = origin;
    marquee.append = append;
    return beginGesture(marquee, "marquee", false);
}

EditorError InteractionSession::updateMarquee(const PointFt& current) {
    auto* marquee = std::get_if<MarqueeState>(&transient_);
    if (!marquee) return EditorError::NoActiveInteraction;
    if (marquee->currentFt == current) return EditorError::Ok;
    marquee->currentFt = current;
    editor_.recordInteractionChanged();
    return EditorError::Ok;
}

EditorError InteractionSession::commitMarquee() {
    const auto* marquee = std::get_if<MarqueeState>(&transient_);
    if (!marquee) return EditorError::NoActiveInteraction;

    const RectFt area = editor::geometry::rectFromCorners(marquee->originFt, marquee->currentFt);
    std::vector<std::uint32_t> hits;
    if (marquee->append) {
        hits = editor_.selectedIds();
    }
    std::unordered_set<std::uint32_t> seen(hits.begin(), hits.end());
    for (const auto& entry : editor_.fixtureRects()) {
        if (!editor::geometry::rectsOverlap(area, entry.rect)) continue;
        if (seen.insert(entry.id).second) hits.push_back(entry.id);
    }

    SelectionManager& selection = editor_.selection();
    const bool changed = hits.empty()
        ? selection.clearSelection()
        : selection.setSelection(hits, SelectionManager::Mode::Replace, editor_.design());
    if (changed) editor_.recordSelectionChanged();

    transient_ = std::monostate{};
    editor_.recordInteractionChanged();
    return EditorError::Ok;
}
