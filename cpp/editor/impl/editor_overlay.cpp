// DesignEditor overlay queries. Computed on demand from the current design
// and transient; nothing here is cached or mutates state.

#include "editor/editor.h"
#include "editor/internal/editor_core.h"

std::vector<editor::geometry::FixtureRect> DesignEditor::fixtureRects() const {
    return editor::geometry::resolveFixtureRects(core_->design.fixtures, catalog_);
}

std::optional<RectFt> DesignEditor::selectionBounds() const {
    return editor::geometry::selectionBounds(fixtureRects(), selectedIds());
}

std::vector<editor::geometry::AlignmentGuide> DesignEditor::alignmentGuides() const {
    return editor::geometry::alignmentGuides(fixtureRects(), selectedIds(), config_.alignThresholdFt);
}

std::vector<editor::geometry::CollisionHit> DesignEditor::collisions() const {
    return editor::geometry::collisions(fixtureRects());
}

std::optional<RectFt> DesignEditor::dragPreviewRect() const {
    const auto* drag = std::get_if<FixtureDragState>(&transient());
    if (!drag) return std::nullopt;
    return fixtureRect(drag->fixtureId);
}

std::optional<RectFt> DesignEditor::marqueeRect() const {
    const auto* marquee = std::get_if<MarqueeState>(&transient());
    if (!marquee) return std::nullopt;
    return editor::geometry::rectFromCorners(marquee->originFt, marquee->currentFt);
}

std::optional<std::pair<PointFt, PointFt>> DesignEditor::wallDrawPreview() const {
    const auto* draw = std::get_if<WallDrawState>(&transient());
    if (!draw || !draw->hasCurrent) return std::nullopt;
    return std::make_pair(draw->startFt, draw->currentFt);
}
