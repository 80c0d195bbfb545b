#include "editor/interaction/interaction_session.h"
#include "editor/editor.h"
#include "editor/entity/selection_manager.h"
#include "editor/geometry/geometry.h"
#include "editor/core/logging.h"

#include <algorithm>
#include <cmath>

using editor::geometry::snap;
using editor::geometry::snapPoint;

namespace {

constexpr std::uint32_t kFixturesMask = static_cast<std::uint32_t>(DesignEditor::ChangeMask::Fixtures);
constexpr double kPi = 3.14159265358979323846;

// Walls are catalogued vertically (length along Y); a mostly horizontal
// stroke therefore needs a quarter turn.
std::int32_t wallRotationForStroke(double dx, double dy) {
    const double angleDeg = std::atan2(dy, dx) * 180.0 / kPi;
    if (angleDeg >= -45.0 && angleDeg < 45.0) return 90;
    if (angleDeg >= 45.0 && angleDeg < 135.0) return 0;
    if (angleDeg >= -135.0 && angleDeg < -45.0) return 0;
    return 90;
}

} // namespace

// ==============================================================================
// Wall draw
// ==============================================================================

EditorError InteractionSession::beginWallDraw(const PointFt& point) {
    WallDrawState draw{};
    draw.startFt = snapPoint(point, editor_.snapIncrement());
    return beginGesture(draw, "wall-draw", false);
}

EditorError InteractionSession::updateWallDraw(const PointFt& point) {
    auto* draw = std::get_if<WallDrawState>(&transient_);
    if (!draw) return EditorError::NoActiveInteraction;
    const PointFt snapped = snapPoint(point, editor_.snapIncrement());
    if (draw->hasCurrent && draw->currentFt == snapped) return EditorError::Ok;
    draw->hasCurrent = true;
    draw->currentFt = snapped;
    editor_.recordInteractionChanged();
    return EditorError::Ok;
}

EditorError InteractionSession::commitWallDraw(const PointFt& point) {
    const auto* draw = std::get_if<WallDrawState>(&transient_);
    if (!draw) return EditorError::NoActiveInteraction;

    const double increment = editor_.snapIncrement();
    const PointFt start = draw->startFt;
    const PointFt end = snapPoint(point, increment);
    transient_ = std::monostate{};
    editor_.recordInteractionChanged();

    const double dx = end.x - start.x;
    const double dy = end.y - start.y;
    const double length = std::sqrt(dx * dx + dy * dy);
    if (length < editor_.config().minWallLengthFt) {
        EDITOR_LOG_DEBUG("wall stroke too short (%.3f ft), discarded", length);
        return EditorError::Ok;
    }

    const std::int32_t rotation = wallRotationForStroke(dx, dy);
    const double effectiveLength = rotation == 0 ? std::abs(dy) : std::abs(dx);

    Fixture wall{};
    wall.id = editor_.allocateId();
    wall.catalogKey = kWallCatalogKey;
    wall.xFt = snap((start.x + end.x) / 2.0, increment);
    wall.yFt = snap((start.y + end.y) / 2.0, increment);
    wall.rotationDeg = rotation;
    wall.properties[kLengthOverrideProp] =
        std::max(editor_.config().minWallLengthAfterDragFt, snap(effectiveLength, increment));
    wall.properties[kMaterialProp] = std::string("drywall");
    wall.properties[kTransparent3DProp] = true;

    const Design before = editor_.design();
    editor_.mutableDesign().fixtures.push_back(wall);
    editor_.commitDesignChange(before, "wall");
    editor_.recordDocChanged(kFixturesMask);

    if (editor_.selection().setSelection({wall.id}, SelectionManager::Mode::Replace, editor_.design())) {
        editor_.recordSelectionChanged();
    }
    EDITOR_LOG_DEBUG("wall %u drawn, rotation %d", wall.id, rotation);
    return EditorError::Ok;
}

EditorError InteractionSession::cancelWallDraw() {
    if (!std::holds_alternative<WallDrawState>(transient_)) return EditorError::Ok;
    transient_ = std::monostate{};
    editor_.recordInteractionChanged();
    return EditorError::Ok;
}

// ==============================================================================
// Wall length drag
// ==============================================================================

EditorError InteractionSession::beginWallLengthDrag(std::uint32_t fixtureId, WallEnd end, const PointFt& pointer) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Fixture* fixture = editor_.findFixture(fixtureId);
    if (!fixture) return EditorError::UnknownEntity;
    if (!isWallKey(fixture->catalogKey)) return EditorError::InvalidArgument;
    if (fixture->locked) return EditorError::EntityLocked;

    const CatalogItem* item = editor_.catalogItemFor(*fixture);
    bool horizontal = fixture->rotationDeg == 90 || fixture->rotationDeg == 270;
    if (item) {
        const RectFt rect = editor::geometry::rectFromFixture(*fixture, *item);
        horizontal = rect.width >= rect.height;
    }

    WallLengthDragState drag{};
    drag.fixtureId = fixtureId;
    drag.end = end;
    drag.horizontal = horizontal;
    drag.pointerOriginFt = pointer;
    drag.startLengthFt = editor::geometry::wallLengthFt(*fixture, item);
    drag.startCenterFt = PointFt{fixture->xFt, fixture->yFt};
    return beginGesture(drag, "wall-length", true);
}

EditorError InteractionSession::updateWallLengthDrag(const PointFt& pointer) {
    const auto* drag = std::get_if<WallLengthDragState>(&transient_);
    if (!drag) return EditorError::NoActiveInteraction;
    Fixture* fixture = editor_.findFixtureMutable(drag->fixtureId);
    if (!fixture) {
        cancel();
        return EditorError::UnknownEntity;
    }

    const double raw = drag->horizontal
        ? pointer.x - drag->pointerOriginFt.x
        : pointer.y - drag->pointerOriginFt.y;
    const double lengthDelta = drag->end == WallEnd::End ? raw : -raw;
    const double length = std::max(editor_.config().minWallLengthAfterDragFt, drag->startLengthFt + lengthDelta);
    const double shift = (length - drag->startLengthFt) / 2.0;
    const double signedShift = drag->end == WallEnd::End ? shift : -shift;

    PointFt center = drag->startCenterFt;
    if (drag->horizontal) {
        center.x += signedShift;
    } else {
        center.y += signedShift;
    }

    const double* current = editor::geometry::numberProperty(fixture->properties, kLengthOverrideProp);
    if (current && *current == length && fixture->xFt == center.x && fixture->yFt == center.y) {
        return EditorError::Ok;
    }
    fixture->xFt = center.x;
    fixture->yFt = center.y;
    fixture->properties[kLengthOverrideProp] = length;
    editor_.recordDocChanged(kFixturesMask);
    return EditorError::Ok;
}

EditorError InteractionSession::commitWallLengthDrag() {
    const auto* drag = std::get_if<WallLengthDragState>(&transient_);
    if (!drag) return EditorError::NoActiveInteraction;

    if (Fixture* fixture = editor_.findFixtureMutable(drag->fixtureId)) {
        const double increment = editor_.snapIncrement();
        // The edge opposite the dragged grip stays put.
        const double startAxis = drag->horizontal ? drag->startCenterFt.x : drag->startCenterFt.y;
        const double fixedEdge = drag->end == WallEnd::End
            ? startAxis - drag->startLengthFt / 2.0
            : startAxis + drag->startLengthFt / 2.0;
        const double snappedEdge = snap(fixedEdge, increment);

        const double* current = editor::geometry::numberProperty(fixture->properties, kLengthOverrideProp);
        const double rawLength = current ? *current : drag->startLengthFt;
        const double length = std::max(editor_.config().minWallLengthAfterDragFt, snap(rawLength, increment));
        const double axisCenter = drag->end == WallEnd::End
            ? snappedEdge + length / 2.0
            : snappedEdge - length / 2.0;

        if (drag->horizontal) {
            fixture->xFt = axisCenter;
            fixture->yFt = snap(fixture->yFt, increment);
        } else {
            fixture->xFt = snap(fixture->xFt, increment);
            fixture->yFt = axisCenter;
        }
        fixture->properties[kLengthOverrideProp] = length;
        editor_.recordDocChanged(kFixturesMask);
    }

    finishGesture(kFixturesMask);
    return EditorError::Ok;
}
