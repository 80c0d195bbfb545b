#include "editor/interaction/interaction_session.h"
#include "editor/editor.h"
#include "editor/geometry/geometry.h"
#include "editor/core/logging.h"

#include <algorithm>

using editor::geometry::snap;

namespace {

constexpr std::uint32_t kZonesMask = static_cast<std::uint32_t>(DesignEditor::ChangeMask::Zones);

// Lower bound wins when the range is inverted (zone larger than the shell).
double clampRange(double value, double lo, double hi) {
    return std::max(lo, std::min(value, hi));
}

bool handleHas(ZoneHandle handle, char edge) {
    const char* name = zoneHandleName(handle);
    for (const char* c = name; *c; ++c) {
        if (*c == edge) return true;
    }
    return false;
}

} // namespace

// ==============================================================================
// Zone drag
// ==============================================================================

EditorError InteractionSession::beginZoneDrag(std::uint32_t zoneId, const PointFt& pointer) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Zone* zone = editor_.findZone(zoneId);
    if (!zone) return EditorError::UnknownEntity;

    ZoneDragState drag{};
    drag.zoneId = zoneId;
    drag.pointerOriginFt = pointer;
    drag.startPositionFt = PointFt{zone->xFt, zone->yFt};
    return beginGesture(drag, "zone-drag", true);
}

EditorError InteractionSession::updateZoneDrag(const PointFt& pointer) {
    const auto* drag = std::get_if<ZoneDragState>(&transient_);
    if (!drag) return EditorError::NoActiveInteraction;
    Zone* zone = editor_.findZoneMutable(drag->zoneId);
    if (!zone) {
        cancel();
        return EditorError::UnknownEntity;
    }

    const double increment = editor_.snapIncrement();
    const Shell& shell = editor_.design().shell;
    const double x = clampRange(
        snap(drag->startPositionFt.x + (pointer.x - drag->pointerOriginFt.x), increment),
        0.0, shell.lengthFt - zone->lengthFt);
    const double y = clampRange(
        snap(drag->startPositionFt.y + (pointer.y - drag->pointerOriginFt.y), increment),
        0.0, shell.widthFt - zone->widthFt);

    if (x == zone->xFt && y == zone->yFt) return EditorError::Ok;
    zone->xFt = x;
    zone->yFt = y;
    editor_.recordDocChanged(kZonesMask);
    return EditorError::Ok;
}

EditorError InteractionSession::commitZoneDrag() {
    if (!std::holds_alternative<ZoneDragState>(transient_)) return EditorError::NoActiveInteraction;
    finishGesture(kZonesMask);
    return EditorError::Ok;
}

// ==============================================================================
// Zone resize
// ==============================================================================

EditorError InteractionSession::beginZoneResize(std::uint32_t zoneId, ZoneHandle handle, const PointFt& pointer) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Zone* zone = editor_.findZone(zoneId);
    if (!zone) return EditorError::UnknownEntity;
    if (zone->hasConstraints && !zone->constraints.canResize) {
        EDITOR_LOG_DEBUG("zone %u is not resizable", zoneId);
        return EditorError::EntityLocked;
    }

    ZoneResizeState resize{};
    resize.zoneId = zoneId;
    resize.handle = handle;
    resize.pointerOriginFt = pointer;
    resize.startXFt = zone->xFt;
    resize.startYFt = zone->yFt;
    resize.startLengthFt = zone->lengthFt;
    resize.startWidthFt = zone->widthFt;
    return beginGesture(resize, "zone-resize", true);
}

EditorError InteractionSession::updateZoneResize(const PointFt& pointer) {
    const auto* resize = std::get_if<ZoneResizeState>(&transient_);
    if (!resize) return EditorError::NoActiveInteraction;
    Zone* zone = editor_.findZoneMutable(resize->zoneId);
    if (!zone) {
        cancel();
        return EditorError::UnknownEntity;
    }

    const double increment = editor_.snapIncrement();
    const double minSize = editor_.config().minZoneSizeFt;
    const double dx = pointer.x - resize->pointerOriginFt.x;
    const double dy = pointer.y - resize->pointerOriginFt.y;

    double x = resize->startXFt;
    double y = resize->startYFt;
    double length = resize->startLengthFt;
    double width = resize->startWidthFt;

    if (handleHas(resize->handle, 'e')) {
        length = std::max(minSize, snap(resize->startLengthFt + dx, increment));
    }
    if (handleHas(resize->handle, 'w')) {
        length = std::max(minSize, snap(resize->startLengthFt - dx, increment));
        x = resize->startXFt + resize->startLengthFt - length;
    }
    if (handleHas(resize->handle, 's')) {
        width = std::max(minSize, snap(resize->startWidthFt + dy, increment));
    }
    if (handleHas(resize->handle, 'n')) {
        width = std::max(minSize, snap(resize->startWidthFt - dy, increment));
        y = resize->startYFt + resize->startWidthFt - width;
    }

    const Shell& shell = editor_.design().shell;
    x = clampRange(snap(x, increment), 0.0, shell.lengthFt - length);
    y = clampRange(snap(y, increment), 0.0, shell.widthFt - width);
    length = std::min(length, shell.lengthFt - x);
    width = std::min(width, shell.widthFt - y);

    if (x == zone->xFt && y == zone->yFt && length == zone->lengthFt && width == zone->widthFt) {
        return EditorError::Ok;
    }
    zone->xFt = x;
    zone->yFt = y;
    zone->lengthFt = length;
    zone->widthFt = width;
    editor_.recordDocChanged(kZonesMask);
    return EditorError::Ok;
}

EditorError InteractionSession::commitZoneResize() {
    if (!std::holds_alternative<ZoneResizeState>(transient_)) return EditorError::NoActiveInteraction;
    finishGesture(kZonesMask);
    return EditorError::Ok;
}
