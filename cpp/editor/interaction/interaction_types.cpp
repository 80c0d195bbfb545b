#include "editor/interaction/interaction_types.h"

const char* toolKindName(ToolKind tool) {
    switch (tool) {
        case ToolKind::Select: return "select";
        case ToolKind::Pan: return "pan";
        case ToolKind::Wall: return "wall";
        case ToolKind::Measure: return "measure";
        case ToolKind::Annotate: return "annotate";
    }
    return "unknown";
}

const char* transientKindName(TransientKind kind) {
    switch (kind) {
        case TransientKind::None: return "none";
        case TransientKind::FixtureDrag: return "drag";
        case TransientKind::ZoneDrag: return "zone-drag";
        case TransientKind::ZoneResize: return "zone-resize";
        case TransientKind::Marquee: return "marquee";
        case TransientKind::WallDraw: return "wall-draw";
        case TransientKind::WallLengthDrag: return "wall-length-drag";
        case TransientKind::AnnotationDrag: return "annotation-drag";
    }
    return "unknown";
}

const char* zoneHandleName(ZoneHandle handle) {
    switch (handle) {
        case ZoneHandle::N: return "n";
        case ZoneHandle::S: return "s";
        case ZoneHandle::E: return "e";
        case ZoneHandle::W: return "w";
        case ZoneHandle::NE: return "ne";
        case ZoneHandle::NW: return "nw";
        case ZoneHandle::SE: return "se";
        case ZoneHandle::SW: return "sw";
    }
    return "?";
}

bool operator==(const FixtureDragState& a, const FixtureDragState& b) {
    return a.fixtureId == b.fixtureId
        && a.pointerOriginFt == b.pointerOriginFt
        && a.startPositionFt == b.startPositionFt
        && a.startRect == b.startRect
        && a.anchor == b.anchor;
}

bool operator==(const ZoneDragState& a, const ZoneDragState& b) {
    return a.zoneId == b.zoneId
        && a.pointerOriginFt == b.pointerOriginFt
        && a.startPositionFt == b.startPositionFt;
}

bool operator==(const ZoneResizeState& a, const ZoneResizeState& b) {
    return a.zoneId == b.zoneId
        && a.handle == b.handle
        && a.pointerOriginFt == b.pointerOriginFt
        && a.startXFt == b.startXFt
        && a.startYFt == b.startYFt
        && a.startLengthFt == b.startLengthFt
        && a.startWidthFt == b.startWidthFt;
}

bool operator==(const MarqueeState& a, const MarqueeState& b) {
    return a.originFt == b.originFt && a.currentFt == b.currentFt && a.append == b.append;
}

bool operator==(const WallDrawState& a, const WallDrawState& b) {
    return a.startFt == b.startFt && a.hasCurrent == b.hasCurrent && a.currentFt == b.currentFt;
}

bool operator==(const WallLengthDragState& a, const WallLengthDragState& b) {
    return a.fixtureId == b.fixtureId
        && a.end == b.end
        && a.horizontal == b.horizontal
        && a.pointerOriginFt == b.pointerOriginFt
        && a.startLengthFt == b.startLengthFt
        && a.startCenterFt == b.startCenterFt;
}

bool operator==(const AnnotationDragState& a, const AnnotationDragState& b) {
    return a.annotationId == b.annotationId
        && a.target == b.target
        && a.pointerOriginFt == b.pointerOriginFt
        && a.startFt == b.startFt;
}
