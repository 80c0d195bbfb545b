#include "editor/core/types.h"
#include "editor/core/editor_observer.h"

const char* editorErrorName(EditorError error) {
    switch (error) {
        case EditorError::Ok: return "ok";
        case EditorError::UnknownEntity: return "unknown-entity";
        case EditorError::UnknownCatalogItem: return "unknown-catalog-item";
        case EditorError::EntityLocked: return "entity-locked";
        case EditorError::InteractionBusy: return "interaction-busy";
        case EditorError::NoActiveInteraction: return "no-active-interaction";
        case EditorError::InvalidArgument: return "invalid-argument";
        case EditorError::PersistenceFailed: return "persistence-failed";
    }
    return "unknown";
}

bool operator==(const PointFt& a, const PointFt& b) {
    return a.x == b.x && a.y == b.y;
}

bool operator!=(const PointFt& a, const PointFt& b) {
    return !(a == b);
}

bool operator==(const RectFt& a, const RectFt& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

bool operator!=(const RectFt& a, const RectFt& b) {
    return !(a == b);
}

bool operator==(const Shell& a, const Shell& b) {
    return a.lengthFt == b.lengthFt && a.widthFt == b.widthFt && a.heightFt == b.heightFt;
}

bool operator==(const ZoneConstraints& a, const ZoneConstraints& b) {
    return a.minLengthFt == b.minLengthFt && a.maxLengthFt == b.maxLengthFt && a.canResize == b.canResize;
}

bool operator==(const Zone& a, const Zone& b) {
    if (a.hasConstraints != b.hasConstraints) return false;
    if (a.hasConstraints && !(a.constraints == b.constraints)) return false;
    return a.id == b.id
        && a.name == b.name
        && a.xFt == b.xFt
        && a.yFt == b.yFt
        && a.lengthFt == b.lengthFt
        && a.widthFt == b.widthFt;
}

bool operator==(const Fixture& a, const Fixture& b) {
    return a.id == b.id
        && a.catalogKey == b.catalogKey
        && a.xFt == b.xFt
        && a.yFt == b.yFt
        && a.rotationDeg == b.rotationDeg
        && a.locked == b.locked
        && a.properties == b.properties
        && a.zoneId == b.zoneId;
}

bool operator==(const Annotation& a, const Annotation& b) {
    return a.id == b.id && a.anchorFt == b.anchorFt && a.labelFt == b.labelFt && a.text == b.text;
}

bool operator==(const Design& a, const Design& b) {
    return a.shell == b.shell
        && a.zones == b.zones
        && a.fixtures == b.fixtures
        && a.annotations == b.annotations;
}

bool operator!=(const Design& a, const Design& b) {
    return !(a == b);
}

bool operator==(const Viewport& a, const Viewport& b) {
    return a.scale == b.scale && a.offsetX == b.offsetX && a.offsetY == b.offsetY;
}

bool operator!=(const Viewport& a, const Viewport& b) {
    return !(a == b);
}

const char* editorEventKindName(EditorEventKind kind) {
    switch (kind) {
        case EditorEventKind::ActionApplied: return "action-applied";
        case EditorEventKind::ActionRejected: return "action-rejected";
        case EditorEventKind::HistoryCommitted: return "history-committed";
        case EditorEventKind::Undo: return "undo";
        case EditorEventKind::Redo: return "redo";
        case EditorEventKind::DesignLoaded: return "design-loaded";
        case EditorEventKind::PersistenceFailed: return "persistence-failed";
    }
    return "unknown";
}
