#include "editor/command/actions.h"

namespace editor::action {

const char* actionName(ActionKind kind) {
    switch (kind) {
        case ActionKind::SelectFixture: return "SELECT_FIXTURE";
        case ActionKind::SelectFixtures: return "SELECT_FIXTURES";
        case ActionKind::ToggleFixtureSelection: return "TOGGLE_FIXTURE_SELECTION";
        case ActionKind::ClearSelection: return "CLEAR_SELECTION";
        case ActionKind::SelectZone: return "SELECT_ZONE";
        case ActionKind::SelectAnnotation: return "SELECT_ANNOTATION";
        case ActionKind::CycleSelection: return "CYCLE_SELECTION";
        case ActionKind::AddFixture: return "ADD_FIXTURE";
        case ActionKind::RemoveFixture: return "REMOVE_FIXTURE";
        case ActionKind::RemoveFixtures: return "REMOVE_FIXTURES";
        case ActionKind::UpdateFixturePosition: return "UPDATE_FIXTURE_POSITION";
        case ActionKind::UpdateFixtureRotation: return "UPDATE_FIXTURE_ROTATION";
        case ActionKind::UpdateFixtureSize: return "UPDATE_FIXTURE_SIZE";
        case ActionKind::UpdateFixtureProperties: return "UPDATE_FIXTURE_PROPERTIES";
        case ActionKind::ToggleFixtureLock: return "TOGGLE_FIXTURE_LOCK";
        case ActionKind::NudgeSelection: return "NUDGE_SELECTION";
        case ActionKind::RotateSelection: return "ROTATE_SELECTION";
        case ActionKind::StartDrag: return "START_DRAG";
        case ActionKind::UpdateDrag: return "UPDATE_DRAG";
        case ActionKind::EndDrag: return "END_DRAG";
        case ActionKind::StartMarquee: return "START_MARQUEE";
        case ActionKind::UpdateMarquee: return "UPDATE_MARQUEE";
        case ActionKind::EndMarquee: return "END_MARQUEE";
        case ActionKind::AddZone: return "ADD_ZONE";
        case ActionKind::RemoveZone: return "REMOVE_ZONE";
        case ActionKind::RenameZone: return "RENAME_ZONE";
        case ActionKind::UpdateZone: return "UPDATE_ZONE";
        case ActionKind::ResizeZone: return "RESIZE_ZONE";
        case ActionKind::StartZoneDrag: return "START_ZONE_DRAG";
        case ActionKind::UpdateZoneDrag: return "UPDATE_ZONE_DRAG";
        case ActionKind::EndZoneDrag: return "END_ZONE_DRAG";
        case ActionKind::StartZoneResize: return "START_ZONE_RESIZE";
        case ActionKind::UpdateZoneResize: return "UPDATE_ZONE_RESIZE";
        case ActionKind::EndZoneResize: return "END_ZONE_RESIZE";
        case ActionKind::StartWallDraw: return "START_WALL_DRAW";
        case ActionKind::UpdateWallDraw: return "UPDATE_WALL_DRAW";
        case ActionKind::EndWallDraw: return "END_WALL_DRAW";
        case ActionKind::CancelWallDraw: return "CANCEL_WALL_DRAW";
        case ActionKind::StartWallLengthDrag: return "START_WALL_LENGTH_DRAG";
        case ActionKind::UpdateWallLengthDrag: return "UPDATE_WALL_LENGTH_DRAG";
        case ActionKind::EndWallLengthDrag: return "END_WALL_LENGTH_DRAG";
        case ActionKind::AddAnnotation: return "ADD_ANNOTATION";
        case ActionKind::UpdateAnnotation: return "UPDATE_ANNOTATION";
        case ActionKind::RemoveAnnotation: return "REMOVE_ANNOTATION";
        case ActionKind::StartAnnotationDrag: return "START_ANNOTATION_DRAG";
        case ActionKind::UpdateAnnotationDrag: return "UPDATE_ANNOTATION_DRAG";
        case ActionKind::EndAnnotationDrag: return "END_ANNOTATION_DRAG";
        case ActionKind::PanViewport: return "PAN_VIEWPORT";
        case ActionKind::ZoomViewport: return "ZOOM_VIEWPORT";
        case ActionKind::SetViewport: return "SET_VIEWPORT";
        case ActionKind::SetSnapIncrement: return "SET_SNAP_INCREMENT";
        case ActionKind::SetTool: return "SET_TOOL";
        case ActionKind::BeginPlacement: return "BEGIN_PLACEMENT";
        case ActionKind::RotatePlacement: return "ROTATE_PLACEMENT";
        case ActionKind::CancelPlacement: return "CANCEL_PLACEMENT";
        case ActionKind::AddMeasurePoint: return "ADD_MEASURE_POINT";
        case ActionKind::ClearMeasure: return "CLEAR_MEASURE";
        case ActionKind::Undo: return "UNDO";
        case ActionKind::Redo: return "REDO";
        case ActionKind::LoadDesign: return "LOAD_DESIGN";
        case ActionKind::CancelInteraction: return "CANCEL_INTERACTION";
        case ActionKind::Count: break;
    }
    return "UNKNOWN";
}

} // namespace editor::action
