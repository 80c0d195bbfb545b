#pragma once

#include "editor/core/types.h"
#include "editor/interaction/interaction_types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Closed set of editor actions. DesignEditor::dispatch is the only way the
// document, selection, viewport or transient interaction state changes.
namespace editor::action {

// ---- Selection -------------------------------------------------------------
struct SelectFixture { std::uint32_t id = kNoId; bool append = false; };
struct SelectFixtures { std::vector<std::uint32_t> ids; };
struct ToggleFixtureSelection { std::uint32_t id = kNoId; };
struct ClearSelection {};
struct SelectZone { std::uint32_t id = kNoId; };
struct SelectAnnotation { std::uint32_t id = kNoId; };
// Moves the selection to the next fixture in document order.
struct CycleSelection { bool reverse = false; };

// ---- Fixtures ---------------------------------------------------------------
struct AddFixture {
    std::string catalogKey;
    std::optional<PointFt> positionFt; // shell center when absent
    std::int32_t rotationDeg = 0;
    std::uint32_t zoneId = kNoId;
    PropertyMap properties;
};
struct RemoveFixture { std::uint32_t id = kNoId; };
struct RemoveFixtures { std::vector<std::uint32_t> ids; };
struct UpdateFixturePosition { std::uint32_t id = kNoId; double xFt = 0.0; double yFt = 0.0; };
struct UpdateFixtureRotation { std::uint32_t id = kNoId; double rotationDeg = 0.0; };
struct UpdateFixtureSize {
    std::uint32_t id = kNoId;
    std::optional<double> lengthFt;
    std::optional<double> widthFt;
};
struct UpdateFixtureProperties { std::uint32_t id = kNoId; PropertyMap properties; };
struct ToggleFixtureLock { std::uint32_t id = kNoId; };
struct NudgeSelection { double dxFt = 0.0; double dyFt = 0.0; };
struct RotateSelection {};

// ---- Fixture drag / marquee -------------------------------------------------
struct StartDrag { std::uint32_t id = kNoId; PointFt pointerFt{}; };
struct UpdateDrag { PointFt pointerFt{}; bool skipSnap = false; };
struct EndDrag {};
struct StartMarquee { PointFt originFt{}; bool append = false; };
struct UpdateMarquee { PointFt currentFt{}; };
struct EndMarquee {};

// ---- Zones ------------------------------------------------------------------
struct AddZone {
    std::optional<std::string> name;
    std::optional<double> xFt;
    std::optional<double> yFt;
    std::optional<double> lengthFt;
    std::optional<double> widthFt;
};
struct RemoveZone { std::uint32_t id = kNoId; };
struct RenameZone { std::uint32_t id = kNoId; std::string name; };
struct UpdateZone {
    std::uint32_t id = kNoId;
    std::optional<double> xFt;
    std::optional<double> yFt;
    std::optional<double> lengthFt;
    std::optional<double> widthFt;
    std::optional<std::string> name;
};
// Changes the length of a zone and compensates the adjacent zone.
struct ResizeZone { std::uint32_t id = kNoId; double newLengthFt = 0.0; };
struct StartZoneDrag { std::uint32_t id = kNoId; PointFt pointerFt{}; };
struct UpdateZoneDrag { PointFt pointerFt{}; };
struct EndZoneDrag {};
struct StartZoneResize { std::uint32_t id = kNoId; ZoneHandle handle = ZoneHandle::SE; PointFt pointerFt{}; };
struct UpdateZoneResize { PointFt pointerFt{}; };
struct EndZoneResize {};

// ---- Walls ------------------------------------------------------------------
struct StartWallDraw { PointFt pointFt{}; };
struct UpdateWallDraw { PointFt pointFt{}; };
struct EndWallDraw { PointFt pointFt{}; };
struct CancelWallDraw {};
struct StartWallLengthDrag { std::uint32_t id = kNoId; WallEnd end = WallEnd::End; PointFt pointerFt{}; };
struct UpdateWallLengthDrag { PointFt pointerFt{}; };
struct EndWallLengthDrag {};

// ---- Annotations ------------------------------------------------------------
struct AddAnnotation { PointFt anchorFt{}; PointFt labelFt{}; std::string text; };
struct UpdateAnnotation {
    std::uint32_t id = kNoId;
    std::optional<PointFt> anchorFt;
    std::optional<PointFt> labelFt;
    std::optional<std::string> text;
};
struct RemoveAnnotation { std::uint32_t id = kNoId; };
struct StartAnnotationDrag { std::uint32_t id = kNoId; AnnotationTarget target = AnnotationTarget::Anchor; PointFt pointerFt{}; };
struct UpdateAnnotationDrag { PointFt pointerFt{}; };
struct EndAnnotationDrag {};

// ---- Viewport ---------------------------------------------------------------
struct PanViewport { double dx = 0.0; double dy = 0.0; std::optional<ViewportBounds> bounds; };
struct ZoomViewport {
    double deltaScale = 0.0;
    bool hasCenter = false;
    double centerX = 0.0; // viewbox units
    double centerY = 0.0;
    std::optional<ViewportBounds> bounds;
};
struct SetViewport { Viewport viewport{}; };
struct SetSnapIncrement { double snapIncrement = 0.25; };

// ---- Tools ------------------------------------------------------------------
// Switching tools aborts the transient, the pending placement and the measure list.
struct SetTool { ToolKind tool = ToolKind::Select; };
struct BeginPlacement { std::string catalogKey; std::int32_t rotationDeg = 0; };
struct RotatePlacement {};
struct CancelPlacement {};
struct AddMeasurePoint { PointFt pointFt{}; };
struct ClearMeasure {};

// ---- Document ---------------------------------------------------------------
struct Undo {};
struct Redo {};
struct LoadDesign { Design design; };
// Aborts the active transient without committing.
struct CancelInteraction {};

using Action = std::variant<
    SelectFixture,
    SelectFixtures,
    ToggleFixtureSelection,
    ClearSelection,
    SelectZone,
    SelectAnnotation,
    CycleSelection,
    AddFixture,
    RemoveFixture,
    RemoveFixtures,
    UpdateFixturePosition,
    UpdateFixtureRotation,
    UpdateFixtureSize,
    UpdateFixtureProperties,
    ToggleFixtureLock,
    NudgeSelection,
    RotateSelection,
    StartDrag,
    UpdateDrag,
    EndDrag,
    StartMarquee,
    UpdateMarquee,
    EndMarquee,
    AddZone,
    RemoveZone,
    RenameZone,
    UpdateZone,
    ResizeZone,
    StartZoneDrag,
    UpdateZoneDrag,
    EndZoneDrag,
    StartZoneResize,
    UpdateZoneResize,
    EndZoneResize,
    StartWallDraw,
    UpdateWallDraw,
    EndWallDraw,
    CancelWallDraw,
    StartWallLengthDrag,
    UpdateWallLengthDrag,
    EndWallLengthDrag,
    AddAnnotation,
    UpdateAnnotation,
    RemoveAnnotation,
    StartAnnotationDrag,
    UpdateAnnotationDrag,
    EndAnnotationDrag,
    PanViewport,
    ZoomViewport,
    SetViewport,
    SetSnapIncrement,
    SetTool,
    BeginPlacement,
    RotatePlacement,
    CancelPlacement,
    AddMeasurePoint,
    ClearMeasure,
    Undo,
    Redo,
    LoadDesign,
    CancelInteraction>;

// Mirrors the alternative order of Action.
enum class ActionKind : std::uint32_t {
    SelectFixture = 0,
    SelectFixtures,
    ToggleFixtureSelection,
    ClearSelection,
    SelectZone,
    SelectAnnotation,
    CycleSelection,
    AddFixture,
    RemoveFixture,
    RemoveFixtures,
    UpdateFixturePosition,
    UpdateFixtureRotation,
    UpdateFixtureSize,
    UpdateFixtureProperties,
    ToggleFixtureLock,
    NudgeSelection,
    RotateSelection,
    StartDrag,
    UpdateDrag,
    EndDrag,
    StartMarquee,
    UpdateMarquee,
    EndMarquee,
    AddZone,
    RemoveZone,
    RenameZone,
    UpdateZone,
    ResizeZone,
    StartZoneDrag,
    UpdateZoneDrag,
    EndZoneDrag,
    StartZoneResize,
    UpdateZoneResize,
    EndZoneResize,
    StartWallDraw,
    UpdateWallDraw,
    EndWallDraw,
    CancelWallDraw,
    StartWallLengthDrag,
    UpdateWallLengthDrag,
    EndWallLengthDrag,
    AddAnnotation,
    UpdateAnnotation,
    RemoveAnnotation,
    StartAnnotationDrag,
    UpdateAnnotationDrag,
    EndAnnotationDrag,
    PanViewport,
    ZoomViewport,
    SetViewport,
    SetSnapIncrement,
    SetTool,
    BeginPlacement,
    RotatePlacement,
    CancelPlacement,
    AddMeasurePoint,
    ClearMeasure,
    Undo,
    Redo,
    LoadDesign,
    CancelInteraction,
    Count,
};

static_assert(static_cast<std::size_t>(ActionKind::Count) == std::variant_size_v<Action>,
    "ActionKind must mirror the Action alternatives");

inline ActionKind kindOf(const Action& a) {
    return static_cast<ActionKind>(a.index());
}

// SCREAMING_CASE name used in logs and observer events ("START_DRAG").
const char* actionName(ActionKind kind);

} // namespace editor::action
