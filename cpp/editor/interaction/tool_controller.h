#pragma once

#include "editor/core/types.h"
#include "editor/interaction/interaction_constants.h"
#include "editor/interaction/interaction_types.h"
#include "editor/interaction/pick_system.h"
#include "editor/viewport/coordinate_pipeline.h"

#include <cstdint>
#include <optional>
#include <string>

class DesignEditor;

enum class PointerType : std::uint8_t {
    Mouse = 0,
    Touch = 1,
    Pen = 2,
};

// Raw pointer event. x/y are device pixels relative to the page, as the
// host receives them; button follows the DOM numbering (0 primary, 1 middle).
struct PointerInput {
    std::int32_t pointerId = 0;
    PointerType type = PointerType::Mouse;
    std::int32_t button = 0;
    double x = 0.0;
    double y = 0.0;
    std::uint32_t modifiers = 0;
};

struct ToolConfig {
    double dragThresholdMousePx = interaction_constants::DRAG_THRESHOLD_MOUSE_PX;
    double dragThresholdTouchPx = interaction_constants::DRAG_THRESHOLD_TOUCH_PX;
    double pickTolerancePx = interaction_constants::PICK_TOLERANCE_PX;
    double zoneHandleSizePx = interaction_constants::ZONE_HANDLE_SIZE_PX;
    double rotateHandleOffsetPx = interaction_constants::ROTATE_HANDLE_OFFSET_PX;
    double rotateHandleRadiusPx = interaction_constants::ROTATE_HANDLE_RADIUS_PX;
    double wallGripRadiusPx = interaction_constants::WALL_GRIP_RADIUS_PX;
    double annotationHitRadiusPx = interaction_constants::ANNOTATION_HIT_RADIUS_PX;
    double wheelZoomFactor = interaction_constants::WHEEL_ZOOM_FACTOR;
    PointFt annotationLabelOffsetFt{
        interaction_constants::ANNOTATION_LABEL_OFFSET_X_FT,
        interaction_constants::ANNOTATION_LABEL_OFFSET_Y_FT};
    std::string annotationText = interaction_constants::ANNOTATION_DEFAULT_TEXT;
    double wallTouchMinLengthFt = interaction_constants::WALL_TOUCH_MIN_LENGTH_FT;
    // Zones are only pickable in zone edit mode.
    bool zoneEditMode = false;
};

// Host hook mirroring the DOM setPointerCapture/releasePointerCapture pair.
class PointerCapturePort {
public:
    virtual ~PointerCapturePort() = default;
    virtual void capture(std::int32_t pointerId) = 0;
    virtual void release(std::int32_t pointerId) = 0;
};

/**
 * Translates raw pointer, wheel and pinch input into editor actions.
 *
 * Positions go through the coordinate pipeline on every event, so a viewport
 * change in the middle of a gesture is picked up by the next move. The first
 * pointer that starts a gesture owns it; other pointer ids are ignored until
 * that pointer goes up or is cancelled. All mutations go through
 * DesignEditor::dispatch.
 */
class ToolController {
public:
    explicit ToolController(DesignEditor& editor, ToolConfig config = ToolConfig{});

    void setSurface(const editor::viewport::SurfaceMetrics& surface) noexcept { surface_ = surface; }
    const editor::viewport::SurfaceMetrics& surface() const noexcept { return surface_; }

    void setCapturePort(PointerCapturePort* port) noexcept { capturePort_ = port; }

    ToolConfig& config() noexcept { return config_; }
    const ToolConfig& config() const noexcept { return config_; }

    // Each returns true when the editor state changed.
    bool pointerDown(const PointerInput& input);
    bool pointerMove(const PointerInput& input);
    bool pointerUp(const PointerInput& input);
    // Capture lost: ends the gesture at the last known position.
    bool pointerCancel(std::int32_t pointerId);

    bool wheel(double x, double y, double deltaY);
    // ratio is the pinch scale change since the previous pinch event.
    bool pinch(double ratio, double centerX, double centerY);

    bool setTool(ToolKind tool);
    // Drops the pointer gesture and aborts the editor transient without committing.
    bool cancelGesture();

    bool hasCapture() const noexcept { return gesture_.kind != GestureKind::None; }
    std::int32_t capturedPointerId() const noexcept { return gesture_.pointerId; }
    bool isPanning() const noexcept { return gesture_.kind == GestureKind::Pan; }

    // Last pointer position in feet, if any event could be converted.
    const std::optional<PointFt>& lastPointerFt() const noexcept { return lastPointerFt_; }

    // Feet spanned by one CSS pixel at the current zoom; nullopt when unmeasurable.
    std::optional<double> feetPerPixel() const;
    std::optional<PointFt> toFeet(double x, double y) const;
    PickResult pickAt(const PointFt& point) const;

private:
    enum class GestureKind : std::uint8_t {
        None = 0,
        Pan,
        FixtureDrag,
        ZoneDrag,
        ZoneResize,
        Marquee,
        WallDraw,
        WallLengthDrag,
        AnnotationDrag,
    };

    struct Gesture {
        GestureKind kind = GestureKind::None;
        std::int32_t pointerId = -1;
        PointerType type = PointerType::Mouse;
        double startX = 0.0;
        double startY = 0.0;
        bool thresholdPassed = false;
        editor::viewport::Point lastViewbox{};
        PointFt startFt{};
    };

    bool handleSelectDown(const PointerInput& input, const PointFt& ft);
    bool handleWallDown(const PointerInput& input, const PointFt& ft);
    bool commitPlacement(const PointFt& ft);
    bool beginPan(const PointerInput& input);
    void beginGesture(GestureKind kind, const PointerInput& input, const PointFt& ft);
    bool finishGesture(const PointFt& ft);
    void releaseCapture();

    bool passedThreshold(const PointerInput& input) const;
    bool needsThreshold(GestureKind kind) const;

    DesignEditor& editor_;
    ToolConfig config_;
    editor::viewport::SurfaceMetrics surface_{};
    PointerCapturePort* capturePort_ = nullptr;
    PickSystem pickSystem_;
    Gesture gesture_{};
    std::optional<PointFt> lastPointerFt_;
};

const char* pointerTypeName(PointerType type);
