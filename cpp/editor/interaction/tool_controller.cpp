#include "editor/interaction/tool_controller.h"
#include "editor/editor.h"
#include "editor/core/logging.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace act = editor::action;
namespace vp = editor::viewport;

ToolController::ToolController(DesignEditor& editor, ToolConfig config)
    : editor_(editor)
    , config_(std::move(config)) {}

// ==============================================================================
// Conversion helpers
// ==============================================================================

std::optional<PointFt> ToolController::toFeet(double x, double y) const {
    const vp::ViewboxSize viewbox = vp::viewboxForShell(editor_.design().shell);
    return vp::deviceToFeet(surface_, viewbox, editor_.viewport(), x, y);
}

std::optional<double> ToolController::feetPerPixel() const {
    const double ratio = surface_.pixelRatio > 0.0 && std::isfinite(surface_.pixelRatio) ? surface_.pixelRatio : 1.0;
    const auto a = toFeet(0.0, 0.0);
    const auto b = toFeet(ratio, 0.0);
    if (!a || !b) return std::nullopt;
    return std::abs(b->x - a->x);
}

PickResult ToolController::pickAt(const PointFt& point) const {
    const double ftPerPx = feetPerPixel().value_or(1.0 / vp::kBaseScalePxPerFt);
    PickOptions options;
    options.toleranceFt = config_.pickTolerancePx * ftPerPx;
    options.zoneHandleSizeFt = config_.zoneHandleSizePx * ftPerPx;
    options.rotateHandleOffsetFt = config_.rotateHandleOffsetPx * ftPerPx;
    options.rotateHandleRadiusFt = config_.rotateHandleRadiusPx * ftPerPx;
    options.wallGripRadiusFt = config_.wallGripRadiusPx * ftPerPx;
    options.annotationRadiusFt = config_.annotationHitRadiusPx * ftPerPx;
    options.zoneEditMode = config_.zoneEditMode;
    return pickSystem_.pick(editor_, point, options);
}

bool ToolController::needsThreshold(GestureKind kind) const {
    return kind == GestureKind::FixtureDrag
        || kind == GestureKind::ZoneDrag
        || kind == GestureKind::ZoneResize
        || kind == GestureKind::AnnotationDrag;
}

bool ToolController::passedThreshold(const PointerInput& input) const {
    const double ratio = surface_.pixelRatio > 0.0 && std::isfinite(surface_.pixelRatio) ? surface_.pixelRatio : 1.0;
    const double distance = std::hypot(input.x - gesture_.startX, input.y - gesture_.startY) / ratio;
    const double threshold = gesture_.type == PointerType::Touch
        ? config_.dragThresholdTouchPx
        : config_.dragThresholdMousePx;
    return distance > threshold;
}

// ==============================================================================
// Gesture bookkeeping
// ==============================================================================

void ToolController::beginGesture(GestureKind kind, const PointerInput& input, const PointFt& ft) {
    gesture_ = Gesture{};
    gesture_.kind = kind;
    gesture_.pointerId = input.pointerId;
    gesture_.type = input.type;
    gesture_.startX = input.x;
    gesture_.startY = input.y;
    gesture_.startFt = ft;
    gesture_.thresholdPassed = !needsThreshold(kind);
    if (capturePort_) capturePort_->capture(input.pointerId);
}

void ToolController::releaseCapture() {
    if (gesture_.kind != GestureKind::None && capturePort_) {
        capturePort_->release(gesture_.pointerId);
    }
    gesture_ = Gesture{};
}

bool ToolController::beginPan(const PointerInput& input) {
    const vp::ViewboxSize viewbox = vp::viewboxForShell(editor_.design().shell);
    const auto vb = vp::deviceToViewbox(surface_, viewbox, input.x, input.y);
    if (!vb) return false;
    beginGesture(GestureKind::Pan, input, lastPointerFt_.value_or(PointFt{}));
    gesture_.lastViewbox = *vb;
    return false;
}

bool ToolController::commitPlacement(const PointFt& ft) {
    const auto& placement = editor_.pendingPlacement();
    if (!placement) return false;
    act::AddFixture add;
    add.catalogKey = placement->catalogKey;
    add.positionFt = editor::geometry::snapPoint(ft, editor_.snapIncrement());
    add.rotationDeg = placement->rotationDeg;
    bool changed = editor_.dispatch(add);
    changed |= editor_.dispatch(act::CancelPlacement{});
    return changed;
}

// ==============================================================================
// Pointer down
// ==============================================================================

bool ToolController::handleSelectDown(const PointerInput& input, const PointFt& ft) {
    if (editor_.pendingPlacement()) {
        return commitPlacement(ft);
    }

    const PickResult hit = pickAt(ft);
    const bool shift = (input.modifiers & kShiftMask) != 0;
    bool changed = false;

    switch (hit.target) {
        case PickTarget::RotateHandle: {
            const Fixture* fixture = editor_.findFixture(hit.id);
            if (!fixture) return false;
            return editor_.dispatch(act::UpdateFixtureRotation{hit.id, static_cast<double>(fixture->rotationDeg + 90)});
        }
        case PickTarget::WallGrip:
            changed = editor_.dispatch(act::StartWallLengthDrag{hit.id, hit.wallEnd, ft});
            if (editor_.transientKind() == TransientKind::WallLengthDrag) {
                beginGesture(GestureKind::WallLengthDrag, input, ft);
            }
            return changed;
        case PickTarget::AnnotationLabel:
        case PickTarget::AnnotationAnchor: {
            const AnnotationTarget target = hit.target == PickTarget::AnnotationLabel
                ? AnnotationTarget::Label
                : AnnotationTarget::Anchor;
            changed = editor_.dispatch(act::SelectAnnotation{hit.id});
            changed |= editor_.dispatch(act::StartAnnotationDrag{hit.id, target, ft});
            if (editor_.transientKind() == TransientKind::AnnotationDrag) {
                beginGesture(GestureKind::AnnotationDrag, input, ft);
            }
            return changed;
        }
        case PickTarget::ZoneHandle:
            changed = editor_.dispatch(act::SelectZone{hit.id});
            changed |= editor_.dispatch(act::StartZoneResize{hit.id, hit.handle, ft});
            if (editor_.transientKind() == TransientKind::ZoneResize) {
                beginGesture(GestureKind::ZoneResize, input, ft);
            }
            return changed;
        case PickTarget::ZoneBody:
            changed = editor_.dispatch(act::SelectZone{hit.id});
            changed |= editor_.dispatch(act::StartZoneDrag{hit.id, ft});
            if (editor_.transientKind() == TransientKind::ZoneDrag) {
                beginGesture(GestureKind::ZoneDrag, input, ft);
            }
            return changed;
        case PickTarget::FixtureBody: {
            changed = editor_.dispatch(act::SelectFixture{hit.id, shift});
            const Fixture* fixture = editor_.findFixture(hit.id);
            if (fixture && !fixture->locked) {
                changed |= editor_.dispatch(act::StartDrag{hit.id, ft});
                if (editor_.transientKind() == TransientKind::FixtureDrag) {
                    beginGesture(GestureKind::FixtureDrag, input, ft);
                }
            }
            return changed;
        }
        case PickTarget::None:
            break;
    }

    if ((input.modifiers & (kAltMask | kCtrlMask | kMetaMask)) != 0) {
        return beginPan(input);
    }
    changed = editor_.dispatch(act::StartMarquee{ft, shift});
    if (editor_.transientKind() == TransientKind::Marquee) {
        beginGesture(GestureKind::Marquee, input, ft);
    }
    return changed;
}

bool ToolController::handleWallDown(const PointerInput& input, const PointFt& ft) {
    // Second click of a mouse/pen stroke.
    if (editor_.transientKind() == TransientKind::WallDraw) {
        bool changed = editor_.dispatch(act::EndWallDraw{ft});
        changed |= editor_.dispatch(act::SetTool{ToolKind::Select});
        return changed;
    }
    const bool changed = editor_.dispatch(act::StartWallDraw{ft});
    if (editor_.transientKind() == TransientKind::WallDraw) {
        beginGesture(GestureKind::WallDraw, input, ft);
    }
    return changed;
}

bool ToolController::pointerDown(const PointerInput& input) {
    if (hasCapture()) {
        EDITOR_LOG_DEBUG("pointer %d ignored; pointer %d owns the gesture", input.pointerId, gesture_.pointerId);
        return false;
    }

    const auto ft = toFeet(input.x, input.y);
    if (!ft) return false;
    lastPointerFt_ = ft;

    const ToolKind tool = editor_.activeTool();
    if (input.button == 1 || tool == ToolKind::Pan) {
        return beginPan(input);
    }

    switch (tool) {
        case ToolKind::Select:
            return handleSelectDown(input, *ft);
        case ToolKind::Wall:
            return handleWallDown(input, *ft);
        case ToolKind::Measure:
            return editor_.dispatch(act::AddMeasurePoint{*ft});
        case ToolKind::Annotate: {
            const PointFt anchor = editor::geometry::snapPoint(*ft, editor_.snapIncrement());
            act::AddAnnotation add;
            add.anchorFt = anchor;
            add.labelFt = PointFt{
                anchor.x + config_.annotationLabelOffsetFt.x,
                std::max(0.0, anchor.y + config_.annotationLabelOffsetFt.y)};
            add.text = config_.annotationText;
            bool changed = editor_.dispatch(add);
            changed |= editor_.dispatch(act::SetTool{ToolKind::Select});
            return changed;
        }
        case ToolKind::Pan:
            break;
    }
    return false;
}

// ==============================================================================
// Pointer move / up / cancel
// ==============================================================================

bool ToolController::pointerMove(const PointerInput& input) {
    if (hasCapture() && input.pointerId != gesture_.pointerId) return false;

    if (gesture_.kind == GestureKind::Pan) {
        const vp::ViewboxSize viewbox = vp::viewboxForShell(editor_.design().shell);
        const auto vb = vp::deviceToViewbox(surface_, viewbox, input.x, input.y);
        if (!vb) return false;
        act::PanViewport pan;
        pan.dx = vb->x - gesture_.lastViewbox.x;
        pan.dy = vb->y - gesture_.lastViewbox.y;
        gesture_.lastViewbox = *vb;
        return editor_.dispatch(pan);
    }

    const auto ft = toFeet(input.x, input.y);
    if (!ft) return false;
    lastPointerFt_ = ft;

    if (!hasCapture()) {
        // Mouse/pen wall stroke between the two clicks.
        if (editor_.transientKind() == TransientKind::WallDraw) {
            return editor_.dispatch(act::UpdateWallDraw{*ft});
        }
        return false;
    }

    if (!gesture_.thresholdPassed) {
        if (!passedThreshold(input)) return false;
        gesture_.thresholdPassed = true;
    }

    switch (gesture_.kind) {
        case GestureKind::FixtureDrag:
            return editor_.dispatch(act::UpdateDrag{*ft, (input.modifiers & kAltMask) != 0});
        case GestureKind::ZoneDrag:
            return editor_.dispatch(act::UpdateZoneDrag{*ft});
        case GestureKind::ZoneResize:
            return editor_.dispatch(act::UpdateZoneResize{*ft});
        case GestureKind::Marquee:
            return editor_.dispatch(act::UpdateMarquee{*ft});
        case GestureKind::WallDraw:
            return editor_.dispatch(act::UpdateWallDraw{*ft});
        case GestureKind::WallLengthDrag:
            return editor_.dispatch(act::UpdateWallLengthDrag{*ft});
        case GestureKind::AnnotationDrag:
            return editor_.dispatch(act::UpdateAnnotationDrag{*ft});
        case GestureKind::Pan:
        case GestureKind::None:
            break;
    }
    return false;
}

bool ToolController::finishGesture(const PointFt& ft) {
    const GestureKind kind = gesture_.kind;
    const PointerType type = gesture_.type;
    const PointFt startFt = gesture_.startFt;
    const bool moved = gesture_.thresholdPassed;
    releaseCapture();

    switch (kind) {
        case GestureKind::FixtureDrag:
            return editor_.dispatch(act::EndDrag{});
        case GestureKind::ZoneDrag:
            return editor_.dispatch(act::EndZoneDrag{});
        case GestureKind::ZoneResize:
            return editor_.dispatch(act::EndZoneResize{});
        case GestureKind::Marquee: {
            bool changed = false;
            if (moved) changed |= editor_.dispatch(act::UpdateMarquee{ft});
            changed |= editor_.dispatch(act::EndMarquee{});
            return changed;
        }
        case GestureKind::WallDraw: {
            // Mouse and pen strokes end on the second click.
            if (type != PointerType::Touch) return false;
            const double length = std::hypot(ft.x - startFt.x, ft.y - startFt.y);
            if (length >= config_.wallTouchMinLengthFt) {
                bool changed = editor_.dispatch(act::EndWallDraw{ft});
                changed |= editor_.dispatch(act::SetTool{ToolKind::Select});
                return changed;
            }
            return editor_.dispatch(act::CancelWallDraw{});
        }
        case GestureKind::WallLengthDrag:
            return editor_.dispatch(act::EndWallLengthDrag{});
        case GestureKind::AnnotationDrag:
            return editor_.dispatch(act::EndAnnotationDrag{});
        case GestureKind::Pan:
        case GestureKind::None:
            break;
    }
    return false;
}

bool ToolController::pointerUp(const PointerInput& input) {
    if (!hasCapture() || input.pointerId != gesture_.pointerId) return false;

    const auto ft = toFeet(input.x, input.y);
    if (ft) lastPointerFt_ = ft;
    return finishGesture(ft ? *ft : lastPointerFt_.value_or(gesture_.startFt));
}

bool ToolController::pointerCancel(std::int32_t pointerId) {
    if (!hasCapture() || pointerId != gesture_.pointerId) return false;
    return finishGesture(lastPointerFt_.value_or(gesture_.startFt));
}

// ==============================================================================
// Wheel / pinch
// ==============================================================================

bool ToolController::wheel(double x, double y, double deltaY) {
    const vp::ViewboxSize viewbox = vp::viewboxForShell(editor_.design().shell);
    const auto center = vp::deviceToViewbox(surface_, viewbox, x, y);
    if (!center) return false;
    act::ZoomViewport zoom;
    zoom.deltaScale = -deltaY * config_.wheelZoomFactor;
    zoom.hasCenter = true;
    zoom.centerX = center->x;
    zoom.centerY = center->y;
    return editor_.dispatch(zoom);
}

bool ToolController::pinch(double ratio, double centerX, double centerY) {
    if (!std::isfinite(ratio) || ratio <= 0.0) return false;
    const vp::ViewboxSize viewbox = vp::viewboxForShell(editor_.design().shell);
    const auto center = vp::deviceToViewbox(surface_, viewbox, centerX, centerY);
    if (!center) return false;
    act::ZoomViewport zoom;
    zoom.deltaScale = editor_.viewport().scale * (ratio - 1.0);
    zoom.hasCenter = true;
    zoom.centerX = center->x;
    zoom.centerY = center->y;
    return editor_.dispatch(zoom);
}

// ==============================================================================
// Tools / cancellation
// ==============================================================================

bool ToolController::setTool(ToolKind tool) {
    releaseCapture();
    return editor_.dispatch(act::SetTool{tool});
}

bool ToolController::cancelGesture() {
    const bool hadGesture = hasCapture();
    releaseCapture();
    if (!editor_.isInteractionActive()) return hadGesture;
    return editor_.dispatch(act::CancelInteraction{}) || hadGesture;
}

const char* pointerTypeName(PointerType type) {
    switch (type) {
        case PointerType::Mouse: return "mouse";
        case PointerType::Touch: return "touch";
        case PointerType::Pen: return "pen";
    }
    return "unknown";
}
