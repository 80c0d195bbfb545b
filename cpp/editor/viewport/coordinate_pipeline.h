#pragma once

#include "editor/core/types.h"

#include <optional>

namespace editor::viewport {

// Feet-to-pixel base scale of the design space and the padding around the shell.
constexpr double kBaseScalePxPerFt = 32.0;
constexpr double kCanvasPaddingPx = 80.0;

constexpr double kMinZoom = 0.25;
constexpr double kMaxZoom = 4.0;

struct Point {
    double x = 0.0;
    double y = 0.0;
};

// Measured bounding box of the drawing surface in CSS pixels. Raw device
// coordinates are divided by pixelRatio before use.
struct SurfaceMetrics {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;
    double pixelRatio = 1.0;
};

// Logical coordinate space the surface content is authored in.
struct ViewboxSize {
    double width = 0.0;
    double height = 0.0;
};

ViewboxSize viewboxForShell(const Shell& shell);

double normalizeScale(double scale);

// Stage 1. Letterbox-aware; nullopt when the surface cannot be measured.
std::optional<Point> deviceToViewbox(const SurfaceMetrics& surface, const ViewboxSize& viewbox, double px, double py);
std::optional<Point> viewboxToDevice(const SurfaceMetrics& surface, const ViewboxSize& viewbox, double vx, double vy);

// Stage 2. Inverse of the pan/zoom transform.
Point viewboxToWorld(const Viewport& view, double vx, double vy);
Point worldToViewbox(const Viewport& view, double wx, double wy);

// Stage 3.
PointFt worldToFeet(double wx, double wy);
Point feetToWorld(const PointFt& p);

// Composed chains.
std::optional<PointFt> deviceToFeet(
    const SurfaceMetrics& surface,
    const ViewboxSize& viewbox,
    const Viewport& view,
    double px,
    double py);
std::optional<Point> feetToDevice(
    const SurfaceMetrics& surface,
    const ViewboxSize& viewbox,
    const Viewport& view,
    const PointFt& p);

// Viewport operations. None of these are undoable.
Viewport panViewport(const Viewport& view, double dx, double dy, const ViewportBounds* bounds);
Viewport zoomViewport(const Viewport& view, double deltaScale, const Point* center, const ViewportBounds* bounds);
Viewport clampViewport(const Viewport& view, const ViewportBounds* bounds);

} // namespace editor::viewport
