#include "editor/viewport/coordinate_pipeline.h"

#include <algorithm>
#include <cmath>

namespace editor::viewport {

namespace {
struct Letterbox {
    double renderedWidth;
    double renderedHeight;
    double offsetX;
    double offsetY;
};

bool measurable(const SurfaceMetrics& surface, const ViewboxSize& viewbox) {
    return surface.width > 0.0 && surface.height > 0.0
        && std::isfinite(surface.width) && std::isfinite(surface.height)
        && viewbox.width > 0.0 && viewbox.height > 0.0
        && std::isfinite(viewbox.width) && std::isfinite(viewbox.height);
}

double normalizeRatio(double ratio) {
    return (ratio > 0.0 && std::isfinite(ratio)) ? ratio : 1.0;
}

// Content keeps the viewbox aspect ratio and is centered in the container.
Letterbox computeLetterbox(const SurfaceMetrics& surface, const ViewboxSize& viewbox) {
    const double viewboxAspect = viewbox.width / viewbox.height;
    const double containerAspect = surface.width / surface.height;
    Letterbox box{};
    if (containerAspect > viewboxAspect) {
        box.renderedHeight = surface.height;
        box.renderedWidth = surface.height * viewboxAspect;
        box.offsetX = (surface.width - box.renderedWidth) / 2.0;
        box.offsetY = 0.0;
    } else {
        box.renderedWidth = surface.width;
        box.renderedHeight = surface.width / viewboxAspect;
        box.offsetX = 0.0;
        box.offsetY = (surface.height - box.renderedHeight) / 2.0;
    }
    return box;
}

double clampValue(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}
} // namespace

ViewboxSize viewboxForShell(const Shell& shell) {
    return ViewboxSize{
        shell.lengthFt * kBaseScalePxPerFt + kCanvasPaddingPx * 2.0,
        shell.widthFt * kBaseScalePxPerFt + kCanvasPaddingPx * 2.0,
    };
}

double normalizeScale(double scale) {
    return (scale > 1e-6 && std::isfinite(scale)) ? scale : 1.0;
}

std::optional<Point> deviceToViewbox(const SurfaceMetrics& surface, const ViewboxSize& viewbox, double px, double py) {
    if (!measurable(surface, viewbox)) return std::nullopt;
    if (!std::isfinite(px) || !std::isfinite(py)) return std::nullopt;

    const double ratio = normalizeRatio(surface.pixelRatio);
    const Letterbox box = computeLetterbox(surface, viewbox);
    const double localX = px / ratio - surface.left - box.offsetX;
    const double localY = py / ratio - surface.top - box.offsetY;
    return Point{
        localX * (viewbox.width / box.renderedWidth),
        localY * (viewbox.height / box.renderedHeight),
    };
}

std::optional<Point> viewboxToDevice(const SurfaceMetrics& surface, const ViewboxSize& viewbox, double vx, double vy) {
    if (!measurable(surface, viewbox)) return std::nullopt;

    const double ratio = normalizeRatio(surface.pixelRatio);
    const Letterbox box = computeLetterbox(surface, viewbox);
    const double localX = vx * (box.renderedWidth / viewbox.width);
    const double localY = vy * (box.renderedHeight / viewbox.height);
    return Point{
        (localX + box.offsetX + surface.left) * ratio,
        (localY + box.offsetY + surface.top) * ratio,
    };
}

Point viewboxToWorld(const Viewport& view, double vx, double vy) {
    const double scale = normalizeScale(view.scale);
    return Point{(vx - view.offsetX) / scale, (vy - view.offsetY) / scale};
}

Point worldToViewbox(const Viewport& view, double wx, double wy) {
    const double scale = normalizeScale(view.scale);
    return Point{wx * scale + view.offsetX, wy * scale + view.offsetY};
}

PointFt worldToFeet(double wx, double wy) {
    return PointFt{
        (wx - kCanvasPaddingPx) / kBaseScalePxPerFt,
        (wy - kCanvasPaddingPx) / kBaseScalePxPerFt,
    };
}

Point feetToWorld(const PointFt& p) {
    return Point{
        p.x * kBaseScalePxPerFt + kCanvasPaddingPx,
        p.y * kBaseScalePxPerFt + kCanvasPaddingPx,
    };
}

std::optional<PointFt> deviceToFeet(
    const SurfaceMetrics& surface,
    const ViewboxSize& viewbox,
    const Viewport& view,
    double px,
    double py) {
    const auto vb = deviceToViewbox(surface, viewbox, px, py);
    if (!vb) return std::nullopt;
    const Point world = viewboxToWorld(view, vb->x, vb->y);
    return worldToFeet(world.x, world.y);
}

std::optional<Point> feetToDevice(
    const SurfaceMetrics& surface,
    const ViewboxSize& viewbox,
    const Viewport& view,
    const PointFt& p) {
    const Point world = feetToWorld(p);
    const Point vb = worldToViewbox(view, world.x, world.y);
    return viewboxToDevice(surface, viewbox, vb.x, vb.y);
}

Viewport clampViewport(const Viewport& view, const ViewportBounds* bounds) {
    Viewport out = view;
    out.scale = clampValue(normalizeScale(view.scale), kMinZoom, kMaxZoom);
    if (bounds) {
        out.offsetX = clampValue(out.offsetX, bounds->minOffsetX, bounds->maxOffsetX);
        out.offsetY = clampValue(out.offsetY, bounds->minOffsetY, bounds->maxOffsetY);
    }
    return out;
}

Viewport panViewport(const Viewport& view, double dx, double dy, const ViewportBounds* bounds) {
    if (!std::isfinite(dx) || !std::isfinite(dy)) return view;
    Viewport out = view;
    out.offsetX += dx;
    out.offsetY += dy;
    if (bounds) {
        out.offsetX = clampValue(out.offsetX, bounds->minOffsetX, bounds->maxOffsetX);
        out.offsetY = clampValue(out.offsetY, bounds->minOffsetY, bounds->maxOffsetY);
    }
    return out;
}

Viewport zoomViewport(const Viewport& view, double deltaScale, const Point* center, const ViewportBounds* bounds) {
    if (!std::isfinite(deltaScale)) return view;
    const double current = normalizeScale(view.scale);
    const double next = clampValue(current + deltaScale, kMinZoom, kMaxZoom);

    Viewport out = view;
    out.scale = next;
    if (center) {
        // Keeps the world point under the center fixed.
        const double factor = next / current;
        out.offsetX = center->x - factor * (center->x - view.offsetX);
        out.offsetY = center->y - factor * (center->y - view.offsetY);
    }
    if (bounds) {
        out.offsetX = clampValue(out.offsetX, bounds->minOffsetX, bounds->maxOffsetX);
        out.offsetY = clampValue(out.offsetY, bounds->minOffsetY, bounds->maxOffsetY);
    }
    return out;
}

} // namespace editor::viewport
