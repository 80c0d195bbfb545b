#include <gtest/gtest.h>
#include "editor/viewport/coordinate_pipeline.h"

#include <vector>

using namespace editor::viewport;

namespace {

const Shell kShell{20.0, 8.0, 8.0};

// Surface whose CSS size matches the 20x8 shell viewbox exactly.
SurfaceMetrics exactSurface(double pixelRatio = 1.0) {
    return SurfaceMetrics{0.0, 0.0, 800.0, 416.0, pixelRatio};
}

} // namespace

TEST(CoordinatePipelineTest, ViewboxAddsPaddingAroundShell) {
    const ViewboxSize vb = viewboxForShell(kShell);
    EXPECT_DOUBLE_EQ(vb.width, 800.0);
    EXPECT_DOUBLE_EQ(vb.height, 416.0);
}

TEST(CoordinatePipelineTest, IdentityViewMapsPaddingCornerToOrigin) {
    const ViewboxSize vb = viewboxForShell(kShell);
    const Viewport view{};

    const auto origin = deviceToFeet(exactSurface(), vb, view, 80.0, 80.0);
    ASSERT_TRUE(origin.has_value());
    EXPECT_DOUBLE_EQ(origin->x, 0.0);
    EXPECT_DOUBLE_EQ(origin->y, 0.0);

    const auto center = deviceToFeet(exactSurface(), vb, view, 400.0, 208.0);
    ASSERT_TRUE(center.has_value());
    EXPECT_DOUBLE_EQ(center->x, 10.0);
    EXPECT_DOUBLE_EQ(center->y, 4.0);
}

TEST(CoordinatePipelineTest, SurfaceOffsetIsSubtracted) {
    const ViewboxSize vb = viewboxForShell(kShell);
    const SurfaceMetrics surface{30.0, 12.0, 800.0, 416.0, 1.0};

    const auto p = deviceToViewbox(surface, vb, 110.0, 92.0);
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->x, 80.0);
    EXPECT_DOUBLE_EQ(p->y, 80.0);
}

TEST(CoordinatePipelineTest, WideSurfaceIsLetterboxed) {
    const ViewboxSize vb = viewboxForShell(kShell);
    // 1000 wide, 416 tall: content renders 800x416 centered, 100px bars.
    const SurfaceMetrics surface{0.0, 0.0, 1000.0, 416.0, 1.0};

    const auto p = deviceToFeet(surface, vb, Viewport{}, 180.0, 80.0);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, 0.0, 1e-9);
    EXPECT_NEAR(p->y, 0.0, 1e-9);
}

TEST(CoordinatePipelineTest, TallSurfaceIsLetterboxedAndScaled) {
    const ViewboxSize vb = viewboxForShell(kShell);
    // Half-size content (400x208) centered vertically in a 400x408 box.
    const SurfaceMetrics surface{0.0, 0.0, 400.0, 408.0, 1.0};

    const auto p = deviceToViewbox(surface, vb, 200.0, 100.0 + 104.0);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, 400.0, 1e-9);
    EXPECT_NEAR(p->y, 208.0, 1e-9);
}

TEST(CoordinatePipelineTest, DevicePixelRatioIsDividedOut) {
    const ViewboxSize vb = viewboxForShell(kShell);
    const auto p = deviceToFeet(exactSurface(2.0), vb, Viewport{}, 160.0, 160.0);
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->x, 0.0);
    EXPECT_DOUBLE_EQ(p->y, 0.0);
}

TEST(CoordinatePipelineTest, PanAndZoomAreInverted) {
    const ViewboxSize vb = viewboxForShell(kShell);
    const Viewport view{2.0, -80.0, -80.0};

    // Viewbox (80, 80) -> world (80, 80) -> feet (0, 0).
    const auto p = deviceToFeet(exactSurface(), vb, view, 80.0, 80.0);
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->x, 0.0);
    EXPECT_DOUBLE_EQ(p->y, 0.0);

    const auto q = deviceToFeet(exactSurface(), vb, view, 144.0, 112.0);
    ASSERT_TRUE(q.has_value());
    EXPECT_DOUBLE_EQ(q->x, 1.0);
    EXPECT_DOUBLE_EQ(q->y, 0.5);
}

TEST(CoordinatePipelineTest, UnmeasuredSurfaceYieldsNothing) {
    const ViewboxSize vb = viewboxForShell(kShell);
    const SurfaceMetrics collapsed{0.0, 0.0, 0.0, 416.0, 1.0};
    EXPECT_FALSE(deviceToFeet(collapsed, vb, Viewport{}, 10.0, 10.0).has_value());
    EXPECT_FALSE(feetToDevice(collapsed, vb, Viewport{}, PointFt{1.0, 1.0}).has_value());
}

TEST(CoordinatePipelineTest, RoundTripAcrossViews) {
    const ViewboxSize vb = viewboxForShell(kShell);
    const std::vector<Viewport> views = {
        Viewport{0.25, 0.0, 0.0},
        Viewport{1.0, 13.5, -40.0},
        Viewport{2.5, -300.0, 120.0},
        Viewport{4.0, -1200.0, -600.0},
    };
    const std::vector<SurfaceMetrics> surfaces = {
        exactSurface(),
        SurfaceMetrics{15.0, 40.0, 1200.0, 416.0, 2.0},
        SurfaceMetrics{0.0, 0.0, 500.0, 900.0, 1.5},
    };
    const std::vector<PointFt> points = {{0.0, 0.0}, {3.25, 7.5}, {19.9, 0.1}, {-2.0, 11.0}};

    for (const auto& surface : surfaces) {
        for (const auto& view : views) {
            for (const auto& p : points) {
                const auto device = feetToDevice(surface, vb, view, p);
                ASSERT_TRUE(device.has_value());
                const auto back = deviceToFeet(surface, vb, view, device->x, device->y);
                ASSERT_TRUE(back.has_value());
                EXPECT_NEAR(back->x, p.x, 1e-9);
                EXPECT_NEAR(back->y, p.y, 1e-9);
            }
        }
    }
}

TEST(CoordinatePipelineTest, ZoomKeepsCenterFixed) {
    const Viewport view{1.0, 0.0, 0.0};
    const Point center{100.0, 50.0};
    const Viewport zoomed = zoomViewport(view, 1.0, &center, nullptr);

    EXPECT_DOUBLE_EQ(zoomed.scale, 2.0);
    EXPECT_DOUBLE_EQ(zoomed.offsetX, -100.0);
    EXPECT_DOUBLE_EQ(zoomed.offsetY, -50.0);

    const Point before = viewboxToWorld(view, center.x, center.y);
    const Point after = viewboxToWorld(zoomed, center.x, center.y);
    EXPECT_DOUBLE_EQ(before.x, after.x);
    EXPECT_DOUBLE_EQ(before.y, after.y);
}

TEST(CoordinatePipelineTest, ZoomIsClamped) {
    const Viewport high = zoomViewport(Viewport{3.9, 0.0, 0.0}, 1.0, nullptr, nullptr);
    EXPECT_DOUBLE_EQ(high.scale, kMaxZoom);

    const Viewport low = zoomViewport(Viewport{0.5, 0.0, 0.0}, -1.0, nullptr, nullptr);
    EXPECT_DOUBLE_EQ(low.scale, kMinZoom);
}

TEST(CoordinatePipelineTest, PanRespectsBounds) {
    const ViewportBounds bounds{-100.0, 100.0, -50.0, 50.0};
    const Viewport panned = panViewport(Viewport{}, 250.0, -80.0, &bounds);
    EXPECT_DOUBLE_EQ(panned.offsetX, 100.0);
    EXPECT_DOUBLE_EQ(panned.offsetY, -50.0);

    const Viewport unbounded = panViewport(Viewport{}, 250.0, -80.0, nullptr);
    EXPECT_DOUBLE_EQ(unbounded.offsetX, 250.0);
    EXPECT_DOUBLE_EQ(unbounded.offsetY, -80.0);
}
