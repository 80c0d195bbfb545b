#include <gtest/gtest.h>
#include "editor/geometry/geometry.h"
#include "tests/editor_test_common.h"

#include <vector>

using namespace editor::geometry;

namespace {

FixtureRect floorRect(std::uint32_t id, const char* key, RectFt rect) {
    FixtureRect f{};
    f.id = id;
    f.catalogKey = key;
    f.mount = MountLayer::Floor;
    f.rect = rect;
    return f;
}

Fixture fixtureAt(const char* key, double x, double y, std::int32_t rotation = 0) {
    Fixture f{};
    f.id = 1;
    f.catalogKey = key;
    f.xFt = x;
    f.yFt = y;
    f.rotationDeg = rotation;
    return f;
}

} // namespace

TEST(GeometryTest, SnapRoundsToIncrement) {
    EXPECT_DOUBLE_EQ(snap(5.37, 0.25), 5.25);
    EXPECT_DOUBLE_EQ(snap(3.1, 0.25), 3.0);
    EXPECT_DOUBLE_EQ(snap(-1.3, 0.5), -1.5);
    EXPECT_DOUBLE_EQ(snap(7.0, 1.0), 7.0);
}

TEST(GeometryTest, SnapBreaksTiesAwayFromZero) {
    EXPECT_DOUBLE_EQ(snap(0.125, 0.25), 0.25);
    EXPECT_DOUBLE_EQ(snap(-0.125, 0.25), -0.25);
    EXPECT_DOUBLE_EQ(snap(2.5, 1.0), 3.0);
}

TEST(GeometryTest, SnapIsIdempotent) {
    const std::vector<double> values = {-3.7, -0.126, 0.0, 0.1, 1.13, 4.875, 12.49};
    const std::vector<double> increments = {0.125, 0.25, 0.5, 1.0};
    for (double inc : increments) {
        for (double v : values) {
            const double once = snap(v, inc);
            EXPECT_DOUBLE_EQ(snap(once, inc), once) << "value " << v << " increment " << inc;
        }
    }
}

TEST(GeometryTest, SnapIgnoresNonPositiveIncrement) {
    EXPECT_DOUBLE_EQ(snap(1.37, 0.0), 1.37);
    EXPECT_DOUBLE_EQ(snap(1.37, -0.25), 1.37);
}

TEST(GeometryTest, NormalizeRotationFoldsQuarterTurns) {
    EXPECT_EQ(normalizeRotation(0.0).value_or(-1), 0);
    EXPECT_EQ(normalizeRotation(450.0).value_or(-1), 90);
    EXPECT_EQ(normalizeRotation(-90.0).value_or(-1), 270);
    EXPECT_EQ(normalizeRotation(720.0).value_or(-1), 0);
    EXPECT_FALSE(normalizeRotation(45.0).has_value());
}

TEST(GeometryTest, CenterAnchoredRect) {
    const CatalogTable catalog = editor_test::makeCatalog();
    const CatalogItem* sink = catalog.find(editor_test::kSinkKey);
    ASSERT_NE(sink, nullptr);

    const RectFt rect = rectFromFixture(fixtureAt(editor_test::kSinkKey, 5.0, 4.0), *sink);
    EXPECT_EQ(rect, (RectFt{4.0, 3.0, 2.0, 2.0}));
}

TEST(GeometryTest, QuarterRotationSwapsAxes) {
    const CatalogTable catalog = editor_test::makeCatalog();
    const CatalogItem* cabinet = catalog.find(editor_test::kCabinetKey);
    ASSERT_NE(cabinet, nullptr);

    const RectFt upright = rectFromFixture(fixtureAt(editor_test::kCabinetKey, 1.0, 2.0, 0), *cabinet);
    EXPECT_EQ(upright, (RectFt{1.0, 2.0, 2.0, 3.0}));

    const RectFt turned = rectFromFixture(fixtureAt(editor_test::kCabinetKey, 1.0, 2.0, 90), *cabinet);
    EXPECT_EQ(turned, (RectFt{1.0, 2.0, 3.0, 2.0}));

    const RectFt back = rectFromFixture(fixtureAt(editor_test::kCabinetKey, 1.0, 2.0, 270), *cabinet);
    EXPECT_EQ(back, turned);
}

TEST(GeometryTest, SizeOverridesReplaceFootprint) {
    const CatalogTable catalog = editor_test::makeCatalog();
    const CatalogItem* sink = catalog.find(editor_test::kSinkKey);
    ASSERT_NE(sink, nullptr);

    Fixture f = fixtureAt(editor_test::kSinkKey, 5.0, 5.0);
    f.properties[kLengthOverrideProp] = 4.0;
    f.properties[kWidthOverrideProp] = 0.1;
    EXPECT_DOUBLE_EQ(resolvedLengthFt(f, *sink), 4.0);
    EXPECT_DOUBLE_EQ(resolvedWidthFt(f, *sink), kMinOverrideFt);
}

TEST(GeometryTest, ClampKeepsRectInsideShell) {
    const Shell shell{20.0, 8.0, 8.0};
    const PointFt centered = clampAnchorToShell(PointFt{25.0, -3.0}, 2.0, 2.0, shell, FootprintAnchor::Center);
    EXPECT_DOUBLE_EQ(centered.x, 19.0);
    EXPECT_DOUBLE_EQ(centered.y, 1.0);

    const PointFt corner = clampAnchorToShell(PointFt{25.0, 7.0}, 3.0, 2.0, shell, FootprintAnchor::FrontLeft);
    EXPECT_DOUBLE_EQ(corner.x, 17.0);
    EXPECT_DOUBLE_EQ(corner.y, 6.0);
}

TEST(GeometryTest, OverlappingPairReportsIntersection) {
    const std::vector<FixtureRect> rects = {
        floorRect(1, "a", RectFt{0.0, 0.0, 4.0, 4.0}),
        floorRect(2, "b", RectFt{2.0, 2.0, 4.0, 4.0}),
    };
    const auto hits = collisions(rects);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].firstId, 1u);
    EXPECT_EQ(hits[0].secondId, 2u);
    EXPECT_EQ(hits[0].overlap, (RectFt{2.0, 2.0, 2.0, 2.0}));

    const std::vector<FixtureRect> reversed = {rects[1], rects[0]};
    const auto again = collisions(reversed);
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].firstId, 1u);
    EXPECT_EQ(again[0].overlap, hits[0].overlap);
}

TEST(GeometryTest, TouchingEdgesDoNotCollide) {
    const std::vector<FixtureRect> rects = {
        floorRect(1, "a", RectFt{0.0, 0.0, 2.0, 2.0}),
        floorRect(2, "b", RectFt{2.0, 0.0, 2.0, 2.0}),
    };
    EXPECT_TRUE(collisions(rects).empty());
}

TEST(GeometryTest, ExemptPairsAreSkipped) {
    const RectFt same{0.0, 0.0, 3.0, 3.0};
    FixtureRect wallMounted = floorRect(3, "window", same);
    wallMounted.mount = MountLayer::Wall;

    const std::vector<FixtureRect> rects = {
        floorRect(1, "fixture-wall", same),
        floorRect(2, "fixture-wall", same),
        wallMounted,
        floorRect(4, "door-36", same),
    };
    // Wall/wall, door/wall and cross-layer pairs are exempt.
    EXPECT_TRUE(collisions(rects).empty());

    std::vector<FixtureRect> withSink = rects;
    withSink.push_back(floorRect(5, "sink", same));
    const auto hits = collisions(withSink);
    // Sink collides with both walls and the door.
    EXPECT_EQ(hits.size(), 3u);
}

TEST(GeometryTest, AlignmentGuideForNearbyEdge) {
    const std::vector<FixtureRect> rects = {
        floorRect(1, "a", RectFt{0.0, 0.0, 2.0, 2.0}),
        floorRect(2, "b", RectFt{0.1, 5.0, 3.0, 2.0}),
    };
    const auto guides = alignmentGuides(rects, {1});
    ASSERT_EQ(guides.size(), 1u);
    EXPECT_EQ(guides[0].orientation, GuideOrientation::Vertical);
    EXPECT_DOUBLE_EQ(guides[0].positionFt, 0.1);
    EXPECT_EQ(guides[0].targetId, 2u);

    EXPECT_TRUE(alignmentGuides(rects, {1, 2}).empty());
    EXPECT_TRUE(alignmentGuides(rects, {}).empty());
}

TEST(GeometryTest, SelectionBoundsUnion) {
    const std::vector<FixtureRect> rects = {
        floorRect(1, "a", RectFt{1.0, 1.0, 2.0, 2.0}),
        floorRect(2, "b", RectFt{5.0, 4.0, 1.0, 3.0}),
        floorRect(3, "c", RectFt{10.0, 10.0, 1.0, 1.0}),
    };
    const auto bounds = selectionBounds(rects, {1, 2});
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(*bounds, (RectFt{1.0, 1.0, 5.0, 6.0}));

    EXPECT_FALSE(selectionBounds(rects, {}).has_value());
    EXPECT_FALSE(selectionBounds(rects, {99}).has_value());
}

TEST(GeometryTest, RectFromCornersNormalizes) {
    EXPECT_EQ(rectFromCorners(PointFt{10.0, 2.0}, PointFt{4.0, 8.0}), (RectFt{4.0, 2.0, 6.0, 6.0}));
}

TEST(GeometryTest, ShellAndZoneContainment) {
    const Shell shell{20.0, 8.0, 8.0};
    EXPECT_TRUE(isInsideShell(shell, RectFt{0.0, 0.0, 20.0, 8.0}));
    EXPECT_FALSE(isInsideShell(shell, RectFt{19.0, 0.0, 2.0, 2.0}));

    Zone left{};
    left.id = 1;
    left.lengthFt = 10.0;
    left.widthFt = 8.0;
    Zone right = left;
    right.id = 2;
    right.xFt = 10.0;

    EXPECT_TRUE(isInsideZone(left, RectFt{1.0, 1.0, 2.0, 2.0}));
    EXPECT_FALSE(isInsideZone(left, RectFt{9.0, 1.0, 2.0, 2.0}));

    const auto straddling = zonesContainingRect({left, right}, RectFt{9.0, 1.0, 2.0, 2.0});
    EXPECT_EQ(straddling, (std::vector<std::uint32_t>{1, 2}));
    const auto inRight = zonesContainingRect({left, right}, RectFt{12.0, 1.0, 2.0, 2.0});
    EXPECT_EQ(inRight, (std::vector<std::uint32_t>{2}));
}

TEST(GeometryTest, ClearanceFollowsRotation) {
    const CatalogTable catalog = editor_test::makeCatalog();
    const CatalogItem* shower = catalog.find(editor_test::kShowerKey);
    ASSERT_NE(shower, nullptr);

    // 3x3 shower centered at (5, 5): body {3.5, 3.5, 3, 3}, 2 ft clearance in front.
    const auto front = clearanceRect(fixtureAt(editor_test::kShowerKey, 5.0, 5.0, 0), *shower);
    ASSERT_TRUE(front.has_value());
    EXPECT_EQ(*front, (RectFt{3.5, 3.5, 3.0, 5.0}));

    const auto flipped = clearanceRect(fixtureAt(editor_test::kShowerKey, 5.0, 5.0, 180), *shower);
    ASSERT_TRUE(flipped.has_value());
    EXPECT_EQ(*flipped, (RectFt{3.5, 1.5, 3.0, 5.0}));

    const auto turned = clearanceRect(fixtureAt(editor_test::kShowerKey, 5.0, 5.0, 90), *shower);
    ASSERT_TRUE(turned.has_value());
    EXPECT_EQ(*turned, (RectFt{1.5, 3.5, 5.0, 3.0}));

    const CatalogItem* sink = catalog.find(editor_test::kSinkKey);
    ASSERT_NE(sink, nullptr);
    EXPECT_FALSE(clearanceRect(fixtureAt(editor_test::kSinkKey, 5.0, 5.0), *sink).has_value());
}

TEST(GeometryTest, WallLengthResolution) {
    const CatalogItem wallItem = CatalogTable::makeWallItem();
    Fixture wall = fixtureAt(kWallCatalogKey, 5.0, 5.0);
    EXPECT_DOUBLE_EQ(wallLengthFt(wall, &wallItem), kDefaultWallLengthFt);
    EXPECT_DOUBLE_EQ(wallLengthFt(wall, nullptr), kDefaultWallLengthFt);

    wall.properties[kLengthOverrideProp] = 6.5;
    EXPECT_DOUBLE_EQ(wallLengthFt(wall, &wallItem), 6.5);
}
