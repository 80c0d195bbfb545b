#include <gtest/gtest.h>
#include "editor/interaction/pick_system.h"
#include "tests/editor_test_common.h"

#include <string>

using namespace editor_test;

namespace {

class PickSystemTest : public EditorTest {
protected:
    PickSystem picker;
    PickOptions options;

    PickResult pick(double x, double y) const {
        return picker.pick(editor, PointFt{x, y}, options);
    }

    std::uint32_t drawWall(PointFt from, PointFt to) {
        editor.dispatch(act::StartWallDraw{from});
        editor.dispatch(act::EndWallDraw{to});
        return editor.primarySelectedId();
    }
};

} // namespace

TEST_F(PickSystemTest, EmptyDesignPicksNothing) {
    const PickResult hit = pick(5.0, 4.0);
    EXPECT_EQ(hit.target, PickTarget::None);
    EXPECT_EQ(hit.id, kNoId);
}

TEST_F(PickSystemTest, FixtureBodyWithTolerance) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);

    PickResult hit = pick(5.0, 4.0);
    EXPECT_EQ(hit.target, PickTarget::FixtureBody);
    EXPECT_EQ(hit.id, id);
    EXPECT_DOUBLE_EQ(hit.distance, 0.0);

    // Rect spans x 4..6; 0.1 ft outside is within the default slack.
    hit = pick(6.1, 4.0);
    EXPECT_EQ(hit.target, PickTarget::FixtureBody);
    EXPECT_NEAR(hit.distance, 0.1, 1e-9);

    EXPECT_EQ(pick(6.3, 4.0).target, PickTarget::None);
}

TEST_F(PickSystemTest, LaterFixtureWinsOverlap) {
    addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const std::uint32_t top = addFixtureAt(editor, kSinkKey, 6.0, 4.0);
    const PickResult hit = pick(5.5, 4.0);
    EXPECT_EQ(hit.target, PickTarget::FixtureBody);
    EXPECT_EQ(hit.id, top);
}

TEST_F(PickSystemTest, RotateHandleAbovePrimaryFixture) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const PointFt handle = PickSystem::rotateHandleCenter(*editor.fixtureRect(id), options.rotateHandleOffsetFt);
    EXPECT_DOUBLE_EQ(handle.x, 5.0);
    EXPECT_NEAR(handle.y, 2.4, 1e-9);

    PickResult hit = pick(handle.x, handle.y);
    EXPECT_EQ(hit.target, PickTarget::RotateHandle);
    EXPECT_EQ(hit.id, id);

    editor.dispatch(act::ClearSelection{});
    EXPECT_EQ(pick(handle.x, handle.y).target, PickTarget::None);

    editor.dispatch(act::SelectFixture{id});
    editor.dispatch(act::ToggleFixtureLock{id});
    EXPECT_EQ(pick(handle.x, handle.y).target, PickTarget::None);
}

TEST_F(PickSystemTest, WallGripsOnSelectedWall) {
    const std::uint32_t wall = drawWall(PointFt{2.0, 4.0}, PointFt{8.0, 4.0});
    ASSERT_NE(wall, kNoId);

    PickResult hit = pick(7.9, 4.0);
    EXPECT_EQ(hit.target, PickTarget::WallGrip);
    EXPECT_EQ(hit.id, wall);
    EXPECT_EQ(hit.wallEnd, WallEnd::End);

    hit = pick(2.1, 4.0);
    EXPECT_EQ(hit.target, PickTarget::WallGrip);
    EXPECT_EQ(hit.wallEnd, WallEnd::Start);

    // No rotate handle for walls.
    EXPECT_EQ(pick(5.0, 4.0 - 0.125 - options.rotateHandleOffsetFt).target, PickTarget::None);

    editor.dispatch(act::ClearSelection{});
    hit = pick(7.9, 4.0);
    EXPECT_EQ(hit.target, PickTarget::FixtureBody);
    EXPECT_EQ(hit.id, wall);
}

TEST_F(PickSystemTest, AnnotationBeatsFixtureBody) {
    addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    editor.dispatch(act::AddAnnotation{PointFt{5.0, 4.0}, PointFt{7.0, 2.0}, "Note"});
    const std::uint32_t note = editor.selectedAnnotationId();

    PickResult hit = pick(5.1, 4.0);
    EXPECT_EQ(hit.target, PickTarget::AnnotationAnchor);
    EXPECT_EQ(hit.id, note);

    hit = pick(7.0, 2.2);
    EXPECT_EQ(hit.target, PickTarget::AnnotationLabel);
    EXPECT_EQ(hit.id, note);
}

TEST_F(PickSystemTest, ZonesNeedEditMode) {
    const std::uint32_t zone = addZoneAt(editor, 0.0, 8.0);
    EXPECT_EQ(pick(4.0, 4.0).target, PickTarget::None);

    options.zoneEditMode = true;
    PickResult hit = pick(4.0, 4.0);
    EXPECT_EQ(hit.target, PickTarget::ZoneBody);
    EXPECT_EQ(hit.id, zone);
}

TEST_F(PickSystemTest, ZoneHandlesOnlyOnSelectedZone) {
    options.zoneEditMode = true;
    const std::uint32_t zone = addZoneAt(editor, 0.0, 8.0);
    ASSERT_EQ(editor.selectedZoneId(), zone);

    PickResult hit = pick(8.0, 4.0);
    EXPECT_EQ(hit.target, PickTarget::ZoneHandle);
    EXPECT_EQ(hit.handle, ZoneHandle::E);

    hit = pick(0.05, 0.05);
    EXPECT_EQ(hit.target, PickTarget::ZoneHandle);
    EXPECT_EQ(hit.handle, ZoneHandle::NW);

    editor.dispatch(act::SelectZone{kNoId});
    hit = pick(8.0, 4.0);
    EXPECT_EQ(hit.target, PickTarget::ZoneBody);
    EXPECT_EQ(hit.id, zone);
}

TEST_F(PickSystemTest, ZoneBodyOutranksFixtureInEditMode) {
    options.zoneEditMode = true;
    addZoneAt(editor, 0.0, 10.0);
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const PickResult hit = pick(5.0, 4.0);
    EXPECT_EQ(hit.target, PickTarget::ZoneBody);
    EXPECT_NE(hit.id, id);
}

TEST(PickSystemGeometryTest, WallEndpointsFollowLongAxis) {
    const auto horizontal = PickSystem::wallEndpoints(RectFt{2.0, 3.875, 6.0, 0.25});
    EXPECT_EQ(horizontal.first, (PointFt{2.0, 4.0}));
    EXPECT_EQ(horizontal.second, (PointFt{8.0, 4.0}));

    const auto vertical = PickSystem::wallEndpoints(RectFt{2.875, 1.0, 0.25, 5.0});
    EXPECT_EQ(vertical.first, (PointFt{3.0, 1.0}));
    EXPECT_EQ(vertical.second, (PointFt{3.0, 6.0}));
}

TEST(PickSystemGeometryTest, ZoneHandlePoints) {
    Zone zone{};
    zone.xFt = 2.0;
    zone.yFt = 1.0;
    zone.lengthFt = 6.0;
    zone.widthFt = 4.0;
    EXPECT_EQ(PickSystem::zoneHandlePoint(zone, ZoneHandle::N), (PointFt{5.0, 1.0}));
    EXPECT_EQ(PickSystem::zoneHandlePoint(zone, ZoneHandle::S), (PointFt{5.0, 5.0}));
    EXPECT_EQ(PickSystem::zoneHandlePoint(zone, ZoneHandle::W), (PointFt{2.0, 3.0}));
    EXPECT_EQ(PickSystem::zoneHandlePoint(zone, ZoneHandle::SE), (PointFt{8.0, 5.0}));
}

TEST(PickSystemGeometryTest, TargetNames) {
    EXPECT_EQ(std::string(pickTargetName(PickTarget::RotateHandle)), "rotate-handle");
    EXPECT_EQ(std::string(pickTargetName(PickTarget::FixtureBody)), "fixture-body");
}
