#include <gtest/gtest.h>
#include "tests/editor_test_common.h"

#include <string>

using namespace editor_test;

TEST_F(EditorTest, DragSnapsCommittedPosition) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    ASSERT_NE(id, kNoId);

    ASSERT_TRUE(editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}}));
    EXPECT_EQ(editor.transientKind(), TransientKind::FixtureDrag);
    ASSERT_TRUE(editor.dispatch(act::UpdateDrag{PointFt{5.37, 3.1}}));
    ASSERT_TRUE(editor.dispatch(act::EndDrag{}));

    const Fixture* fixture = editor.findFixture(id);
    ASSERT_NE(fixture, nullptr);
    EXPECT_DOUBLE_EQ(fixture->xFt, 5.25);
    EXPECT_DOUBLE_EQ(fixture->yFt, 3.0);
    EXPECT_EQ(editor.transientKind(), TransientKind::None);
}

TEST_F(EditorTest, DragCanSkipSnap) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{5.37, 3.1}, true});

    const Fixture* fixture = editor.findFixture(id);
    ASSERT_NE(fixture, nullptr);
    EXPECT_DOUBLE_EQ(fixture->xFt, 5.37);
    EXPECT_DOUBLE_EQ(fixture->yFt, 3.1);
}

TEST_F(EditorTest, DragIsClampedToShell) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{105.0, -50.0}});
    editor.dispatch(act::EndDrag{});

    const Fixture* fixture = editor.findFixture(id);
    ASSERT_NE(fixture, nullptr);
    EXPECT_DOUBLE_EQ(fixture->xFt, 19.0);
    EXPECT_DOUBLE_EQ(fixture->yFt, 1.0);
    const auto rect = editor.fixtureRect(id);
    ASSERT_TRUE(rect.has_value());
    EXPECT_TRUE(editor::geometry::isInsideShell(editor.design().shell, *rect));
}

TEST_F(EditorTest, DragPreviewFollowsFixture) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    EXPECT_FALSE(editor.dragPreviewRect().has_value());

    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{7.0, 4.0}});
    const auto preview = editor.dragPreviewRect();
    ASSERT_TRUE(preview.has_value());
    EXPECT_EQ(*preview, (RectFt{6.0, 3.0, 2.0, 2.0}));
}

TEST_F(EditorTest, LockedFixtureCannotBeDragged) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    ASSERT_TRUE(editor.dispatch(act::ToggleFixtureLock{id}));
    ASSERT_TRUE(editor.findFixture(id)->locked);

    EXPECT_FALSE(editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}}));
    EXPECT_EQ(editor.getLastError(), EditorError::EntityLocked);
    EXPECT_EQ(editor.transientKind(), TransientKind::None);
}

TEST_F(EditorTest, UnknownFixtureCannotBeDragged) {
    EXPECT_FALSE(editor.dispatch(act::StartDrag{42, PointFt{0.0, 0.0}}));
    EXPECT_EQ(editor.getLastError(), EditorError::UnknownEntity);
}

TEST_F(EditorTest, SecondGestureIsRejectedWhileDragging) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const std::uint32_t zone = addZoneAt(editor, 0.0, 10.0);
    ASSERT_NE(zone, kNoId);

    ASSERT_TRUE(editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}}));
    const auto* drag = std::get_if<FixtureDragState>(&editor.transient());
    ASSERT_NE(drag, nullptr);
    const FixtureDragState before = *drag;

    EXPECT_FALSE(editor.dispatch(act::StartZoneResize{zone, ZoneHandle::E, PointFt{10.0, 4.0}}));
    EXPECT_EQ(editor.getLastError(), EditorError::InteractionBusy);
    EXPECT_FALSE(editor.dispatch(act::StartMarquee{PointFt{0.0, 0.0}}));
    EXPECT_EQ(editor.getLastError(), EditorError::InteractionBusy);

    const auto* still = std::get_if<FixtureDragState>(&editor.transient());
    ASSERT_NE(still, nullptr);
    EXPECT_TRUE(*still == before);
}

TEST_F(EditorTest, CancelRestoresPreDragDesign) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const Design beforeDrag = editor.design();
    const std::size_t historyBefore = editor.historySize();

    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{9.0, 6.0}});
    ASSERT_NE(editor.design(), beforeDrag);

    ASSERT_TRUE(editor.dispatch(act::CancelInteraction{}));
    EXPECT_EQ(editor.design(), beforeDrag);
    EXPECT_EQ(editor.historySize(), historyBefore);
    EXPECT_EQ(editor.transientKind(), TransientKind::None);
}

TEST_F(EditorTest, RemovingDraggedFixtureCancelsDrag) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const std::size_t historyBefore = editor.historySize();

    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{9.0, 6.0}});
    ASSERT_TRUE(editor.dispatch(act::RemoveFixture{id}));

    EXPECT_EQ(editor.transientKind(), TransientKind::None);
    EXPECT_EQ(editor.findFixture(id), nullptr);
    EXPECT_EQ(editor.historySize(), historyBefore + 1);
    EXPECT_TRUE(editor.selectedIds().empty());

    // Undoing the removal brings the fixture back where it was before the drag.
    ASSERT_TRUE(editor.dispatch(act::Undo{}));
    const Fixture* restored = editor.findFixture(id);
    ASSERT_NE(restored, nullptr);
    EXPECT_DOUBLE_EQ(restored->xFt, 5.0);
    EXPECT_DOUBLE_EQ(restored->yFt, 4.0);
}

TEST_F(EditorTest, EditsAreRejectedWhileDragging) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const std::uint32_t other = addFixtureAt(editor, kCabinetKey, 12.0, 2.0);
    const std::size_t historyBefore = editor.historySize();

    ASSERT_TRUE(editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}}));
    ASSERT_TRUE(editor.dispatch(act::UpdateDrag{PointFt{7.0, 4.0}}));

    EXPECT_FALSE(editor.dispatch(act::UpdateFixtureRotation{id, 90.0}));
    EXPECT_EQ(editor.getLastError(), EditorError::InteractionBusy);
    EXPECT_FALSE(editor.dispatch(act::RotateSelection{}));
    EXPECT_EQ(editor.getLastError(), EditorError::InteractionBusy);
    EXPECT_FALSE(editor.dispatch(act::NudgeSelection{0.25, 0.0}));
    EXPECT_EQ(editor.getLastError(), EditorError::InteractionBusy);
    EXPECT_FALSE(editor.dispatch(act::UpdateFixturePosition{other, 14.0, 2.0}));
    EXPECT_EQ(editor.getLastError(), EditorError::InteractionBusy);
    EXPECT_FALSE(editor.dispatch(act::UpdateFixtureProperties{other, PropertyMap{{"material", std::string("oak")}}}));
    EXPECT_EQ(editor.getLastError(), EditorError::InteractionBusy);
    EXPECT_FALSE(editor.dispatch(act::AddZone{}));
    EXPECT_FALSE(editor.dispatch(act::AddAnnotation{PointFt{2.0, 2.0}, PointFt{4.0, 0.0}, "Note"}));

    EXPECT_EQ(editor.historySize(), historyBefore);
    EXPECT_EQ(editor.transientKind(), TransientKind::FixtureDrag);
    EXPECT_EQ(editor.findFixture(id)->rotationDeg, 0);

    // Cancelling restores the pre-drag design and leaves no stray entry behind.
    ASSERT_TRUE(editor.dispatch(act::CancelInteraction{}));
    EXPECT_DOUBLE_EQ(editor.findFixture(id)->xFt, 5.0);
    EXPECT_EQ(editor.historySize(), historyBefore);

    ASSERT_TRUE(editor.dispatch(act::Undo{}));
    EXPECT_EQ(editor.findFixture(other), nullptr);
    EXPECT_DOUBLE_EQ(editor.findFixture(id)->xFt, 5.0);
    EXPECT_EQ(editor.findFixture(id)->rotationDeg, 0);
}

TEST_F(EditorTest, DragAfterRejectedEditUndoesInOrder) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const std::size_t historyBefore = editor.historySize();

    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{7.0, 4.0}});
    EXPECT_FALSE(editor.dispatch(act::UpdateFixtureRotation{id, 90.0}));
    ASSERT_TRUE(editor.dispatch(act::EndDrag{}));
    EXPECT_EQ(editor.historySize(), historyBefore + 1);

    // Rotating after the drag ends is accepted.
    ASSERT_TRUE(editor.dispatch(act::UpdateFixtureRotation{id, 90.0}));
    EXPECT_EQ(editor.historySize(), historyBefore + 2);

    ASSERT_TRUE(editor.dispatch(act::Undo{}));
    EXPECT_EQ(editor.findFixture(id)->rotationDeg, 0);
    EXPECT_DOUBLE_EQ(editor.findFixture(id)->xFt, 7.0);
    ASSERT_TRUE(editor.dispatch(act::Undo{}));
    EXPECT_DOUBLE_EQ(editor.findFixture(id)->xFt, 5.0);
    ASSERT_TRUE(editor.dispatch(act::Redo{}));
    EXPECT_DOUBLE_EQ(editor.findFixture(id)->xFt, 7.0);
    EXPECT_EQ(editor.findFixture(id)->rotationDeg, 0);
}

TEST_F(EditorTest, RemovingAnotherFixtureCancelsDrag) {
    const std::uint32_t dragged = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const std::uint32_t other = addFixtureAt(editor, kSinkKey, 12.0, 4.0);
    const std::size_t historyBefore = editor.historySize();

    editor.dispatch(act::StartDrag{dragged, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{8.0, 4.0}});
    ASSERT_TRUE(editor.dispatch(act::RemoveFixture{other}));

    EXPECT_EQ(editor.transientKind(), TransientKind::None);
    EXPECT_DOUBLE_EQ(editor.findFixture(dragged)->xFt, 5.0);
    EXPECT_EQ(editor.findFixture(other), nullptr);
    EXPECT_EQ(editor.historySize(), historyBefore + 1);

    ASSERT_TRUE(editor.dispatch(act::Undo{}));
    EXPECT_NE(editor.findFixture(other), nullptr);
    EXPECT_DOUBLE_EQ(editor.findFixture(dragged)->xFt, 5.0);
}

TEST_F(EditorTest, LockingDuringDragCancelsIt) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const std::size_t historyBefore = editor.historySize();

    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{8.0, 4.0}});
    ASSERT_TRUE(editor.dispatch(act::ToggleFixtureLock{id}));

    EXPECT_EQ(editor.transientKind(), TransientKind::None);
    EXPECT_TRUE(editor.findFixture(id)->locked);
    EXPECT_DOUBLE_EQ(editor.findFixture(id)->xFt, 5.0);
    EXPECT_EQ(editor.historySize(), historyBefore + 1);
}

TEST_F(EditorTest, UpdateWithoutDragIsRejected) {
    EXPECT_FALSE(editor.dispatch(act::UpdateDrag{PointFt{1.0, 1.0}}));
    EXPECT_EQ(editor.getLastError(), EditorError::NoActiveInteraction);
    EXPECT_FALSE(editor.dispatch(act::EndDrag{}));
    EXPECT_EQ(editor.getLastError(), EditorError::NoActiveInteraction);
}

TEST_F(EditorTest, TapWithoutMovementRecordsNothing) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    const std::size_t historyBefore = editor.historySize();

    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::EndDrag{});
    EXPECT_EQ(editor.historySize(), historyBefore);
}

TEST_F(EditorTest, DragMovesOnlyTheGrabbedFixture) {
    const std::uint32_t first = addFixtureAt(editor, kSinkKey, 3.0, 4.0);
    const std::uint32_t second = addFixtureAt(editor, kSinkKey, 12.0, 4.0);
    editor.dispatch(act::SelectFixtures{{first, second}});

    editor.dispatch(act::StartDrag{first, PointFt{3.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{5.0, 4.0}});
    editor.dispatch(act::EndDrag{});

    EXPECT_DOUBLE_EQ(editor.findFixture(first)->xFt, 5.0);
    EXPECT_DOUBLE_EQ(editor.findFixture(second)->xFt, 12.0);
}

TEST_F(EditorTest, UndoDuringDragCancelsIt) {
    const std::uint32_t id = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    editor.dispatch(act::StartDrag{id, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{9.0, 4.0}});

    ASSERT_TRUE(editor.dispatch(act::Undo{}));
    EXPECT_EQ(editor.transientKind(), TransientKind::None);
    // The undo step removed the add; nothing of the drag survives.
    EXPECT_EQ(editor.findFixture(id), nullptr);
    EXPECT_EQ(editor.futureSize(), 1u);
}
