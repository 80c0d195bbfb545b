#include <gtest/gtest.h>
#include "editor/interaction/action_log.h"
#include "tests/editor_test_common.h"

using namespace editor_test;

namespace {

bool sameDigest(const DesignEditor& a, const DesignEditor& b) {
    const auto da = a.getDocumentDigest();
    const auto db = b.getDocumentDigest();
    return da.lo == db.lo && da.hi == db.hi;
}

void runSession(DesignEditor& editor) {
    const std::uint32_t sink = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    addFixtureAt(editor, kCabinetKey, 12.0, 2.0, 90);
    editor.dispatch(act::StartDrag{sink, PointFt{5.0, 4.0}});
    editor.dispatch(act::UpdateDrag{PointFt{7.1, 5.2}});
    editor.dispatch(act::EndDrag{});
    editor.dispatch(act::AddZone{});
    editor.dispatch(act::StartWallDraw{PointFt{1.0, 1.0}});
    editor.dispatch(act::EndWallDraw{PointFt{1.0, 6.0}});
    editor.dispatch(act::AddAnnotation{PointFt{3.0, 3.0}, PointFt{5.0, 1.0}, "Check"});
    editor.dispatch(act::Undo{});
    editor.dispatch(act::NudgeSelection{0.25, 0.0});
}

} // namespace

TEST_F(EditorTest, ActionLogIsOffByDefault) {
    EXPECT_FALSE(editor.actionLog().isEnabled());
    addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    EXPECT_EQ(editor.actionLog().size(), 0u);
}

TEST_F(EditorTest, ActionLogRecordsEveryDispatch) {
    editor.actionLog().setEnabled(true);
    addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    editor.dispatch(act::RemoveFixture{999}); // rejected, still recorded
    editor.dispatch(act::PanViewport{10.0, 0.0});

    const auto& entries = editor.actionLog().entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(editor::action::kindOf(entries[0]), editor::action::ActionKind::AddFixture);
    EXPECT_EQ(editor::action::kindOf(entries[1]), editor::action::ActionKind::RemoveFixture);
    EXPECT_EQ(editor::action::kindOf(entries[2]), editor::action::ActionKind::PanViewport);
}

TEST_F(EditorTest, ReplayReproducesDocument) {
    editor.actionLog().setEnabled(true);
    runSession(editor);

    DesignEditor replica{catalog, Design{}};
    ASSERT_TRUE(editor.actionLog().replay(replica));

    EXPECT_TRUE(sameDigest(editor, replica));
    EXPECT_EQ(replica.design(), editor.design());
    EXPECT_EQ(replica.selectedIds(), editor.selectedIds());
    EXPECT_EQ(replica.historySize(), editor.historySize());
    EXPECT_EQ(replica.futureSize(), editor.futureSize());
}

TEST_F(EditorTest, ReplayStartsFromStateAtEnable) {
    addFixtureAt(editor, kSinkKey, 3.0, 3.0);
    editor.actionLog().setEnabled(true);
    EXPECT_EQ(editor.actionLog().initialDesign().fixtures.size(), 1u);

    addFixtureAt(editor, kSinkKey, 9.0, 3.0);

    DesignEditor replica{catalog};
    ASSERT_TRUE(editor.actionLog().replay(replica));
    EXPECT_EQ(replica.design().fixtures.size(), 2u);
    EXPECT_TRUE(sameDigest(editor, replica));
    // Only the logged action is undoable on the replica.
    EXPECT_EQ(replica.historySize(), 1u);
}

TEST_F(EditorTest, ReplayOntoItselfIsStable) {
    editor.actionLog().setEnabled(true);
    runSession(editor);
    const auto before = editor.getDocumentDigest();
    const std::size_t logged = editor.actionLog().size();

    ASSERT_TRUE(editor.actionLog().replay(editor));
    const auto after = editor.getDocumentDigest();
    EXPECT_EQ(before.lo, after.lo);
    EXPECT_EQ(before.hi, after.hi);
    // Replayed dispatches are not logged again.
    EXPECT_EQ(editor.actionLog().size(), logged);
}

TEST_F(EditorTest, OverflowedLogRefusesReplay) {
    editor.actionLog().setEnabled(true, 2);
    addFixtureAt(editor, kSinkKey, 3.0, 3.0);
    addFixtureAt(editor, kSinkKey, 6.0, 3.0);
    EXPECT_FALSE(editor.actionLog().isOverflowed());
    addFixtureAt(editor, kSinkKey, 9.0, 3.0);
    EXPECT_TRUE(editor.actionLog().isOverflowed());
    EXPECT_EQ(editor.actionLog().size(), 2u);

    DesignEditor replica{catalog};
    EXPECT_FALSE(editor.actionLog().replay(replica));
    EXPECT_TRUE(replica.design().fixtures.empty());

    editor.actionLog().clear();
    EXPECT_FALSE(editor.actionLog().isOverflowed());
    EXPECT_EQ(editor.actionLog().size(), 0u);
}

TEST_F(EditorTest, ReplayRefusedWhileTargetMidGesture) {
    editor.actionLog().setEnabled(true);
    addFixtureAt(editor, kSinkKey, 5.0, 4.0);

    DesignEditor replica{catalog, makeShellDesign()};
    const std::uint32_t id = addFixtureAt(replica, kSinkKey, 2.0, 2.0);
    replica.dispatch(act::StartDrag{id, PointFt{2.0, 2.0}});

    EXPECT_FALSE(editor.actionLog().replay(replica));
    EXPECT_EQ(replica.transientKind(), TransientKind::FixtureDrag);
    EXPECT_EQ(replica.design().fixtures.size(), 1u);
}

TEST_F(EditorTest, DisablingDropsEntries) {
    editor.actionLog().setEnabled(true);
    addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    editor.actionLog().setEnabled(false);
    EXPECT_EQ(editor.actionLog().size(), 0u);
    addFixtureAt(editor, kSinkKey, 9.0, 4.0);
    EXPECT_EQ(editor.actionLog().size(), 0u);
}
