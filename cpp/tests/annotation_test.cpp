#include <gtest/gtest.h>
#include "tests/editor_test_common.h"

using namespace editor_test;

namespace {

std::uint32_t addNote(DesignEditor& editor, PointFt anchor, PointFt label, const char* text = "Note") {
    editor.dispatch(act::AddAnnotation{anchor, label, text});
    return editor.selectedAnnotationId();
}

} // namespace

TEST_F(EditorTest, AddAnnotationSelectsIt) {
    const std::uint32_t fixture = addFixtureAt(editor, kSinkKey, 5.0, 4.0);
    ASSERT_FALSE(editor.selectedIds().empty());

    const std::uint32_t id = addNote(editor, PointFt{2.0, 2.0}, PointFt{4.0, 0.0});
    ASSERT_NE(id, kNoId);
    EXPECT_NE(id, fixture);
    EXPECT_TRUE(editor.selectedIds().empty());

    const Annotation* note = editor.findAnnotation(id);
    ASSERT_NE(note, nullptr);
    EXPECT_EQ(note->text, "Note");
    EXPECT_EQ(note->anchorFt, (PointFt{2.0, 2.0}));
    EXPECT_EQ(note->labelFt, (PointFt{4.0, 0.0}));
}

TEST_F(EditorTest, AnchorDragSnapsAndCommitsOnce) {
    const std::uint32_t id = addNote(editor, PointFt{2.0, 2.0}, PointFt{4.0, 0.0});
    const std::size_t historyBefore = editor.historySize();

    ASSERT_TRUE(editor.dispatch(act::StartAnnotationDrag{id, AnnotationTarget::Anchor, PointFt{2.0, 2.0}}));
    editor.dispatch(act::UpdateAnnotationDrag{PointFt{2.5, 2.2}});
    editor.dispatch(act::UpdateAnnotationDrag{PointFt{3.1, 2.6}});
    ASSERT_TRUE(editor.dispatch(act::EndAnnotationDrag{}));

    const Annotation* note = editor.findAnnotation(id);
    ASSERT_NE(note, nullptr);
    EXPECT_EQ(note->anchorFt, (PointFt{3.0, 2.5}));
    EXPECT_EQ(note->labelFt, (PointFt{4.0, 0.0}));
    EXPECT_EQ(editor.historySize(), historyBefore + 1);
}

TEST_F(EditorTest, LabelDragLeavesAnchor) {
    const std::uint32_t id = addNote(editor, PointFt{2.0, 2.0}, PointFt{4.0, 0.0});
    editor.dispatch(act::StartAnnotationDrag{id, AnnotationTarget::Label, PointFt{4.0, 0.0}});
    editor.dispatch(act::UpdateAnnotationDrag{PointFt{6.0, 1.0}});
    editor.dispatch(act::EndAnnotationDrag{});

    const Annotation* note = editor.findAnnotation(id);
    ASSERT_NE(note, nullptr);
    EXPECT_EQ(note->anchorFt, (PointFt{2.0, 2.0}));
    EXPECT_EQ(note->labelFt, (PointFt{6.0, 1.0}));
}

TEST_F(EditorTest, RemovingDraggedAnnotationCancelsDrag) {
    const std::uint32_t id = addNote(editor, PointFt{2.0, 2.0}, PointFt{4.0, 0.0});
    editor.dispatch(act::StartAnnotationDrag{id, AnnotationTarget::Anchor, PointFt{2.0, 2.0}});
    editor.dispatch(act::UpdateAnnotationDrag{PointFt{5.0, 5.0}});

    ASSERT_TRUE(editor.dispatch(act::RemoveAnnotation{id}));
    EXPECT_EQ(editor.transientKind(), TransientKind::None);
    EXPECT_EQ(editor.findAnnotation(id), nullptr);
    EXPECT_EQ(editor.selectedAnnotationId(), kNoId);

    ASSERT_TRUE(editor.dispatch(act::Undo{}));
    const Annotation* restored = editor.findAnnotation(id);
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->anchorFt, (PointFt{2.0, 2.0}));
}

TEST_F(EditorTest, UpdateAnnotationText) {
    const std::uint32_t id = addNote(editor, PointFt{2.0, 2.0}, PointFt{4.0, 0.0});
    act::UpdateAnnotation update;
    update.id = id;
    update.text = "Check drain slope";
    ASSERT_TRUE(editor.dispatch(update));
    EXPECT_EQ(editor.findAnnotation(id)->text, "Check drain slope");

    // Same text again changes nothing.
    EXPECT_FALSE(editor.dispatch(update));

    update.id = 999;
    EXPECT_FALSE(editor.dispatch(update));
    EXPECT_EQ(editor.getLastError(), EditorError::UnknownEntity);
}

TEST_F(EditorTest, AnnotationDragOnUnknownIdIsRejected) {
    EXPECT_FALSE(editor.dispatch(act::StartAnnotationDrag{77, AnnotationTarget::Label, PointFt{0.0, 0.0}}));
    EXPECT_EQ(editor.getLastError(), EditorError::UnknownEntity);
    EXPECT_EQ(editor.transientKind(), TransientKind::None);
}
