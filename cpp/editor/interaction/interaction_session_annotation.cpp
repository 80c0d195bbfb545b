#include "editor/interaction/interaction_session.h"
#include "editor/editor.h"
#include "editor/geometry/geometry.h"

namespace {
constexpr std::uint32_t kAnnotationsMask = static_cast<std::uint32_t>(DesignEditor::ChangeMask::Annotations);
} // namespace

EditorError InteractionSession::beginAnnotationDrag(std::uint32_t annotationId, AnnotationTarget target, const PointFt& pointer) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Annotation* annotation = editor_.findAnnotation(annotationId);
    if (!annotation) return EditorError::UnknownEntity;

    AnnotationDragState drag{};
    drag.annotationId = annotationId;
    drag.target = target;
    drag.pointerOriginFt = pointer;
    drag.startFt = target == AnnotationTarget::Anchor ? annotation->anchorFt : annotation->labelFt;
    return beginGesture(drag, "annotation-drag", true);
}

EditorError InteractionSession::updateAnnotationDrag(const PointFt& pointer) {
    const auto* drag = std::get_if<AnnotationDragState>(&transient_);
    if (!drag) return EditorError::NoActiveInteraction;
    Annotation* annotation = editor_.findAnnotationMutable(drag->annotationId);
    if (!annotation) {
        cancel();
        return EditorError::UnknownEntity;
    }

    const PointFt next = editor::geometry::snapPoint(
        PointFt{
            drag->startFt.x + (pointer.x - drag->pointerOriginFt.x),
            drag->startFt.y + (pointer.y - drag->pointerOriginFt.y),
        },
        editor_.snapIncrement());
    PointFt& field = drag->target == AnnotationTarget::Anchor ? annotation->anchorFt : annotation->labelFt;
    if (field == next) return EditorError::Ok;
    field = next;
    editor_.recordDocChanged(kAnnotationsMask);
    return EditorError::Ok;
}

EditorError InteractionSession::commitAnnotationDrag() {
    if (!std::holds_alternative<AnnotationDragState>(transient_)) return EditorError::NoActiveInteraction;
    finishGesture(kAnnotationsMask);
    return EditorError::Ok;
}
