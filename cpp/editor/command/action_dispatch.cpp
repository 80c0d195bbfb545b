#include "editor/command/action_dispatch.h"
#include "editor/editor.h"
#include "editor/interaction/interaction_session.h"

#include <variant>

namespace editor {

EditorError dispatchAction(DesignEditor* self, const action::Action& a) {
    using action::ActionKind;
    InteractionSession& session = self->session();

    switch (action::kindOf(a)) {
        // ---- Selection ------------------------------------------------------
        case ActionKind::SelectFixture: {
            const auto& p = std::get<action::SelectFixture>(a);
            return self->selectFixture(p.id, p.append);
        }
        case ActionKind::SelectFixtures:
            return self->selectFixtures(std::get<action::SelectFixtures>(a).ids);
        case ActionKind::ToggleFixtureSelection:
            return self->toggleFixtureSelection(std::get<action::ToggleFixtureSelection>(a).id);
        case ActionKind::ClearSelection:
            return self->clearSelection();
        case ActionKind::SelectZone:
            return self->selectZone(std::get<action::SelectZone>(a).id);
        case ActionKind::SelectAnnotation:
            return self->selectAnnotation(std::get<action::SelectAnnotation>(a).id);
        case ActionKind::CycleSelection:
            return self->cycleSelection(std::get<action::CycleSelection>(a).reverse);

        // ---- Fixtures -------------------------------------------------------
        case ActionKind::AddFixture:
            return self->addFixture(std::get<action::AddFixture>(a));
        case ActionKind::RemoveFixture:
            return self->removeFixtures({std::get<action::RemoveFixture>(a).id});
        case ActionKind::RemoveFixtures:
            return self->removeFixtures(std::get<action::RemoveFixtures>(a).ids);
        case ActionKind::UpdateFixturePosition: {
            const auto& p = std::get<action::UpdateFixturePosition>(a);
            return self->updateFixturePosition(p.id, p.xFt, p.yFt);
        }
        case ActionKind::UpdateFixtureRotation: {
            const auto& p = std::get<action::UpdateFixtureRotation>(a);
            return self->updateFixtureRotation(p.id, p.rotationDeg);
        }
        case ActionKind::UpdateFixtureSize:
            return self->updateFixtureSize(std::get<action::UpdateFixtureSize>(a));
        case ActionKind::UpdateFixtureProperties: {
            const auto& p = std::get<action::UpdateFixtureProperties>(a);
            return self->updateFixtureProperties(p.id, p.properties);
        }
        case ActionKind::ToggleFixtureLock:
            return self->toggleFixtureLock(std::get<action::ToggleFixtureLock>(a).id);
        case ActionKind::NudgeSelection: {
            const auto& p = std::get<action::NudgeSelection>(a);
            return self->nudgeSelection(p.dxFt, p.dyFt);
        }
        case ActionKind::RotateSelection:
            return self->rotateSelection();

        // ---- Fixture drag / marquee ----------------------------------------
        case ActionKind::StartDrag: {
            const auto& p = std::get<action::StartDrag>(a);
            return session.beginFixtureDrag(p.id, p.pointerFt);
        }
        case ActionKind::UpdateDrag: {
            const auto& p = std::get<action::UpdateDrag>(a);
            return session.updateFixtureDrag(p.pointerFt, p.skipSnap);
        }
        case ActionKind::EndDrag:
            return session.commitFixtureDrag();
        case ActionKind::StartMarquee: {
            const auto& p = std::get<action::StartMarquee>(a);
            return session.beginMarquee(p.originFt, p.append);
        }
        case ActionKind::UpdateMarquee:
            return session.updateMarquee(std::get<action::UpdateMarquee>(a).currentFt);
        case ActionKind::EndMarquee:
            return session.commitMarquee();

        // ---- Zones ----------------------------------------------------------
        case ActionKind::AddZone:
            return self->addZone(std::get<action::AddZone>(a));
        case ActionKind::RemoveZone:
            return self->removeZone(std::get<action::RemoveZone>(a).id);
        case ActionKind::RenameZone: {
            const auto& p = std::get<action::RenameZone>(a);
            return self->renameZone(p.id, p.name);
        }
        case ActionKind::UpdateZone:
            return self->updateZone(std::get<action::UpdateZone>(a));
        case ActionKind::ResizeZone: {
            const auto& p = std::get<action::ResizeZone>(a);
            return self->resizeZone(p.id, p.newLengthFt);
        }
        case ActionKind::StartZoneDrag: {
            const auto& p = std::get<action::StartZoneDrag>(a);
            return session.beginZoneDrag(p.id, p.pointerFt);
        }
        case ActionKind::UpdateZoneDrag:
            return session.updateZoneDrag(std::get<action::UpdateZoneDrag>(a).pointerFt);
        case ActionKind::EndZoneDrag:
            return session.commitZoneDrag();
        case ActionKind::StartZoneResize: {
            const auto& p = std::get<action::StartZoneResize>(a);
            return session.beginZoneResize(p.id, p.handle, p.pointerFt);
        }
        case ActionKind::UpdateZoneResize:
            return session.updateZoneResize(std::get<action::UpdateZoneResize>(a).pointerFt);
        case ActionKind::EndZoneResize:
            return session.commitZoneResize();

        // ---- Walls ----------------------------------------------------------
        case ActionKind::StartWallDraw:
            return session.beginWallDraw(std::get<action::StartWallDraw>(a).pointFt);
        case ActionKind::UpdateWallDraw:
            return session.updateWallDraw(std::get<action::UpdateWallDraw>(a).pointFt);
        case ActionKind::EndWallDraw:
            return session.commitWallDraw(std::get<action::EndWallDraw>(a).pointFt);
        case ActionKind::CancelWallDraw:
            return session.cancelWallDraw();
        case ActionKind::StartWallLengthDrag: {
            const auto& p = std::get<action::StartWallLengthDrag>(a);
            return session.beginWallLengthDrag(p.id, p.end, p.pointerFt);
        }
        case ActionKind::UpdateWallLengthDrag:
            return session.updateWallLengthDrag(std::get<action::UpdateWallLengthDrag>(a).pointerFt);
        case ActionKind::EndWallLengthDrag:
            return session.commitWallLengthDrag();

        // ---- Annotations ----------------------------------------------------
        case ActionKind::AddAnnotation:
            return self->addAnnotation(std::get<action::AddAnnotation>(a));
        case ActionKind::UpdateAnnotation:
            return self->updateAnnotation(std::get<action::UpdateAnnotation>(a));
        case ActionKind::RemoveAnnotation:
            return self->removeAnnotation(std::get<action::RemoveAnnotation>(a).id);
        case ActionKind::StartAnnotationDrag: {
            const auto& p = std::get<action::StartAnnotationDrag>(a);
            return session.beginAnnotationDrag(p.id, p.target, p.pointerFt);
        }
        case ActionKind::UpdateAnnotationDrag:
            return session.updateAnnotationDrag(std::get<action::UpdateAnnotationDrag>(a).pointerFt);
        case ActionKind::EndAnnotationDrag:
            return session.commitAnnotationDrag();

        // ---- Viewport -------------------------------------------------------
        case ActionKind::PanViewport:
            return self->panViewport(std::get<action::PanViewport>(a));
        case ActionKind::ZoomViewport:
            return self->zoomViewport(std::get<action::ZoomViewport>(a));
        case ActionKind::SetViewport:
            return self->setViewport(std::get<action::SetViewport>(a).viewport);
        case ActionKind::SetSnapIncrement:
            return self->setSnapIncrement(std::get<action::SetSnapIncrement>(a).snapIncrement);

        // ---- Tools ----------------------------------------------------------
        case ActionKind::SetTool:
            return self->setTool(std::get<action::SetTool>(a).tool);
        case ActionKind::BeginPlacement: {
            const auto& p = std::get<action::BeginPlacement>(a);
            return self->beginPlacement(p.catalogKey, p.rotationDeg);
        }
        case ActionKind::RotatePlacement:
            return self->rotatePlacement();
        case ActionKind::CancelPlacement:
            return self->cancelPlacement();
        case ActionKind::AddMeasurePoint:
            return self->addMeasurePoint(std::get<action::AddMeasurePoint>(a).pointFt);
        case ActionKind::ClearMeasure:
            return self->clearMeasure();

        // ---- Document -------------------------------------------------------
        case ActionKind::Undo:
            return self->undo();
        case ActionKind::Redo:
            return self->redo();
        case ActionKind::LoadDesign:
            return self->loadDesign(std::get<action::LoadDesign>(a).design);
        case ActionKind::CancelInteraction:
            session.cancel();
            return EditorError::Ok;

        case ActionKind::Count:
            break;
    }
    return EditorError::InvalidArgument;
}

} // namespace editor
