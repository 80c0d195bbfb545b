#pragma once

#include "editor/core/types.h"
#include "editor/interaction/interaction_types.h"

#include <cstdint>

// Forward declarations
class DesignEditor; // Owner; document and selection access
class HistoryManager; // Undo/Redo

// START/UPDATE/END controllers for every transient interaction. Exactly one
// transient may be active; a second START is ignored and reports
// InteractionBusy. Live updates edit the document in place, and the design
// captured at START is what the single history entry restores.
class InteractionSession {
public:
    InteractionSession(DesignEditor& editor, HistoryManager& historyManager);

    // ==============================================================================
    // State Query
    // ==============================================================================
    bool isInteractionActive() const noexcept { return !std::holds_alternative<std::monostate>(transient_); }
    TransientKind activeKind() const noexcept { return transientKind(transient_); }
    const TransientInteraction& transient() const noexcept { return transient_; }

    // ==============================================================================
    // Fixture drag
    // ==============================================================================
    EditorError beginFixtureDrag(std::uint32_t fixtureId, const PointFt& pointer);
    EditorError updateFixtureDrag(const PointFt& pointer, bool skipSnap);
    EditorError commitFixtureDrag();

    // ==============================================================================
    // Marquee
    // ==============================================================================
    EditorError beginMarquee(const PointFt& origin, bool append);
    EditorError updateMarquee(const PointFt& current);
    EditorError commitMarquee();

    // ==============================================================================
    // Zone drag / resize (interaction_session_zone.cpp)
    // ==============================================================================
    EditorError beginZoneDrag(std::uint32_t zoneId, const PointFt& pointer);
    EditorError updateZoneDrag(const PointFt& pointer);
    EditorError commitZoneDrag();
    EditorError beginZoneResize(std::uint32_t zoneId, ZoneHandle handle, const PointFt& pointer);
    EditorError updateZoneResize(const PointFt& pointer);
    EditorError commitZoneResize();

    // ==============================================================================
    // Walls (interaction_session_wall.cpp)
    // ==============================================================================
    EditorError beginWallDraw(const PointFt& point);
    EditorError updateWallDraw(const PointFt& point);
    EditorError commitWallDraw(const PointFt& point);
    EditorError cancelWallDraw();
    EditorError beginWallLengthDrag(std::uint32_t fixtureId, WallEnd end, const PointFt& pointer);
    EditorError updateWallLengthDrag(const PointFt& pointer);
    EditorError commitWallLengthDrag();

    // ==============================================================================
    // Annotation drag (interaction_session_annotation.cpp)
    // ==============================================================================
    EditorError beginAnnotationDrag(std::uint32_t annotationId, AnnotationTarget target, const PointFt& pointer);
    EditorError updateAnnotationDrag(const PointFt& pointer);
    EditorError commitAnnotationDrag();

    // ==============================================================================
    // Cancellation
    // ==============================================================================
    // Aborts the active transient and restores the design captured at START.
    bool cancel();
    // Drops the transient without touching the document (design reload).
    void reset();

private:
    DesignEditor& editor_;
    HistoryManager& historyManager_;
    TransientInteraction transient_{};

    // Installs `next` if nothing is active and opens the gesture's history entry.
    EditorError beginGesture(TransientInteraction next, const char* label, bool recordsHistory);
    // Closes the transient and commits the gesture as one history step.
    void finishGesture(std::uint32_t docMask);
};
