#pragma once

#include "editor/core/types.h"
#include "editor/core/editor_observer.h"
#include "editor/catalog/catalog.h"
#include "editor/command/action_dispatch.h"
#include "editor/command/actions.h"
#include "editor/geometry/geometry.h"
#include "editor/interaction/interaction_types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct EditorCore;
class DesignEditor;
class ActionLog;
class HistoryManager;
class SelectionManager;
class InteractionSession;

struct EditorConfig {
    std::size_t historyLimit = 50;
    double defaultSnapIncrement = 0.25;
    double alignThresholdFt = editor::geometry::kAlignThresholdFt;
    double minWallLengthFt = 0.5;
    double minZoneSizeFt = 1.0;
    double minWallLengthAfterDragFt = 1.0;
};

struct PendingPlacement {
    std::string catalogKey;
    std::int32_t rotationDeg = 0;
};

// Read-only copy of everything a renderer needs to paint the editor.
struct EditorState {
    Design design;
    std::vector<std::uint32_t> selectedIds;
    std::uint32_t primarySelectedId = kNoId;
    std::uint32_t selectedZoneId = kNoId;
    std::uint32_t selectedAnnotationId = kNoId;
    Viewport viewport{};
    double snapIncrement = 0.25;
    std::size_t historySize = 0;
    std::size_t futureSize = 0;
    TransientInteraction transient{};
    ToolKind tool = ToolKind::Select;
    std::optional<PendingPlacement> pendingPlacement;
    std::vector<PointFt> measurePoints;
    std::uint32_t generation = 0;
};

class DesignEditor {
    friend class InteractionSession;
    friend class ActionLog;
    friend class DesignEditorTestAccessor;
public:
    enum class EventType : std::uint16_t {
        Overflow = 1,
        DocChanged = 2,
        SelectionChanged = 3,
        HistoryChanged = 4,
        ViewportChanged = 5,
        InteractionChanged = 6,
        ToolChanged = 7,
    };

    enum class ChangeMask : std::uint32_t {
        Fixtures = 1 << 0,
        Zones = 1 << 1,
        Annotations = 1 << 2,
        Shell = 1 << 3,
    };

    struct EditorEvent {
        EventType type;
        std::uint32_t generation;
        std::uint32_t mask;
    };

    struct EventBufferMeta {
        std::uint32_t generation;
        std::uint32_t count;
        bool overflowed;
    };

    struct DocumentDigest {
        std::uint32_t lo;
        std::uint32_t hi;
    };

    explicit DesignEditor(const CatalogLookup& catalog, EditorConfig config = EditorConfig{});
    DesignEditor(const CatalogLookup& catalog, const Design& initial, EditorConfig config = EditorConfig{});
    ~DesignEditor();

    DesignEditor(const DesignEditor&) = delete;
    DesignEditor& operator=(const DesignEditor&) = delete;

    // Sole mutation surface. Never throws; returns true when any state changed.
    // A rejected action leaves the state untouched and records getLastError().
    // Committing edits are rejected with InteractionBusy while a transient is
    // active; removals and lock toggles cancel it first.
    bool dispatch(const editor::action::Action& action);

    // ==============================================================================
    // State Query
    // ==============================================================================
    const Design& design() const noexcept;
    const std::vector<std::uint32_t>& selectedIds() const noexcept;
    std::uint32_t primarySelectedId() const noexcept;
    std::uint32_t selectedZoneId() const noexcept;
    std::uint32_t selectedAnnotationId() const noexcept;
    const Viewport& viewport() const noexcept;
    double snapIncrement() const noexcept;
    ToolKind activeTool() const noexcept;
    const std::optional<PendingPlacement>& pendingPlacement() const noexcept;
    const std::vector<PointFt>& measurePoints() const noexcept;
    std::optional<double> measureDistanceFt() const;
    const TransientInteraction& transient() const noexcept;
    TransientKind transientKind() const noexcept;
    bool isInteractionActive() const noexcept;
    std::size_t historySize() const noexcept;
    std::size_t futureSize() const noexcept;
    bool canUndo() const noexcept;
    bool canRedo() const noexcept;
    std::uint32_t getGeneration() const noexcept;
    // Changes whenever the undo stacks change (commit, undo, redo, load).
    std::uint32_t historyGeneration() const noexcept;
    EditorState snapshot() const;

    const CatalogLookup& catalog() const noexcept { return catalog_; }
    const EditorConfig& config() const noexcept { return config_; }

    const Fixture* findFixture(std::uint32_t id) const;
    const Zone* findZone(std::uint32_t id) const;
    const Annotation* findAnnotation(std::uint32_t id) const;
    const CatalogItem* catalogItemFor(const Fixture& fixture) const;
    std::optional<RectFt> fixtureRect(std::uint32_t id) const;

    // ==============================================================================
    // Overlay Queries (renderer-facing, computed on demand)
    // ==============================================================================
    std::vector<editor::geometry::FixtureRect> fixtureRects() const;
    std::optional<RectFt> selectionBounds() const;
    std::vector<editor::geometry::AlignmentGuide> alignmentGuides() const;
    std::vector<editor::geometry::CollisionHit> collisions() const;
    std::optional<RectFt> dragPreviewRect() const;
    std::optional<RectFt> marqueeRect() const;
    // Start/end of the wall being drawn, when a current point exists.
    std::optional<std::pair<PointFt, PointFt>> wallDrawPreview() const;

    // ==============================================================================
    // Errors, events and diagnostics
    // ==============================================================================
    EditorError getLastError() const noexcept;
    void clearError() noexcept;
    void reportError(EditorError error);

    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    const std::vector<EditorEvent>& polledEvents() const noexcept;
    void ackResync(std::uint32_t resyncGeneration);

    void setObserver(EditorObserver* observer) noexcept { observer_ = observer; }
    EditorObserver* observer() const noexcept { return observer_; }
    void notifyObserver(EditorEventKind kind, const std::string& message, const EventFields& data = EventFields{}) const;

    DocumentDigest getDocumentDigest() const noexcept;

    ActionLog& actionLog() noexcept;
    const ActionLog& actionLog() const noexcept;

private:
    // Document operations (impl/editor_document.cpp)
    EditorError addFixture(const editor::action::AddFixture& a);
    EditorError removeFixtures(const std::vector<std::uint32_t>& ids);
    EditorError updateFixturePosition(std::uint32_t id, double xFt, double yFt);
    EditorError updateFixtureRotation(std::uint32_t id, double rotationDeg);
    EditorError updateFixtureSize(const editor::action::UpdateFixtureSize& a);
    EditorError updateFixtureProperties(std::uint32_t id, const PropertyMap& properties);
    EditorError toggleFixtureLock(std::uint32_t id);
    EditorError nudgeSelection(double dxFt, double dyFt);
    EditorError rotateSelection();
    EditorError addZone(const editor::action::AddZone& a);
    EditorError removeZone(std::uint32_t id);
    EditorError renameZone(std::uint32_t id, const std::string& name);
    EditorError updateZone(const editor::action::UpdateZone& a);
    EditorError resizeZone(std::uint32_t id, double newLengthFt);
    EditorError addAnnotation(const editor::action::AddAnnotation& a);
    EditorError updateAnnotation(const editor::action::UpdateAnnotation& a);
    EditorError removeAnnotation(std::uint32_t id);
    EditorError undo();
    EditorError redo();
    EditorError loadDesign(const Design& design);

    // Selection operations (impl/editor_selection.cpp)
    EditorError selectFixture(std::uint32_t id, bool append);
    EditorError selectFixtures(const std::vector<std::uint32_t>& ids);
    EditorError toggleFixtureSelection(std::uint32_t id);
    EditorError clearSelection();
    EditorError selectZone(std::uint32_t id);
    EditorError selectAnnotation(std::uint32_t id);
    EditorError cycleSelection(bool reverse);

    // View and tool operations (editor.cpp)
    EditorError panViewport(const editor::action::PanViewport& a);
    EditorError zoomViewport(const editor::action::ZoomViewport& a);
    EditorError setViewport(const Viewport& viewport);
    EditorError setSnapIncrement(double increment);
    EditorError setTool(ToolKind tool);
    EditorError beginPlacement(const std::string& catalogKey, std::int32_t rotationDeg);
    EditorError rotatePlacement();
    EditorError cancelPlacement();
    EditorError addMeasurePoint(const PointFt& point);
    EditorError clearMeasure();

    // Commits `before` -> current design as one undo step.
    bool commitDesignChange(const Design& before, const char* label);
    Fixture* findFixtureMutable(std::uint32_t id);
    Zone* findZoneMutable(std::uint32_t id);
    Annotation* findAnnotationMutable(std::uint32_t id);
    std::uint32_t allocateId();
    void resetIdAllocator();

    Design& mutableDesign() noexcept;
    SelectionManager& selection() noexcept;
    const SelectionManager& selection() const noexcept;
    HistoryManager& history() noexcept;
    InteractionSession& session() noexcept;
    const InteractionSession& session() const noexcept;

    // Event system (impl/editor_event.cpp)
    void clearEventState();
    void recordDocChanged(std::uint32_t mask);
    void recordSelectionChanged();
    void recordHistoryChanged();
    void recordViewportChanged();
    void recordInteractionChanged();
    void recordToolChanged();
    bool hasPendingChanges() const noexcept;
    void flushPendingEvents();
    bool pushEvent(const EditorEvent& ev);

    friend EditorError editor::dispatchAction(DesignEditor* self, const editor::action::Action& action);

    const CatalogLookup& catalog_;
    EditorConfig config_;
    std::unique_ptr<EditorCore> core_;
    EditorObserver* observer_ = nullptr;
};
