// editor.cpp holds the DesignEditor constructor, the dispatch entry point and
// the view/tool operations; document, selection, event and overlay methods
// live in editor/impl/.
#include "editor/editor.h"
#include "editor/internal/editor_core.h"
#include "editor/core/logging.h"
#include "editor/viewport/coordinate_pipeline.h"

#include <algorithm>
#include <cmath>

EditorCore::EditorCore(DesignEditor& editor, const EditorConfig& config)
    : historyManager_(config.historyLimit),
      interactionSession_(editor, historyManager_),
      actionLog_(editor),
      snapIncrement(config.defaultSnapIncrement > 0.0 && std::isfinite(config.defaultSnapIncrement)
          ? config.defaultSnapIncrement
          : 0.25) {
    eventQueue_.resize(kMaxEvents);
    eventBuffer_.reserve(kMaxEvents + 1);
}

DesignEditor::DesignEditor(const CatalogLookup& catalog, EditorConfig config)
    : catalog_(catalog),
      config_(config),
      core_(std::make_unique<EditorCore>(*this, config_)) {}

DesignEditor::DesignEditor(const CatalogLookup& catalog, const Design& initial, EditorConfig config)
    : DesignEditor(catalog, config) {
    core_->design = initial;
    resetIdAllocator();
}

DesignEditor::~DesignEditor() = default;

bool DesignEditor::dispatch(const editor::action::Action& action) {
    core_->actionLog_.record(action);

    const std::uint32_t historyGeneration = core_->historyManager_.getGeneration();
    const EditorError error = editor::dispatchAction(this, action);
    core_->lastError = error;

    const bool changed = hasPendingChanges();
    if (changed) {
        core_->generation++;
        flushPendingEvents();
    }

    const editor::action::ActionKind kind = editor::action::kindOf(action);
    const char* name = editor::action::actionName(kind);
    if (error != EditorError::Ok) {
        EDITOR_LOG_DEBUG("%s rejected: %s", name, editorErrorName(error));
        notifyObserver(EditorEventKind::ActionRejected, name,
            EventFields{{"error", static_cast<double>(error)}});
        return changed;
    }
    if (!changed) return false;

    notifyObserver(EditorEventKind::ActionApplied, name,
        EventFields{{"generation", static_cast<double>(core_->generation)}});
    if (core_->historyManager_.getGeneration() != historyGeneration) {
        const EventFields fields{
            {"past", static_cast<double>(core_->historyManager_.pastSize())},
            {"future", static_cast<double>(core_->historyManager_.futureSize())},
        };
        switch (kind) {
            case editor::action::ActionKind::Undo:
                notifyObserver(EditorEventKind::Undo, name, fields);
                break;
            case editor::action::ActionKind::Redo:
                notifyObserver(EditorEventKind::Redo, name, fields);
                break;
            case editor::action::ActionKind::LoadDesign:
                notifyObserver(EditorEventKind::DesignLoaded, name, fields);
                break;
            default:
                notifyObserver(EditorEventKind::HistoryCommitted, name, fields);
                break;
        }
    }
    return true;
}

// ==============================================================================
// State Query
// ==============================================================================

const Design& DesignEditor::design() const noexcept { return core_->design; }
const std::vector<std::uint32_t>& DesignEditor::selectedIds() const noexcept { return core_->selectionManager_.getOrdered(); }
std::uint32_t DesignEditor::primarySelectedId() const noexcept { return core_->selectionManager_.getPrimary(); }
std::uint32_t DesignEditor::selectedZoneId() const noexcept { return core_->selectionManager_.getZone(); }
std::uint32_t DesignEditor::selectedAnnotationId() const noexcept { return core_->selectionManager_.getAnnotation(); }
const Viewport& DesignEditor::viewport() const noexcept { return core_->viewport; }
double DesignEditor::snapIncrement() const noexcept { return core_->snapIncrement; }
ToolKind DesignEditor::activeTool() const noexcept { return core_->tool; }
const std::optional<PendingPlacement>& DesignEditor::pendingPlacement() const noexcept { return core_->pendingPlacement; }
const std::vector<PointFt>& DesignEditor::measurePoints() const noexcept { return core_->measurePoints; }
const TransientInteraction& DesignEditor::transient() const noexcept { return core_->interactionSession_.transient(); }
TransientKind DesignEditor::transientKind() const noexcept { return core_->interactionSession_.activeKind(); }
bool DesignEditor::isInteractionActive() const noexcept { return core_->interactionSession_.isInteractionActive(); }
std::size_t DesignEditor::historySize() const noexcept { return core_->historyManager_.pastSize(); }
std::size_t DesignEditor::futureSize() const noexcept { return core_->historyManager_.futureSize(); }
bool DesignEditor::canUndo() const noexcept { return core_->historyManager_.canUndo(); }
bool DesignEditor::canRedo() const noexcept { return core_->historyManager_.canRedo(); }
std::uint32_t DesignEditor::getGeneration() const noexcept { return core_->generation; }
std::uint32_t DesignEditor::historyGeneration() const noexcept { return core_->historyManager_.getGeneration(); }

std::optional<double> DesignEditor::measureDistanceFt() const {
    const auto& points = core_->measurePoints;
    if (points.size() < 2) return std::nullopt;
    return std::hypot(points[1].x - points[0].x, points[1].y - points[0].y);
}

EditorState DesignEditor::snapshot() const {
    EditorState state;
    state.design = core_->design;
    state.selectedIds = selectedIds();
    state.primarySelectedId = primarySelectedId();
    state.selectedZoneId = selectedZoneId();
    state.selectedAnnotationId = selectedAnnotationId();
    state.viewport = core_->viewport;
    state.snapIncrement = core_->snapIncrement;
    state.historySize = historySize();
    state.futureSize = futureSize();
    state.transient = transient();
    state.tool = core_->tool;
    state.pendingPlacement = core_->pendingPlacement;
    state.measurePoints = core_->measurePoints;
    state.generation = core_->generation;
    return state;
}

const Fixture* DesignEditor::findFixture(std::uint32_t id) const {
    for (const auto& fixture : core_->design.fixtures) {
        if (fixture.id == id) return &fixture;
    }
    return nullptr;
}

const Zone* DesignEditor::findZone(std::uint32_t id) const {
    for (const auto& zone : core_->design.zones) {
        if (zone.id == id) return &zone;
    }
    return nullptr;
}

const Annotation* DesignEditor::findAnnotation(std::uint32_t id) const {
    for (const auto& annotation : core_->design.annotations) {
        if (annotation.id == id) return &annotation;
    }
    return nullptr;
}

Fixture* DesignEditor::findFixtureMutable(std::uint32_t id) {
    return const_cast<Fixture*>(static_cast<const DesignEditor*>(this)->findFixture(id));
}

Zone* DesignEditor::findZoneMutable(std::uint32_t id) {
    return const_cast<Zone*>(static_cast<const DesignEditor*>(this)->findZone(id));
}

Annotation* DesignEditor::findAnnotationMutable(std::uint32_t id) {
    return const_cast<Annotation*>(static_cast<const DesignEditor*>(this)->findAnnotation(id));
}

const CatalogItem* DesignEditor::catalogItemFor(const Fixture& fixture) const {
    return catalog_.find(fixture.catalogKey);
}

std::optional<RectFt> DesignEditor::fixtureRect(std::uint32_t id) const {
    const Fixture* fixture = findFixture(id);
    if (!fixture) return std::nullopt;
    const CatalogItem* item = catalogItemFor(*fixture);
    if (!item) return std::nullopt;
    return editor::geometry::rectFromFixture(*fixture, *item);
}

// ==============================================================================
// Internal accessors
// ==============================================================================

Design& DesignEditor::mutableDesign() noexcept { return core_->design; }
SelectionManager& DesignEditor::selection() noexcept { return core_->selectionManager_; }
const SelectionManager& DesignEditor::selection() const noexcept { return core_->selectionManager_; }
HistoryManager& DesignEditor::history() noexcept { return core_->historyManager_; }
InteractionSession& DesignEditor::session() noexcept { return core_->interactionSession_; }
const InteractionSession& DesignEditor::session() const noexcept { return core_->interactionSession_; }
ActionLog& DesignEditor::actionLog() noexcept { return core_->actionLog_; }
const ActionLog& DesignEditor::actionLog() const noexcept { return core_->actionLog_; }

bool DesignEditor::commitDesignChange(const Design& before, const char* label) {
    if (!core_->historyManager_.commit(before, core_->design, label)) return false;
    recordHistoryChanged();
    return true;
}

std::uint32_t DesignEditor::allocateId() {
    return core_->nextEntityId_++;
}

void DesignEditor::resetIdAllocator() {
    std::uint32_t maxId = 0;
    for (const auto& zone : core_->design.zones) maxId = std::max(maxId, zone.id);
    for (const auto& fixture : core_->design.fixtures) maxId = std::max(maxId, fixture.id);
    for (const auto& annotation : core_->design.annotations) maxId = std::max(maxId, annotation.id);
    core_->nextEntityId_ = maxId + 1;
}

// ==============================================================================
// Errors and observer
// ==============================================================================

EditorError DesignEditor::getLastError() const noexcept { return core_->lastError; }
void DesignEditor::clearError() noexcept { core_->lastError = EditorError::Ok; }

void DesignEditor::reportError(EditorError error) {
    core_->lastError = error;
    if (error != EditorError::Ok) {
        EDITOR_LOG_WARN("%s", editorErrorName(error));
    }
}

void DesignEditor::notifyObserver(EditorEventKind kind, const std::string& message, const EventFields& data) const {
    if (!observer_) return;
    observer_->onEvent(kind, message, data);
}

// ==============================================================================
// Viewport
// ==============================================================================

namespace {
const ViewportBounds* boundsOrNull(const std::optional<ViewportBounds>& bounds) {
    return bounds ? &*bounds : nullptr;
}
} // namespace

EditorError DesignEditor::panViewport(const editor::action::PanViewport& a) {
    if (!std::isfinite(a.dx) || !std::isfinite(a.dy)) return EditorError::InvalidArgument;
    const Viewport next = editor::viewport::panViewport(core_->viewport, a.dx, a.dy, boundsOrNull(a.bounds));
    return setViewport(next);
}

EditorError DesignEditor::zoomViewport(const editor::action::ZoomViewport& a) {
    if (!std::isfinite(a.deltaScale)) return EditorError::InvalidArgument;
    const editor::viewport::Point center{a.centerX, a.centerY};
    const Viewport next = editor::viewport::zoomViewport(
        core_->viewport, a.deltaScale, a.hasCenter ? &center : nullptr, boundsOrNull(a.bounds));
    return setViewport(next);
}

EditorError DesignEditor::setViewport(const Viewport& viewport) {
    if (!std::isfinite(viewport.offsetX) || !std::isfinite(viewport.offsetY)) return EditorError::InvalidArgument;
    const Viewport next = editor::viewport::clampViewport(viewport, nullptr);
    if (next == core_->viewport) return EditorError::Ok;
    core_->viewport = next;
    recordViewportChanged();
    return EditorError::Ok;
}

EditorError DesignEditor::setSnapIncrement(double increment) {
    if (!(increment > 0.0) || !std::isfinite(increment)) return EditorError::InvalidArgument;
    if (increment == core_->snapIncrement) return EditorError::Ok;
    core_->snapIncrement = increment;
    recordViewportChanged();
    return EditorError::Ok;
}

// ==============================================================================
// Tools
// ==============================================================================

EditorError DesignEditor::setTool(ToolKind tool) {
    session().cancel();
    if (core_->pendingPlacement) {
        core_->pendingPlacement.reset();
        recordToolChanged();
    }
    if (!core_->measurePoints.empty()) {
        core_->measurePoints.clear();
        recordToolChanged();
    }
    if (core_->tool != tool) {
        EDITOR_LOG_DEBUG("tool %s -> %s", toolKindName(core_->tool), toolKindName(tool));
        core_->tool = tool;
        recordToolChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::beginPlacement(const std::string& catalogKey, std::int32_t rotationDeg) {
    if (!catalog_.find(catalogKey)) return EditorError::UnknownCatalogItem;
    const auto rotation = editor::geometry::normalizeRotation(rotationDeg);
    if (!rotation) return EditorError::InvalidArgument;
    if (core_->tool != ToolKind::Select) {
        setTool(ToolKind::Select);
    } else {
        session().cancel();
    }
    core_->pendingPlacement = PendingPlacement{catalogKey, *rotation};
    recordToolChanged();
    return EditorError::Ok;
}

EditorError DesignEditor::rotatePlacement() {
    if (!core_->pendingPlacement) return EditorError::NoActiveInteraction;
    core_->pendingPlacement->rotationDeg = (core_->pendingPlacement->rotationDeg + 90) % 360;
    recordToolChanged();
    return EditorError::Ok;
}

EditorError DesignEditor::cancelPlacement() {
    if (!core_->pendingPlacement) return EditorError::Ok;
    core_->pendingPlacement.reset();
    recordToolChanged();
    return EditorError::Ok;
}

EditorError DesignEditor::addMeasurePoint(const PointFt& point) {
    if (!std::isfinite(point.x) || !std::isfinite(point.y)) return EditorError::InvalidArgument;
    auto& points = core_->measurePoints;
    // A third point starts a new measurement.
    if (points.size() >= 2) points.clear();
    points.push_back(editor::geometry::snapPoint(point, core_->snapIncrement));
    recordToolChanged();
    return EditorError::Ok;
}

EditorError DesignEditor::clearMeasure() {
    if (core_->measurePoints.empty()) return EditorError::Ok;
    core_->measurePoints.clear();
    recordToolChanged();
    return EditorError::Ok;
}
