// DesignEditor document operations. Every successful edit is one history
// step; edits that leave the design unchanged record nothing.

#include "editor/editor.h"
#include "editor/internal/editor_core.h"
#include "editor/core/logging.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>

using editor::geometry::clampAnchorToShell;
using editor::geometry::normalizeRotation;
using editor::geometry::snap;

namespace {

constexpr std::uint32_t kFixturesMask = static_cast<std::uint32_t>(DesignEditor::ChangeMask::Fixtures);
constexpr std::uint32_t kZonesMask = static_cast<std::uint32_t>(DesignEditor::ChangeMask::Zones);
constexpr std::uint32_t kAnnotationsMask = static_cast<std::uint32_t>(DesignEditor::ChangeMask::Annotations);
constexpr std::uint32_t kAllMask = kFixturesMask | kZonesMask | kAnnotationsMask
    | static_cast<std::uint32_t>(DesignEditor::ChangeMask::Shell);

constexpr double kZoneTotalToleranceFt = 0.01;

bool isFinitePoint(const PointFt& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

double clampRange(double value, double lo, double hi) {
    return std::max(lo, std::min(value, hi));
}

// Rectangle size of a fixture without depending on its position.
RectFt footprintSize(const Fixture& fixture, const CatalogItem* item) {
    if (!item) return RectFt{0.0, 0.0, 1.0, 1.0};
    Fixture probe = fixture;
    probe.xFt = 0.0;
    probe.yFt = 0.0;
    return editor::geometry::rectFromFixture(probe, *item);
}

PointFt clampFixture(const PointFt& position, const Fixture& fixture, const CatalogItem* item, const Shell& shell) {
    const RectFt size = footprintSize(fixture, item);
    const FootprintAnchor anchor = item ? item->anchor : FootprintAnchor::Center;
    return clampAnchorToShell(position, size.width, size.height, shell, anchor);
}

ZoneConstraints effectiveConstraints(const Zone& zone, double minZoneSizeFt) {
    if (zone.hasConstraints) return zone.constraints;
    ZoneConstraints defaults{};
    defaults.minLengthFt = minZoneSizeFt;
    return defaults;
}

EditorError validateZoneLength(const Zone& zone, double lengthFt, double minZoneSizeFt) {
    const ZoneConstraints c = effectiveConstraints(zone, minZoneSizeFt);
    if (!c.canResize) return EditorError::EntityLocked;
    if (lengthFt < c.minLengthFt) return EditorError::InvalidArgument;
    if (c.maxLengthFt > 0.0 && lengthFt > c.maxLengthFt) return EditorError::InvalidArgument;
    return EditorError::Ok;
}

} // namespace

// ==============================================================================
// Fixtures
// ==============================================================================

EditorError DesignEditor::addFixture(const editor::action::AddFixture& a) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const CatalogItem* item = catalog_.find(a.catalogKey);
    if (!item) return EditorError::UnknownCatalogItem;
    const auto rotation = normalizeRotation(a.rotationDeg);
    if (!rotation) return EditorError::InvalidArgument;
    if (a.positionFt && !isFinitePoint(*a.positionFt)) return EditorError::InvalidArgument;
    if (a.zoneId != kNoId && !findZone(a.zoneId)) return EditorError::UnknownEntity;

    const Shell& shell = core_->design.shell;
    Fixture fixture{};
    fixture.catalogKey = a.catalogKey;
    fixture.rotationDeg = *rotation;
    fixture.properties = a.properties;
    fixture.zoneId = a.zoneId;
    const PointFt requested = a.positionFt ? *a.positionFt : PointFt{shell.lengthFt / 2.0, shell.widthFt / 2.0};
    const PointFt position = clampFixture(requested, fixture, item, shell);
    fixture.xFt = position.x;
    fixture.yFt = position.y;
    fixture.id = allocateId();

    const Design before = core_->design;
    core_->design.fixtures.push_back(fixture);
    commitDesignChange(before, "add-fixture");
    recordDocChanged(kFixturesMask);
    if (selection().setSelection({fixture.id}, SelectionManager::Mode::Replace, core_->design)) {
        recordSelectionChanged();
    }
    EDITOR_LOG_DEBUG("added fixture %u (%s)", fixture.id, fixture.catalogKey.c_str());
    return EditorError::Ok;
}

EditorError DesignEditor::removeFixtures(const std::vector<std::uint32_t>& ids) {
    std::unordered_set<std::uint32_t> doomed;
    for (const std::uint32_t id : ids) {
        if (findFixture(id)) doomed.insert(id);
    }
    if (doomed.empty()) return EditorError::UnknownEntity;

    session().cancel();

    const Design before = core_->design;
    auto& fixtures = core_->design.fixtures;
    fixtures.erase(
        std::remove_if(fixtures.begin(), fixtures.end(),
            [&doomed](const Fixture& f) { return doomed.count(f.id) != 0; }),
        fixtures.end());
    commitDesignChange(before, "remove-fixture");
    recordDocChanged(kFixturesMask);
    if (selection().prune(core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::updateFixturePosition(std::uint32_t id, double xFt, double yFt) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    if (!std::isfinite(xFt) || !std::isfinite(yFt)) return EditorError::InvalidArgument;
    Fixture* fixture = findFixtureMutable(id);
    if (!fixture) return EditorError::UnknownEntity;
    if (fixture->locked) return EditorError::EntityLocked;

    const double increment = core_->snapIncrement;
    const PointFt position = clampFixture(
        PointFt{snap(xFt, increment), snap(yFt, increment)},
        *fixture,
        catalogItemFor(*fixture),
        core_->design.shell);
    if (position.x == fixture->xFt && position.y == fixture->yFt) return EditorError::Ok;

    const Design before = core_->design;
    fixture = findFixtureMutable(id);
    fixture->xFt = position.x;
    fixture->yFt = position.y;
    commitDesignChange(before, "move-fixture");
    recordDocChanged(kFixturesMask);
    return EditorError::Ok;
}

EditorError DesignEditor::updateFixtureRotation(std::uint32_t id, double rotationDeg) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const auto rotation = normalizeRotation(rotationDeg);
    if (!rotation) return EditorError::InvalidArgument;
    Fixture* fixture = findFixtureMutable(id);
    if (!fixture) return EditorError::UnknownEntity;
    if (fixture->locked) return EditorError::EntityLocked;
    if (fixture->rotationDeg == *rotation) return EditorError::Ok;

    const Design before = core_->design;
    fixture = findFixtureMutable(id);
    fixture->rotationDeg = *rotation;
    commitDesignChange(before, "rotate-fixture");
    recordDocChanged(kFixturesMask);
    return EditorError::Ok;
}

EditorError DesignEditor::updateFixtureSize(const editor::action::UpdateFixtureSize& a) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    if (!a.lengthFt && !a.widthFt) return EditorError::InvalidArgument;
    if ((a.lengthFt && !std::isfinite(*a.lengthFt)) || (a.widthFt && !std::isfinite(*a.widthFt))) {
        return EditorError::InvalidArgument;
    }
    const Fixture* current = findFixture(a.id);
    if (!current) return EditorError::UnknownEntity;
    if (current->locked) return EditorError::EntityLocked;

    const Design before = core_->design;
    Fixture* fixture = findFixtureMutable(a.id);
    if (a.lengthFt) {
        fixture->properties[kLengthOverrideProp] = std::max(*a.lengthFt, editor::geometry::kMinOverrideFt);
    }
    if (a.widthFt) {
        fixture->properties[kWidthOverrideProp] = std::max(*a.widthFt, editor::geometry::kMinOverrideFt);
    }
    if (commitDesignChange(before, "resize-fixture")) {
        recordDocChanged(kFixturesMask);
    }
    return EditorError::Ok;
}

EditorError DesignEditor::updateFixtureProperties(std::uint32_t id, const PropertyMap& properties) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Fixture* current = findFixture(id);
    if (!current) return EditorError::UnknownEntity;
    if (current->locked
        && (properties.count(kLengthOverrideProp) != 0 || properties.count(kWidthOverrideProp) != 0)) {
        return EditorError::EntityLocked;
    }

    const Design before = core_->design;
    Fixture* fixture = findFixtureMutable(id);
    for (const auto& kv : properties) {
        fixture->properties[kv.first] = kv.second;
    }
    if (commitDesignChange(before, "fixture-properties")) {
        recordDocChanged(kFixturesMask);
    }
    return EditorError::Ok;
}

EditorError DesignEditor::toggleFixtureLock(std::uint32_t id) {
    if (!findFixture(id)) return EditorError::UnknownEntity;
    session().cancel();

    const Design before = core_->design;
    Fixture* fixture = findFixtureMutable(id);
    fixture->locked = !fixture->locked;
    commitDesignChange(before, fixture->locked ? "lock-fixture" : "unlock-fixture");
    recordDocChanged(kFixturesMask);
    return EditorError::Ok;
}

EditorError DesignEditor::nudgeSelection(double dxFt, double dyFt) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    if (!std::isfinite(dxFt) || !std::isfinite(dyFt)) return EditorError::InvalidArgument;
    const auto& ids = selectedIds();
    if (ids.empty()) return EditorError::Ok;

    const Design before = core_->design;
    const double increment = core_->snapIncrement;
    bool anyUnlocked = false;
    for (const std::uint32_t id : ids) {
        Fixture* fixture = findFixtureMutable(id);
        if (!fixture || fixture->locked) continue;
        anyUnlocked = true;
        const PointFt moved = clampFixture(
            PointFt{snap(fixture->xFt + dxFt, increment), snap(fixture->yFt + dyFt, increment)},
            *fixture,
            catalogItemFor(*fixture),
            core_->design.shell);
        fixture->xFt = moved.x;
        fixture->yFt = moved.y;
    }
    if (!anyUnlocked) return EditorError::EntityLocked;
    if (commitDesignChange(before, "nudge")) {
        recordDocChanged(kFixturesMask);
    }
    return EditorError::Ok;
}

EditorError DesignEditor::rotateSelection() {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const auto& ids = selectedIds();
    if (ids.empty()) return EditorError::Ok;

    const Design before = core_->design;
    bool anyUnlocked = false;
    for (const std::uint32_t id : ids) {
        Fixture* fixture = findFixtureMutable(id);
        if (!fixture || fixture->locked) continue;
        anyUnlocked = true;
        fixture->rotationDeg = (fixture->rotationDeg + 90) % 360;
    }
    if (!anyUnlocked) return EditorError::EntityLocked;
    if (commitDesignChange(before, "rotate-selection")) {
        recordDocChanged(kFixturesMask);
    }
    return EditorError::Ok;
}

// ==============================================================================
// Zones
// ==============================================================================

EditorError DesignEditor::addZone(const editor::action::AddZone& a) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Shell& shell = core_->design.shell;
    Zone zone{};
    zone.name = a.name ? *a.name : "Zone " + std::to_string(core_->design.zones.size() + 1);
    zone.xFt = a.xFt.value_or(0.0);
    zone.yFt = a.yFt.value_or(0.0);
    zone.lengthFt = a.lengthFt.value_or(8.0);
    zone.widthFt = a.widthFt.value_or(shell.widthFt);
    if (!std::isfinite(zone.xFt) || !std::isfinite(zone.yFt)
        || !std::isfinite(zone.lengthFt) || !std::isfinite(zone.widthFt)) {
        return EditorError::InvalidArgument;
    }
    zone.lengthFt = std::max(config_.minZoneSizeFt, zone.lengthFt);
    zone.widthFt = std::max(config_.minZoneSizeFt, zone.widthFt);
    zone.id = allocateId();

    const Design before = core_->design;
    core_->design.zones.push_back(zone);
    commitDesignChange(before, "add-zone");
    recordDocChanged(kZonesMask);
    if (selection().selectZone(zone.id, core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::removeZone(std::uint32_t id) {
    if (!findZone(id)) return EditorError::UnknownEntity;
    session().cancel();

    const Design before = core_->design;
    auto& zones = core_->design.zones;
    zones.erase(std::remove_if(zones.begin(), zones.end(), [id](const Zone& z) { return z.id == id; }), zones.end());
    std::uint32_t mask = kZonesMask;
    for (auto& fixture : core_->design.fixtures) {
        if (fixture.zoneId == id) {
            fixture.zoneId = kNoId;
            mask |= kFixturesMask;
        }
    }
    commitDesignChange(before, "remove-zone");
    recordDocChanged(mask);
    if (selection().prune(core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::renameZone(std::uint32_t id, const std::string& name) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    Zone* zone = findZoneMutable(id);
    if (!zone) return EditorError::UnknownEntity;
    if (zone->name == name) return EditorError::Ok;

    const Design before = core_->design;
    zone = findZoneMutable(id);
    zone->name = name;
    commitDesignChange(before, "rename-zone");
    recordDocChanged(kZonesMask);
    return EditorError::Ok;
}

EditorError DesignEditor::updateZone(const editor::action::UpdateZone& a) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Zone* current = findZone(a.id);
    if (!current) return EditorError::UnknownEntity;
    for (const auto* v : {&a.xFt, &a.yFt, &a.lengthFt, &a.widthFt}) {
        if (*v && !std::isfinite(**v)) return EditorError::InvalidArgument;
    }

    const double increment = core_->snapIncrement;
    const double minSize = config_.minZoneSizeFt;
    const Shell& shell = core_->design.shell;
    Zone next = *current;
    if (a.lengthFt) next.lengthFt = std::max(minSize, snap(*a.lengthFt, increment));
    if (a.widthFt) next.widthFt = std::max(minSize, snap(*a.widthFt, increment));
    if (a.xFt) next.xFt = clampRange(snap(*a.xFt, increment), 0.0, shell.lengthFt - next.lengthFt);
    if (a.yFt) next.yFt = clampRange(snap(*a.yFt, increment), 0.0, shell.widthFt - next.widthFt);
    if (a.name) next.name = *a.name;
    if (next == *current) return EditorError::Ok;

    const Design before = core_->design;
    *findZoneMutable(a.id) = next;
    commitDesignChange(before, "update-zone");
    recordDocChanged(kZonesMask);
    return EditorError::Ok;
}

// Changes the length of one zone of a left-to-right strip, compensating the
// following zone (or the preceding one for the last zone), then re-packs the
// strip from x = 0. Fixtures keep their relative position inside their zone.
EditorError DesignEditor::resizeZone(std::uint32_t id, double newLengthFt) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    if (!std::isfinite(newLengthFt)) return EditorError::InvalidArgument;
    std::vector<Zone> zones = core_->design.zones;
    const auto it = std::find_if(zones.begin(), zones.end(), [id](const Zone& z) { return z.id == id; });
    if (it == zones.end()) return EditorError::UnknownEntity;
    const auto index = static_cast<std::size_t>(it - zones.begin());

    const double minSize = config_.minZoneSizeFt;
    EditorError check = validateZoneLength(zones[index], newLengthFt, minSize);
    if (check != EditorError::Ok) return check;

    const double delta = newLengthFt - zones[index].lengthFt;
    zones[index].lengthFt = newLengthFt;
    if (index + 1 < zones.size() || index > 0) {
        Zone& neighbour = index + 1 < zones.size() ? zones[index + 1] : zones[index - 1];
        const double neighbourLength = neighbour.lengthFt - delta;
        check = validateZoneLength(neighbour, neighbourLength, minSize);
        if (check != EditorError::Ok) {
            EDITOR_LOG_DEBUG("zone %u cannot absorb %.3f ft", neighbour.id, delta);
            return check;
        }
        neighbour.lengthFt = neighbourLength;
    }

    double cursor = 0.0;
    for (Zone& zone : zones) {
        zone.xFt = cursor;
        cursor += zone.lengthFt;
    }
    if (std::abs(cursor - core_->design.shell.lengthFt) > kZoneTotalToleranceFt) {
        EDITOR_LOG_DEBUG("zone strip would span %.3f ft of a %.3f ft shell", cursor, core_->design.shell.lengthFt);
        return EditorError::InvalidArgument;
    }

    const Design before = core_->design;
    std::uint32_t mask = kZonesMask;
    for (Fixture& fixture : core_->design.fixtures) {
        if (fixture.zoneId == kNoId) continue;
        const Zone* oldZone = findZone(fixture.zoneId);
        const auto updated = std::find_if(zones.begin(), zones.end(),
            [&fixture](const Zone& z) { return z.id == fixture.zoneId; });
        if (!oldZone || updated == zones.end() || oldZone->lengthFt <= 0.0) continue;
        const double relative = (fixture.xFt - oldZone->xFt) / oldZone->lengthFt;
        fixture.xFt = updated->xFt + relative * updated->lengthFt;
        mask |= kFixturesMask;
    }
    core_->design.zones = std::move(zones);
    if (commitDesignChange(before, "resize-zone")) {
        recordDocChanged(mask);
    }
    return EditorError::Ok;
}

// ==============================================================================
// Annotations
// ==============================================================================

EditorError DesignEditor::addAnnotation(const editor::action::AddAnnotation& a) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    if (!isFinitePoint(a.anchorFt) || !isFinitePoint(a.labelFt)) return EditorError::InvalidArgument;

    Annotation annotation{};
    annotation.id = allocateId();
    annotation.anchorFt = a.anchorFt;
    annotation.labelFt = a.labelFt;
    annotation.text = a.text;

    const Design before = core_->design;
    core_->design.annotations.push_back(annotation);
    commitDesignChange(before, "add-annotation");
    recordDocChanged(kAnnotationsMask);
    if (selection().selectAnnotation(annotation.id, core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::updateAnnotation(const editor::action::UpdateAnnotation& a) {
    if (isInteractionActive()) return EditorError::InteractionBusy;
    const Annotation* current = findAnnotation(a.id);
    if (!current) return EditorError::UnknownEntity;
    if ((a.anchorFt && !isFinitePoint(*a.anchorFt)) || (a.labelFt && !isFinitePoint(*a.labelFt))) {
        return EditorError::InvalidArgument;
    }

    Annotation next = *current;
    if (a.anchorFt) next.anchorFt = *a.anchorFt;
    if (a.labelFt) next.labelFt = *a.labelFt;
    if (a.text) next.text = *a.text;
    if (next == *current) return EditorError::Ok;

    const Design before = core_->design;
    *findAnnotationMutable(a.id) = next;
    commitDesignChange(before, "update-annotation");
    recordDocChanged(kAnnotationsMask);
    return EditorError::Ok;
}

EditorError DesignEditor::removeAnnotation(std::uint32_t id) {
    if (!findAnnotation(id)) return EditorError::UnknownEntity;
    session().cancel();

    const Design before = core_->design;
    auto& annotations = core_->design.annotations;
    annotations.erase(
        std::remove_if(annotations.begin(), annotations.end(), [id](const Annotation& n) { return n.id == id; }),
        annotations.end());
    commitDesignChange(before, "remove-annotation");
    recordDocChanged(kAnnotationsMask);
    if (selection().prune(core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

// ==============================================================================
// History and document replacement
// ==============================================================================

EditorError DesignEditor::undo() {
    if (!core_->historyManager_.canUndo()) return EditorError::Ok;
    session().cancel();
    auto previous = core_->historyManager_.undo(core_->design);
    if (!previous) return EditorError::Ok;
    core_->design = std::move(*previous);
    recordDocChanged(kAllMask);
    recordHistoryChanged();
    if (selection().prune(core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::redo() {
    if (!core_->historyManager_.canRedo()) return EditorError::Ok;
    session().cancel();
    auto next = core_->historyManager_.redo(core_->design);
    if (!next) return EditorError::Ok;
    core_->design = std::move(*next);
    recordDocChanged(kAllMask);
    recordHistoryChanged();
    if (selection().prune(core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::loadDesign(const Design& design) {
    Design loaded = design;
    for (Fixture& fixture : loaded.fixtures) {
        const auto rotation = normalizeRotation(fixture.rotationDeg);
        if (!rotation) {
            EDITOR_LOG_WARN("fixture %u has non-cardinal rotation %d; reset to 0", fixture.id, fixture.rotationDeg);
        }
        fixture.rotationDeg = rotation.value_or(0);
    }

    session().reset();
    core_->historyManager_.clear();
    core_->design = std::move(loaded);
    selection().clear();
    core_->pendingPlacement.reset();
    core_->measurePoints.clear();
    resetIdAllocator();

    recordDocChanged(kAllMask);
    recordHistoryChanged();
    recordSelectionChanged();
    recordToolChanged();
    EDITOR_LOG_DEBUG("design loaded: %zu zones, %zu fixtures, %zu annotations",
        core_->design.zones.size(), core_->design.fixtures.size(), core_->design.annotations.size());
    return EditorError::Ok;
}
