#include "editor/entity/selection_manager.h"

#include <algorithm>

namespace {
bool hasFixture(const Design& design, std::uint32_t id) {
    return std::any_of(design.fixtures.begin(), design.fixtures.end(), [id](const Fixture& f) { return f.id == id; });
}

bool hasZone(const Design& design, std::uint32_t id) {
    return std::any_of(design.zones.begin(), design.zones.end(), [id](const Zone& z) { return z.id == id; });
}

bool hasAnnotation(const Design& design, std::uint32_t id) {
    return std::any_of(design.annotations.begin(), design.annotations.end(), [id](const Annotation& a) { return a.id == id; });
}
} // namespace

void SelectionManager::insertId(std::uint32_t id) {
    if (set_.insert(id).second) {
        ordered_.push_back(id);
    }
}

void SelectionManager::eraseId(std::uint32_t id) {
    if (set_.erase(id) == 0) return;
    ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), id), ordered_.end());
}

void SelectionManager::refreshPrimary() {
    if (primary_ != kNoId && isSelected(primary_)) return;
    primary_ = ordered_.empty() ? kNoId : ordered_.back();
}

bool SelectionManager::setSelection(const std::vector<std::uint32_t>& ids, Mode mode, const Design& design) {
    const std::vector<std::uint32_t> before = ordered_;
    const std::uint32_t primaryBefore = primary_;
    const std::uint32_t annotationBefore = annotationId_;

    if (mode == Mode::Replace) {
        set_.clear();
        ordered_.clear();
        primary_ = kNoId;
    }

    for (const std::uint32_t id : ids) {
        if (!hasFixture(design, id)) continue;
        switch (mode) {
            case Mode::Replace:
            case Mode::Add:
                insertId(id);
                primary_ = id;
                break;
            case Mode::Remove:
                eraseId(id);
                break;
            case Mode::Toggle:
                if (isSelected(id)) {
                    eraseId(id);
                } else {
                    insertId(id);
                    primary_ = id;
                }
                break;
        }
    }
    refreshPrimary();

    // A fixture selection replaces any annotation selection.
    if (!set_.empty()) annotationId_ = kNoId;

    const bool changed = before != ordered_ || primaryBefore != primary_ || annotationBefore != annotationId_;
    if (changed) generation_++;
    return changed;
}

bool SelectionManager::clearSelection() {
    if (set_.empty() && primary_ == kNoId) return false;
    set_.clear();
    ordered_.clear();
    primary_ = kNoId;
    generation_++;
    return true;
}

bool SelectionManager::selectZone(std::uint32_t zoneId, const Design& design) {
    if (zoneId != kNoId && !hasZone(design, zoneId)) return false;
    const bool changed = zoneId_ != zoneId || !set_.empty();
    zoneId_ = zoneId;
    set_.clear();
    ordered_.clear();
    primary_ = kNoId;
    if (changed) generation_++;
    return changed;
}

bool SelectionManager::clearZone() {
    if (zoneId_ == kNoId) return false;
    zoneId_ = kNoId;
    generation_++;
    return true;
}

bool SelectionManager::selectAnnotation(std::uint32_t annotationId, const Design& design) {
    if (annotationId != kNoId && !hasAnnotation(design, annotationId)) return false;
    const bool changed = annotationId_ != annotationId || !set_.empty() || zoneId_ != kNoId;
    annotationId_ = annotationId;
    set_.clear();
    ordered_.clear();
    primary_ = kNoId;
    zoneId_ = kNoId;
    if (changed) generation_++;
    return changed;
}

bool SelectionManager::clearAnnotation() {
    if (annotationId_ == kNoId) return false;
    annotationId_ = kNoId;
    generation_++;
    return true;
}

bool SelectionManager::prune(const Design& design) {
    bool changed = false;
    for (auto it = ordered_.begin(); it != ordered_.end();) {
        if (hasFixture(design, *it)) {
            ++it;
            continue;
        }
        set_.erase(*it);
        it = ordered_.erase(it);
        changed = true;
    }
    if (primary_ != kNoId && !isSelected(primary_)) {
        primary_ = kNoId;
        refreshPrimary();
        changed = true;
    }
    if (zoneId_ != kNoId && !hasZone(design, zoneId_)) {
        zoneId_ = kNoId;
        changed = true;
    }
    if (annotationId_ != kNoId && !hasAnnotation(design, annotationId_)) {
        annotationId_ = kNoId;
        changed = true;
    }
    if (changed) generation_++;
    return changed;
}

void SelectionManager::clear() {
    set_.clear();
    ordered_.clear();
    primary_ = kNoId;
    zoneId_ = kNoId;
    annotationId_ = kNoId;
    generation_ = 0;
}
