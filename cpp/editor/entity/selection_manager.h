#pragma once

#include "editor/core/types.h"

#include <cstdint>
#include <unordered_set>
#include <vector>

// Fixture multi-selection plus the single zone and annotation selections.
// Selection is view state: it never enters the undo history.
class SelectionManager {
public:
    enum class Mode : std::uint32_t { Replace = 0, Add = 1, Remove = 2, Toggle = 3 };

    SelectionManager() = default;

    // Ids that do not name an existing fixture are ignored. Returns true when
    // the selection changed.
    bool setSelection(const std::vector<std::uint32_t>& ids, Mode mode, const Design& design);
    bool clearSelection();

    bool selectZone(std::uint32_t zoneId, const Design& design);
    bool clearZone();
    bool selectAnnotation(std::uint32_t annotationId, const Design& design);
    bool clearAnnotation();

    // Drops ids that no longer exist in the design.
    bool prune(const Design& design);
    void clear();

    const std::vector<std::uint32_t>& getOrdered() const { return ordered_; }
    const std::unordered_set<std::uint32_t>& getSet() const { return set_; }
    std::uint32_t getPrimary() const { return primary_; }
    std::uint32_t getZone() const { return zoneId_; }
    std::uint32_t getAnnotation() const { return annotationId_; }
    std::uint32_t getGeneration() const { return generation_; }
    bool isEmpty() const { return set_.empty(); }
    bool isSelected(std::uint32_t id) const { return set_.find(id) != set_.end(); }

private:
    void insertId(std::uint32_t id);
    void eraseId(std::uint32_t id);
    void refreshPrimary();

    std::unordered_set<std::uint32_t> set_;
    std::vector<std::uint32_t> ordered_;
    std::uint32_t primary_ = kNoId;
    std::uint32_t zoneId_ = kNoId;
    std::uint32_t annotationId_ = kNoId;
    std::uint32_t generation_ = 0;
};
