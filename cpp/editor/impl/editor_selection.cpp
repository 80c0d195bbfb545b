// DesignEditor selection methods. Selection is view state and never enters
// the undo history.

#include "editor/editor.h"
#include "editor/internal/editor_core.h"

#include <algorithm>

EditorError DesignEditor::selectFixture(std::uint32_t id, bool append) {
    if (id == kNoId) return clearSelection();
    if (!findFixture(id)) return EditorError::UnknownEntity;
    const auto mode = append ? SelectionManager::Mode::Add : SelectionManager::Mode::Replace;
    if (selection().setSelection({id}, mode, core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::selectFixtures(const std::vector<std::uint32_t>& ids) {
    if (selection().setSelection(ids, SelectionManager::Mode::Replace, core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::toggleFixtureSelection(std::uint32_t id) {
    if (!findFixture(id)) return EditorError::UnknownEntity;
    if (selection().setSelection({id}, SelectionManager::Mode::Toggle, core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::clearSelection() {
    if (selection().clearSelection()) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::selectZone(std::uint32_t id) {
    if (id != kNoId && !findZone(id)) return EditorError::UnknownEntity;
    if (selection().selectZone(id, core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

EditorError DesignEditor::selectAnnotation(std::uint32_t id) {
    if (id != kNoId && !findAnnotation(id)) return EditorError::UnknownEntity;
    if (selection().selectAnnotation(id, core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}

// Moves the single selection to the next fixture in document order, wrapping
// at either end. With nothing selected the first (or last) fixture is chosen.
EditorError DesignEditor::cycleSelection(bool reverse) {
    const auto& fixtures = core_->design.fixtures;
    if (fixtures.empty()) return EditorError::Ok;

    const std::size_t count = fixtures.size();
    std::size_t next = reverse ? count - 1 : 0;
    const std::uint32_t primary = selection().getPrimary();
    if (primary != kNoId) {
        const auto it = std::find_if(fixtures.begin(), fixtures.end(),
            [primary](const Fixture& f) { return f.id == primary; });
        if (it != fixtures.end()) {
            const auto index = static_cast<std::size_t>(it - fixtures.begin());
            next = reverse ? (index + count - 1) % count : (index + 1) % count;
        }
    }

    if (selection().setSelection({fixtures[next].id}, SelectionManager::Mode::Replace, core_->design)) {
        recordSelectionChanged();
    }
    return EditorError::Ok;
}
