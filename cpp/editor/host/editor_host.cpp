#include "editor/host/editor_host.h"
#include "editor/core/logging.h"

#include <exception>
#include <utility>

EditorHost::EditorHost(const CatalogLookup& catalog, PersistencePort* persistence, EditorConfig config,
                       ToolConfig toolConfig)
    : persistence_(persistence)
    , editor_(std::make_unique<DesignEditor>(catalog, config))
    , tools_(std::make_unique<ToolController>(*editor_, std::move(toolConfig)))
    , commands_(std::make_unique<CommandDispatcher>(*editor_, tools_.get())) {
    savedHistoryGeneration_ = editor_->historyGeneration();
}

bool EditorHost::start() {
    bool restored = false;
    if (persistence_) {
        try {
            auto stored = persistence_->load();
            if (stored) {
                editor_->dispatch(editor::action::LoadDesign{std::move(*stored)});
                restored = editor_->getLastError() == EditorError::Ok;
            }
        } catch (const std::exception& e) {
            reportPersistenceFailure("load", e.what());
        }
    }
    // A restored design is already in storage.
    savedHistoryGeneration_ = editor_->historyGeneration();
    return restored;
}

bool EditorHost::saveNow() {
    if (!persistence_) return false;
    try {
        persistence_->save(editor_->design());
    } catch (const std::exception& e) {
        reportPersistenceFailure("save", e.what());
        return false;
    }
    saveCount_++;
    savedHistoryGeneration_ = editor_->historyGeneration();
    EDITOR_LOG_DEBUG("design saved (%u)", saveCount_);
    return true;
}

bool EditorHost::afterInput(bool changed) {
    if (editor_->historyGeneration() != savedHistoryGeneration_) {
        // Retried on the next commit when it fails.
        saveNow();
    }
    return changed;
}

void EditorHost::reportPersistenceFailure([[maybe_unused]] const char* operation, const char* what) {
    EDITOR_LOG_WARN("persistence %s failed: %s", operation, what);
    editor_->reportError(EditorError::PersistenceFailed);
    editor_->notifyObserver(EditorEventKind::PersistenceFailed, what, EventFields{});
}

bool EditorHost::dispatch(const editor::action::Action& action) { return afterInput(editor_->dispatch(action)); }
bool EditorHost::pointerDown(const PointerInput& input) { return afterInput(tools_->pointerDown(input)); }
bool EditorHost::pointerMove(const PointerInput& input) { return afterInput(tools_->pointerMove(input)); }
bool EditorHost::pointerUp(const PointerInput& input) { return afterInput(tools_->pointerUp(input)); }
bool EditorHost::pointerCancel(std::int32_t pointerId) { return afterInput(tools_->pointerCancel(pointerId)); }
bool EditorHost::wheel(double x, double y, double deltaY) { return afterInput(tools_->wheel(x, y, deltaY)); }
bool EditorHost::pinch(double ratio, double centerX, double centerY) { return afterInput(tools_->pinch(ratio, centerX, centerY)); }
bool EditorHost::handleKey(const KeyChord& chord) { return afterInput(commands_->handleKey(chord)); }
bool EditorHost::execute(const std::string& command) { return afterInput(commands_->execute(command)); }
