#pragma once

#include "editor/command/actions.h"
#include "editor/core/types.h"

class DesignEditor;

namespace editor {

/**
 * Applies one action to the editor. This is the reducer behind
 * DesignEditor::dispatch: it routes each action kind to the owning
 * subsystem and reports why a rejected action changed nothing.
 */
EditorError dispatchAction(DesignEditor* self, const action::Action& action);

} // namespace editor
