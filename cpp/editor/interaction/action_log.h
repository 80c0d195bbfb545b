#pragma once

#include "editor/command/actions.h"
#include "editor/core/types.h"
#include "editor/interaction/interaction_types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

class DesignEditor;

// Records dispatched actions together with the editor state they started
// from, so a session can be reproduced on another editor. A log that ran out
// of capacity is kept for inspection but refuses to replay.
class ActionLog {
public:
    static constexpr std::size_t kDefaultCapacity = 4096;

    explicit ActionLog(DesignEditor& editor);

    // Enabling captures the current editor state as the replay starting point.
    void setEnabled(bool enabled, std::size_t maxEntries = kDefaultCapacity);
    bool isEnabled() const noexcept { return enabled_; }
    bool isOverflowed() const noexcept { return overflowed_; }
    bool isReplaying() const noexcept { return replaying_; }
    void clear();

    void record(const editor::action::Action& action);

    const std::vector<editor::action::Action>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }
    const Design& initialDesign() const noexcept { return initialDesign_; }

    // Resets `target` to the recorded starting state and dispatches every
    // entry. Returns false when the log overflowed or `target` is mid-gesture.
    bool replay(DesignEditor& target) const;

private:
    void captureInitialState();

    DesignEditor& editor_;
    bool enabled_ = false;
    bool overflowed_ = false;
    mutable bool replaying_ = false;
    std::size_t capacity_ = kDefaultCapacity;
    std::vector<editor::action::Action> entries_;

    Design initialDesign_{};
    std::vector<std::uint32_t> initialSelection_;
    Viewport initialViewport_{};
    double initialSnapIncrement_ = 0.25;
    ToolKind initialTool_ = ToolKind::Select;
    std::uint32_t initialNextId_ = 1;
};
