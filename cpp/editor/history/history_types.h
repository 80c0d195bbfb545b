#pragma once

#include "editor/core/types.h"

#include <cstddef>
#include <string>

static constexpr std::size_t kDefaultHistoryLimit = 50;

// One undo step: the document as it was on the other side of the edit.
struct HistoryEntry {
    Design design;
    std::string label;
};

// Open gesture: the document captured when the gesture started.
struct HistoryTransaction {
    bool active = false;
    Design baseline;
    std::string label;
};
