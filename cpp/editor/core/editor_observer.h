#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

enum class EditorEventKind : std::uint8_t {
    ActionApplied = 0,
    ActionRejected = 1,
    HistoryCommitted = 2,
    Undo = 3,
    Redo = 4,
    DesignLoaded = 5,
    PersistenceFailed = 6,
};

using EventFields = std::vector<std::pair<std::string, double>>;

// Optional diagnostic side channel. The editor never depends on an observer
// being attached and ignores what it does with the events.
class EditorObserver {
public:
    virtual ~EditorObserver() = default;
    virtual void onEvent(EditorEventKind kind, const std::string& message, const EventFields& data) = 0;
};

const char* editorEventKindName(EditorEventKind kind);
