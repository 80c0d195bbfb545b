#pragma once

#include "editor/history/history_types.h"
#include "editor/core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class HistoryManager {
public:
    explicit HistoryManager(std::size_t limit = kDefaultHistoryLimit);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Pushes `before` as one undo step and clears the redo stack.
    // Nothing is recorded when the edit left the document unchanged.
    bool commit(const Design& before, const Design& after, const std::string& label);

    // Transaction management: a gesture records its baseline once and
    // commits a single step when it ends, however many updates it produced.
    bool beginEntry(const Design& baseline, const std::string& label);
    bool commitEntry(const Design& current);
    void discardEntry();
    bool isTransactionActive() const noexcept { return transaction_.active; }
    const Design* transactionBaseline() const;

    std::optional<Design> undo(const Design& current);
    std::optional<Design> redo(const Design& current);

    void clear();
    void setLimit(std::size_t limit);
    std::size_t getLimit() const noexcept { return limit_; }
    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }
    void setSuppressed(bool suppressed) { suppressed_ = suppressed; }
    bool isSuppressed() const { return suppressed_; }

    std::size_t pastSize() const noexcept { return past_.size(); }
    std::size_t futureSize() const noexcept { return future_.size(); }
    const std::vector<HistoryEntry>& past() const noexcept { return past_; }
    const std::vector<HistoryEntry>& future() const noexcept { return future_; }
    const std::string* undoLabel() const;
    const std::string* redoLabel() const;

private:
    void pushPast(HistoryEntry&& entry);
    void trimToLimit(std::vector<HistoryEntry>& stack);

    std::vector<HistoryEntry> past_;
    std::vector<HistoryEntry> future_;
    std::size_t limit_;
    std::uint32_t historyGeneration_ = 0;
    bool suppressed_ = false;
    HistoryTransaction transaction_;
};
