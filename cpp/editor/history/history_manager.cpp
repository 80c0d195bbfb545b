#include "editor/history/history_manager.h"
#include "editor/core/logging.h"

#include <algorithm>
#include <utility>

HistoryManager::HistoryManager(std::size_t limit)
    : limit_(limit == 0 ? 1 : limit) {}

bool HistoryManager::canUndo() const noexcept {
    return !past_.empty();
}

bool HistoryManager::canRedo() const noexcept {
    return !future_.empty();
}

void HistoryManager::clear() {
    past_.clear();
    future_.clear();
    transaction_ = HistoryTransaction{};
    historyGeneration_++;
}

void HistoryManager::setLimit(std::size_t limit) {
    limit_ = limit == 0 ? 1 : limit;
    trimToLimit(past_);
    trimToLimit(future_);
}

void HistoryManager::trimToLimit(std::vector<HistoryEntry>& stack) {
    if (stack.size() <= limit_) return;
    const auto excess = static_cast<std::ptrdiff_t>(stack.size() - limit_);
    stack.erase(stack.begin(), stack.begin() + excess);
}

void HistoryManager::pushPast(HistoryEntry&& entry) {
    past_.push_back(std::move(entry));
    trimToLimit(past_);
}

bool HistoryManager::commit(const Design& before, const Design& after, const std::string& label) {
    if (suppressed_) return false;
    if (before == after) return false;
    pushPast(HistoryEntry{before, label});
    future_.clear();
    historyGeneration_++;
    EDITOR_LOG_DEBUG("history commit '%s' (past=%zu)", label.c_str(), past_.size());
    return true;
}

bool HistoryManager::beginEntry(const Design& baseline, const std::string& label) {
    if (suppressed_ || transaction_.active) return false;
    transaction_.active = true;
    transaction_.baseline = baseline;
    transaction_.label = label;
    return true;
}

bool HistoryManager::commitEntry(const Design& current) {
    if (!transaction_.active) return false;
    HistoryTransaction tx = std::move(transaction_);
    transaction_ = HistoryTransaction{};
    return commit(tx.baseline, current, tx.label);
}

void HistoryManager::discardEntry() {
    transaction_ = HistoryTransaction{};
}

const Design* HistoryManager::transactionBaseline() const {
    return transaction_.active ? &transaction_.baseline : nullptr;
}

std::optional<Design> HistoryManager::undo(const Design& current) {
    if (past_.empty()) return std::nullopt;
    HistoryEntry entry = std::move(past_.back());
    past_.pop_back();
    future_.push_back(HistoryEntry{current, entry.label});
    trimToLimit(future_);
    historyGeneration_++;
    return std::move(entry.design);
}

std::optional<Design> HistoryManager::redo(const Design& current) {
    if (future_.empty()) return std::nullopt;
    HistoryEntry entry = std::move(future_.back());
    future_.pop_back();
    pushPast(HistoryEntry{current, entry.label});
    historyGeneration_++;
    return std::move(entry.design);
}

const std::string* HistoryManager::undoLabel() const {
    return past_.empty() ? nullptr : &past_.back().label;
}

const std::string* HistoryManager::redoLabel() const {
    return future_.empty() ? nullptr : &future_.back().label;
}
