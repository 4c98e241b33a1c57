#include "flowcanvas/history/HistoryManager.h"
#include "flowcanvas/common/Logger.h"

#include <algorithm>

namespace flowcanvas {

HistoryManager::HistoryManager(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void HistoryManager::commit(DiagramSnapshot snapshot) {
    if (!entries_.empty() && index_ + 1 < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index_ + 1), entries_.end());
    }

    entries_.push_back(std::move(snapshot));

    if (entries_.size() > capacity_) {
        entries_.erase(entries_.begin());
        LOG_TRACE("History full, evicted oldest entry (capacity {})", capacity_);
    }

    index_ = entries_.size() - 1;
}

std::optional<DiagramSnapshot> HistoryManager::undo() {
    if (!canUndo()) return std::nullopt;
    --index_;
    return entries_[index_];
}

std::optional<DiagramSnapshot> HistoryManager::redo() {
    if (!canRedo()) return std::nullopt;
    ++index_;
    return entries_[index_];
}

bool HistoryManager::canUndo() const noexcept {
    return !entries_.empty() && index_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return !entries_.empty() && index_ + 1 < entries_.size();
}

const DiagramSnapshot* HistoryManager::current() const {
    return entries_.empty() ? nullptr : &entries_[index_];
}

void HistoryManager::clear() {
    entries_.clear();
    index_ = 0;
}

}  // namespace flowcanvas
