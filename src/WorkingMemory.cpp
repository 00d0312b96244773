#include "animus/WorkingMemory.hpp"

#include <stdexcept>

namespace animus {

WorkingMemory::WorkingMemory(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity == 0) throw std::invalid_argument("WorkingMemory: capacité nulle");
    items_.reserve(capacity);
}

void WorkingMemory::push(const WorkingMemoryItem& item) {
    if (!full_) {
        items_.push_back(item);
        next_ = items_.size() % capacity_;
        full_ = items_.size() == capacity_;
        return;
    }
    items_[next_] = item;
    next_ = (next_ + 1) % capacity_;
}

std::vector<WorkingMemoryItem>
WorkingMemory::recentMatching(const std::function<bool(const WorkingMemoryItem&)>& pred) const {
    std::vector<WorkingMemoryItem> out;
    const std::size_t n = size();
    // Le plus récent est juste avant next_
    for (std::size_t k = 0; k < n; ++k) {
        std::size_t i = (next_ + items_.size() - 1 - k) % items_.size();
        if (pred(items_[i])) out.push_back(items_[i]);
    }
    return out;
}

std::optional<WorkingMemoryItem> WorkingMemory::recall(CellContent kind, int now, int window) const {
    auto hits = recentMatching([&](const WorkingMemoryItem& item) {
        return item.kind == kind && now - item.tick <= window;
    });
    if (hits.empty()) return std::nullopt;
    return hits.front();
}

void WorkingMemory::clear() {
    items_.clear();
    next_ = 0;
    full_ = false;
}

} // namespace animus
