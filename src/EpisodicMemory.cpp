#include "animus/EpisodicMemory.hpp"

#include <algorithm>
#include <stdexcept>

namespace animus {

EpisodicMemory::EpisodicMemory(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity == 0) throw std::invalid_argument("EpisodicMemory: capacité nulle");
}

void EpisodicMemory::add(int tick, const PhysiologySnapshot& state, Action action, double emotion_weight) {
    if (episodes_.size() >= capacity_) episodes_.pop_front();
    episodes_.push_back(Episode{tick, state, action, clamp01(emotion_weight)});
}

std::vector<Episode> EpisodicMemory::recent(std::size_t window) const {
    std::size_t n = std::min(window, episodes_.size());
    return std::vector<Episode>(episodes_.end() - static_cast<std::ptrdiff_t>(n), episodes_.end());
}

} // namespace animus
