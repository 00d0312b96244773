/**
 * @file EpisodicMemory.hpp
 * @brief Mémoire épisodique bornée : (tick, état, action, poids émotionnel)
 */

#pragma once

#include "animus/PhysiologicalState.hpp"
#include "animus/Types.hpp"

#include <deque>
#include <vector>

namespace animus {

struct Episode {
    int tick = 0;
    PhysiologySnapshot state;
    Action action = Action::REST;
    double emotion_weight = 0.0;
};

class EpisodicMemory {
public:
    explicit EpisodicMemory(std::size_t capacity = 1000);

    void add(int tick, const PhysiologySnapshot& state, Action action, double emotion_weight);

    /// Les window derniers épisodes, ordre chronologique
    [[nodiscard]] std::vector<Episode> recent(std::size_t window) const;

    [[nodiscard]] std::size_t size() const { return episodes_.size(); }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<Episode> episodes_;
};

} // namespace animus
