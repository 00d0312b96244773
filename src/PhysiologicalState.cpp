#include "animus/PhysiologicalState.hpp"

#include <algorithm>

namespace animus {

double PhysiologySnapshot::need(Need n) const {
    switch (n) {
        case Need::HUNGER:  return hunger;
        case Need::FATIGUE: return fatigue;
        case Need::THIRST:  return thirst;
    }
    return 0.0;
}

double PhysiologySnapshot::maxNeed() const {
    return std::max({hunger, fatigue, thirst});
}

PhysiologicalState::PhysiologicalState(const PhysiologyConfig& config)
    : config_(config)
{
    set(config.initial_hunger, config.initial_fatigue, config.initial_thirst);
}

void PhysiologicalState::update(double time_scale) {
    state_.hunger = clamp01(state_.hunger + config_.hunger_rate * time_scale);
    state_.fatigue = clamp01(state_.fatigue + config_.fatigue_rate * time_scale);
    state_.thirst = clamp01(state_.thirst + config_.thirst_rate * time_scale);
    recomputeMood();
}

void PhysiologicalState::applyDelta(Need need, double delta) {
    switch (need) {
        case Need::HUNGER:  state_.hunger = clamp01(state_.hunger + delta); break;
        case Need::FATIGUE: state_.fatigue = clamp01(state_.fatigue + delta); break;
        case Need::THIRST:  state_.thirst = clamp01(state_.thirst + delta); break;
    }
    recomputeMood();
}

void PhysiologicalState::set(double hunger, double fatigue, double thirst) {
    state_.hunger = clamp01(hunger);
    state_.fatigue = clamp01(fatigue);
    state_.thirst = clamp01(thirst);
    recomputeMood();
}

void PhysiologicalState::recomputeMood() {
    // Humeur = moyenne pondérée des besoins inversés
    state_.mood = clamp01(0.4 * (1.0 - state_.hunger) +
                          0.3 * (1.0 - state_.fatigue) +
                          0.3 * (1.0 - state_.thirst));
}

} // namespace animus
