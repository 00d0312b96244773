#include "animus/RewardShaper.hpp"

namespace animus {

double RewardShaper::shape(double raw_reward, double mood) const {
    if (mood > config_.high_mood) {
        return raw_reward * (raw_reward > 0.0 ? config_.high_mood_positive
                                              : config_.high_mood_negative);
    }
    if (mood < config_.low_mood) {
        return raw_reward * (raw_reward > 0.0 ? config_.low_mood_positive
                                              : config_.low_mood_negative);
    }
    return raw_reward;
}

} // namespace animus
