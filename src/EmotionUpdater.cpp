#include "animus/EmotionUpdater.hpp"

#include <algorithm>

namespace animus {

double EmotionState::salience() const {
    return std::max({joy, fear, frustration, curiosity});
}

void EmotionUpdater::update(EmotionState& emotions,
                            const PhysiologySnapshot& body,
                            const EmotionContext& context) const {
    if (context.food_in_sight) {
        emotions.joy = clamp01(emotions.joy + 0.1);
    } else {
        emotions.joy = clamp01(emotions.joy - body.hunger * 0.05);
    }

    bool threatening = context.time_of_day == TimeOfDay::NIGHT ||
                       context.weather == Weather::STORMY;
    emotions.fear = clamp01(emotions.fear + (threatening ? 0.1 : -0.05));

    double mean_need = (body.hunger + body.fatigue + body.thirst) / 3.0;
    emotions.frustration = clamp01(0.6 * mean_need);

    bool satisfied = body.hunger < 0.5 && body.fatigue < 0.5 && body.thirst < 0.5;
    emotions.curiosity = satisfied ? 0.8 : 0.2;
}

} // namespace animus
