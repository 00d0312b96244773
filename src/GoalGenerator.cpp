#include "animus/GoalGenerator.hpp"

#include <string>

namespace animus {

std::vector<Goal> GoalGenerator::propose(int tick,
                                         const PhysiologySnapshot& body,
                                         const EmotionState& emotions,
                                         const GoalStore& goals,
                                         const GridSize& world,
                                         std::mt19937& rng) {
    std::vector<Goal> proposed;
    if (last_generation_tick_ >= 0 && tick - last_generation_tick_ < config_.cooldown_ticks) {
        return proposed;
    }
    last_generation_tick_ = tick;

    if (body.hunger > config_.need_threshold && !goals.hasActiveMaintain(Need::HUNGER)) {
        proposed.push_back(needGoal(tick, Need::HUNGER));
    }
    if (body.thirst > config_.need_threshold && !goals.hasActiveMaintain(Need::THIRST)) {
        proposed.push_back(needGoal(tick, Need::THIRST));
    }

    if (emotions.curiosity > config_.curiosity_threshold && !goals.hasActiveLocationGoal() &&
        world.rows > 0 && world.cols > 0) {
        std::uniform_int_distribution<int> row(0, world.rows - 1);
        std::uniform_int_distribution<int> col(0, world.cols - 1);
        GridPos target{row(rng), col(rng)};

        Goal goal;
        goal.id = "goal_explore_" + std::to_string(tick);
        goal.name = "Explore Area (" + std::to_string(target.x) + "," + std::to_string(target.y) + ")";
        goal.priority = config_.explore_goal_priority;
        goal.kind = ExploreAreaGoal{target};
        proposed.push_back(std::move(goal));
    }
    return proposed;
}

Goal GoalGenerator::needGoal(int tick, Need need) const {
    Goal goal;
    if (need == Need::THIRST) {
        goal.id = "goal_seek_water_" + std::to_string(tick);
        goal.name = "Satisfy Thirst";
    } else {
        goal.id = "goal_seek_food_" + std::to_string(tick);
        goal.name = "Satisfy Hunger";
    }
    goal.priority = config_.need_goal_priority;
    MaintainNeedLowGoal maintain;
    maintain.need = need;
    maintain.threshold = config_.need_goal_threshold;
    maintain.duration_steps = config_.need_goal_duration;
    goal.kind = maintain;
    return goal;
}

} // namespace animus
