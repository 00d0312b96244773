#include "animus/ActionExecutor.hpp"

#include <iostream>

namespace animus {

ActionOutcome ActionExecutor::execute(Action action,
                                      const std::optional<GridPos>& target,
                                      GridPos& position,
                                      PhysiologicalState& body,
                                      Environment& env,
                                      const Perception& perception) const {
    ActionOutcome outcome;
    outcome.action = action;

    switch (action) {
        case Action::SEEK_FOOD:
            if (env.consumeResource(position, CellContent::FOOD)) {
                body.applyDelta(Need::HUNGER, -0.7);
                outcome.reward = 0.5;
                outcome.success = true;
            } else {
                body.applyDelta(Need::HUNGER, 0.02);
                outcome.reward = -0.1;
            }
            break;

        case Action::DRINK_WATER:
            if (env.consumeResource(position, CellContent::WATER)) {
                body.applyDelta(Need::THIRST, -0.8);
                outcome.reward = 0.6;
                outcome.success = true;
            } else {
                body.applyDelta(Need::THIRST, 0.03);
                outcome.reward = -0.15;
            }
            break;

        case Action::REST:
            body.applyDelta(Need::FATIGUE, -0.6);
            outcome.reward = 0.4;
            outcome.success = true;
            break;

        case Action::EXPLORE:
            // Coûte sur les trois besoins, compté comme un échec pour les procédures
            body.applyDelta(Need::HUNGER, 0.05);
            body.applyDelta(Need::FATIGUE, 0.05);
            body.applyDelta(Need::THIRST, 0.05);
            outcome.reward = -0.05;
            break;

        case Action::MOVE_UP:
        case Action::MOVE_DOWN:
        case Action::MOVE_LEFT:
        case Action::MOVE_RIGHT:
            if (env.requestMove(position, action) == MoveResult::MOVED) {
                position = applyMove(position, action);
                outcome.reward = -0.01;
                outcome.success = true;
            } else {
                outcome.reward = -0.1;
            }
            break;

        case Action::MOVE_OBJECT: {
            auto moved = moveObject(target, position, env, perception);
            outcome.reward = moved.reward;
            outcome.success = moved.success;
            break;
        }
    }
    return outcome;
}

ActionOutcome ActionExecutor::executeNamed(const std::string& name,
                                           GridPos& position,
                                           PhysiologicalState& body,
                                           Environment& env,
                                           const Perception& perception) const {
    auto action = actionFromString(name);
    if (!action) {
        std::cerr << "[ActionExecutor] Action inconnue : " << name << std::endl;
        ActionOutcome outcome;
        outcome.reward = -0.2;
        return outcome;
    }
    return execute(*action, std::nullopt, position, body, env, perception);
}

ActionOutcome ActionExecutor::moveObject(const std::optional<GridPos>& target,
                                         const GridPos& position,
                                         Environment& env,
                                         const Perception& perception) const {
    ActionOutcome outcome;
    outcome.action = Action::MOVE_OBJECT;
    outcome.reward = -0.2;

    std::optional<GridPos> obstacle = target;
    if (!obstacle) {
        auto nearest = perception.nearest(CellContent::OBSTACLE);
        if (nearest && chebyshev(position, *nearest) <= 1) obstacle = nearest;
    }
    if (!obstacle) return outcome;

    // Destinations essayées dans l'ordre : droite, bas, gauche, haut
    const GridPos candidates[] = {
        {obstacle->x, obstacle->y + 1},
        {obstacle->x + 1, obstacle->y},
        {obstacle->x, obstacle->y - 1},
        {obstacle->x - 1, obstacle->y},
    };
    for (const auto& dest : candidates) {
        if (dest == position) continue;
        if (env.relocateObstacle(*obstacle, dest)) {
            outcome.reward = 0.3;
            outcome.success = true;
            return outcome;
        }
    }
    return outcome;
}

} // namespace animus
