#include "animus/Arbiter.hpp"

#include <string>

namespace animus {

namespace {

void choose(Decision& decision, Action action, DecisionStage stage) {
    decision.action = action;
    decision.stage = stage;
}

Action satisfyingAction(Need need) {
    switch (need) {
        case Need::HUNGER:  return Action::SEEK_FOOD;
        case Need::THIRST:  return Action::DRINK_WATER;
        case Need::FATIGUE: return Action::REST;
    }
    return Action::REST;
}

bool isOneOf(Action a, std::initializer_list<Action> set) {
    for (auto x : set) {
        if (a == x) return true;
    }
    return false;
}

// Actions considérées comme déjà "fortes" par le raffinement mémoire
bool isMoveOrObject(Action a) {
    return isMovement(a) || a == Action::MOVE_OBJECT;
}

} // namespace

std::string decisionStageToString(DecisionStage stage) {
    switch (stage) {
        case DecisionStage::CRITICAL_OVERRIDE: return "CRITICAL_OVERRIDE";
        case DecisionStage::PROCEDURAL:        return "PROCEDURAL";
        case DecisionStage::LEARNER:           return "LEARNER";
        case DecisionStage::GOAL:              return "GOAL";
        case DecisionStage::MEMORY:            return "MEMORY";
        case DecisionStage::ENVIRONMENT:       return "ENVIRONMENT";
        case DecisionStage::FOCUS:             return "FOCUS";
        case DecisionStage::SLEEP:             return "SLEEP";
        default: return "UNKNOWN";
    }
}

Arbiter::Arbiter(const ArbiterConfig& config)
    : config_(config)
{
}

// ═══════════════════════════════════════════════════════════════════════════
// POINT D'ENTRÉE
// ═══════════════════════════════════════════════════════════════════════════

Decision Arbiter::decide(const AgentView& view,
                         DecisionMode mode,
                         const LearnerSuggestion& learner,
                         std::mt19937& rng) const {
    if (auto critical = criticalOverride(view)) return *critical;
    if (auto procedural = proceduralStage(view, mode)) return *procedural;

    Decision decision;
    choose(decision, learner ? learner() : Action::EXPLORE, DecisionStage::LEARNER);

    if (mode == DecisionMode::DELIBERATIVE) {
        pursueGoal(view, decision);
        refineWithMemory(view, decision);
    }
    applyModifiers(view, mode, decision, rng);
    return decision;
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉTAPES 1-2 : SURCHARGES
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Decision> Arbiter::criticalOverride(const AgentView& view) const {
    const double t = config_.critical_threshold;
    std::optional<Action> action;
    if (view.body.hunger > t) {
        action = Action::SEEK_FOOD;
    } else if (view.body.thirst > t) {
        action = Action::DRINK_WATER;
    } else if (view.body.fatigue > t) {
        action = Action::REST;
    }
    if (!action) return std::nullopt;

    Decision d;
    choose(d, *action, DecisionStage::CRITICAL_OVERRIDE);
    return d;
}

std::optional<Decision> Arbiter::proceduralStage(const AgentView& view, DecisionMode mode) const {
    auto match = view.procedures.matching(view);
    if (!match) return std::nullopt;

    double threshold = mode == DecisionMode::REACTIVE ? config_.procedural_threshold_reactive
                                                      : config_.procedural_threshold_deliberative;
    if (match->priority < threshold) return std::nullopt;

    Decision d;
    choose(d, match->action, DecisionStage::PROCEDURAL);
    d.procedure_id = match->procedure_id;
    if (match->action == Action::MOVE_OBJECT) {
        auto obs = view.perception.nearest(CellContent::OBSTACLE);
        if (obs && chebyshev(view.perception.position, *obs) <= 1) d.target = obs;
    }
    return d;
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉTAPE 4 : OBJECTIFS
// ═══════════════════════════════════════════════════════════════════════════

void Arbiter::pursueGoal(const AgentView& view, Decision& decision) const {
    const Goal* goal = view.goals.selectBest();
    if (!goal) return;

    // Un ClearPath sans obstacle affecté laisse la main à son parent
    if (const auto* clear = std::get_if<ClearPathGoal>(&goal->kind)) {
        if (!clear->obstacle && goal->parent_id) {
            const Goal* parent = view.goals.find(*goal->parent_id);
            if (parent && view.goals.isEligible(*parent)) goal = parent;
        }
    }

    std::visit(overloaded{
        [&](const ReachLocationGoal& g)   { pursueLocation(view, *goal, g.target, decision); },
        [&](const ExploreAreaGoal& g)     { pursueLocation(view, *goal, g.target, decision); },
        [&](const MaintainNeedLowGoal& g) { pursueMaintain(view, *goal, g, decision); },
        [&](const ClearPathGoal& g)       { pursueClearPath(view, g, decision); }
    }, goal->kind);
}

void Arbiter::pursueLocation(const AgentView& view, const Goal& goal, const GridPos& target,
                             Decision& decision) const {
    const GridPos& pos = view.perception.position;
    if (pos == target) {
        decision.goal_deltas.push_back(MarkGoalCompleted{goal.id});
        choose(decision, Action::EXPLORE, DecisionStage::GOAL);
        return;
    }

    auto obstacle = view.perception.obstacleBetween(target);
    if (obstacle) {
        const Goal* clear_path = view.goals.clearPathChildOf(goal.id);
        if (clear_path) {
            decision.goal_deltas.push_back(AssignObstacle{clear_path->id, *obstacle});
        } else {
            // Base sous le parent, priorité effective au-dessus grâce au bonus parent
            decision.goal_deltas.push_back(SpawnClearPath{
                goal.id + "_clear_" + std::to_string(view.perception.tick),
                goal.id, *obstacle, goal.priority * 0.95});
        }
        if (chebyshev(pos, *obstacle) <= 1) {
            choose(decision, Action::MOVE_OBJECT, DecisionStage::GOAL);
            decision.target = *obstacle;
        } else {
            choose(decision, stepAlongMajorAxis(pos, *obstacle), DecisionStage::GOAL);
        }
        return;
    }

    choose(decision, stepToward(pos, target), DecisionStage::GOAL);
}

void Arbiter::pursueMaintain(const AgentView& view, const Goal& goal, const MaintainNeedLowGoal& maintain,
                             Decision& decision) const {
    const double need = view.body.need(maintain.need);
    if (need < maintain.threshold) {
        const int duration = maintain.current_duration + 1;
        decision.goal_deltas.push_back(SetMaintainDuration{goal.id, duration});
        if (duration >= maintain.duration_steps) {
            decision.goal_deltas.push_back(MarkGoalCompleted{goal.id});
        }
        const Action satisfy = satisfyingAction(maintain.need);
        if (need >= maintain.threshold * config_.maintain_suggest_ratio && decision.action != satisfy) {
            choose(decision, satisfy, DecisionStage::GOAL);
        }
    } else if (maintain.current_duration != 0) {
        decision.goal_deltas.push_back(SetMaintainDuration{goal.id, 0});
    }
}

void Arbiter::pursueClearPath(const AgentView& view, const ClearPathGoal& clear,
                              Decision& decision) const {
    if (!clear.obstacle) {
        choose(decision, Action::EXPLORE, DecisionStage::GOAL);
        return;
    }

    // L'accomplissement est constaté par l'agent sur la grille réelle, pas sur la perception
    const GridPos& pos = view.perception.position;
    const GridPos obs = *clear.obstacle;
    if (chebyshev(pos, obs) <= 1) {
        choose(decision, Action::MOVE_OBJECT, DecisionStage::GOAL);
        decision.target = obs;
        return;
    }
    choose(decision, stepAlongMajorAxis(pos, obs), DecisionStage::GOAL);
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉTAPE 5 : MÉMOIRE
// ═══════════════════════════════════════════════════════════════════════════

void Arbiter::refineWithMemory(const AgentView& view, Decision& decision) const {
    const double t = config_.memory_need_threshold;
    const auto& body = view.body;
    const auto& knowledge = view.knowledge;

    if (body.hunger > t && view.perception.foodInSight() &&
        knowledge.hasFact("food", "effect", "reduces_hunger") &&
        decision.action != Action::SEEK_FOOD && !isMoveOrObject(decision.action)) {
        choose(decision, Action::SEEK_FOOD, DecisionStage::MEMORY);
    }

    if (body.thirst > t && view.perception.waterInSight() &&
        knowledge.hasFact("water", "effect", "reduces_thirst") &&
        decision.action != Action::DRINK_WATER && !isMoveOrObject(decision.action)) {
        choose(decision, Action::DRINK_WATER, DecisionStage::MEMORY);
    }

    if (body.fatigue > t && knowledge.hasFact("rest", "effect", "reduces_fatigue") &&
        decision.action != Action::REST) {
        choose(decision, Action::REST, DecisionStage::MEMORY);
    }

    if (view.perception.weather == Weather::STORMY &&
        knowledge.hasFact("shelter", "property", "provides_safety") &&
        knowledge.hasFact("shelter", "context", "bad_weather") &&
        decision.action != Action::REST) {
        choose(decision, Action::REST, DecisionStage::MEMORY);
    }

    // Ressource perçue récemment ailleurs, besoin correspondant élevé
    const GridPos& pos = view.perception.position;
    const int now = view.perception.tick;
    auto recalled = view.working_memory.recentMatching([&](const WorkingMemoryItem& item) {
        return (item.kind == CellContent::FOOD || item.kind == CellContent::WATER) &&
               now - item.tick <= config_.working_memory_window &&
               item.location != pos;
    });
    if (recalled.empty()) return;

    const auto& item = recalled.front();
    const bool food = item.kind == CellContent::FOOD;
    const double need = food ? body.hunger : body.thirst;
    const Action consume = food ? Action::SEEK_FOOD : Action::DRINK_WATER;
    if (need > t && decision.action != consume && !isMoveOrObject(decision.action)) {
        choose(decision, stepAlongMajorAxis(pos, item.location), DecisionStage::MEMORY);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉTAPE 6 : MODIFICATEURS
// ═══════════════════════════════════════════════════════════════════════════

void Arbiter::applyModifiers(const AgentView& view, DecisionMode mode, Decision& decision,
                             std::mt19937& rng) const {
    const auto& body = view.body;
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    if (view.perception.weather == Weather::STORMY) {
        if (decision.action != Action::REST) choose(decision, Action::REST, DecisionStage::ENVIRONMENT);
    } else if (view.perception.weather == Weather::RAINY && decision.action == Action::EXPLORE &&
               coin(rng) < config_.rain_redirect_probability) {
        choose(decision,
               body.fatigue < config_.rain_rest_fatigue_ceiling ? Action::REST : Action::SEEK_FOOD,
               DecisionStage::ENVIRONMENT);
    }

    const double ceiling = config_.curiosity_need_ceiling;
    if (mode == DecisionMode::DELIBERATIVE &&
        view.emotions.curiosity > config_.curiosity_threshold &&
        body.hunger < ceiling && body.fatigue < ceiling && body.thirst < ceiling &&
        view.goals.activeCount() == 0 &&
        !isOneOf(decision.action, {Action::EXPLORE, Action::MOVE_OBJECT}) &&
        !isMovement(decision.action)) {
        static constexpr Action MOVES[] = {Action::MOVE_UP, Action::MOVE_DOWN,
                                           Action::MOVE_LEFT, Action::MOVE_RIGHT};
        std::uniform_int_distribution<int> pick(0, 3);
        choose(decision, MOVES[pick(rng)], DecisionStage::ENVIRONMENT);
    }

    if (!view.perception.other_agents.empty() &&
        body.hunger > config_.social_hunger_threshold &&
        decision.action == Action::EXPLORE) {
        choose(decision, Action::SEEK_FOOD, DecisionStage::ENVIRONMENT);
    }
}

} // namespace animus
