#include "animus/ConsciousnessMachine.hpp"

#include <iostream>

namespace animus {

namespace {

bool focusTrigger(const AgentView& view, const ConsciousnessConfig& config) {
    if (view.body.maxNeed() > config.focus_need) return true;
    const Goal* best = view.goals.selectBest();
    return best && view.goals.effectivePriority(*best) >= config.focus_goal_priority;
}

bool exhausted(const AgentView& view, const ConsciousnessConfig& config) {
    return view.body.fatigue > config.sleep_fatigue;
}

AttentionFocus focusForNeed(Need need) {
    switch (need) {
        case Need::HUNGER:  return AttentionFocus::FOOD;
        case Need::THIRST:  return AttentionFocus::WATER;
        case Need::FATIGUE: return AttentionFocus::REST;
    }
    return AttentionFocus::NONE;
}

} // namespace

ConsciousnessMachine::ConsciousnessMachine(const ConsciousnessConfig& config)
    : config_(config)
{
    using M = ConsciousnessMode;
    rules_ = {
        {M::AWAKE, exhausted, M::ASLEEP, "épuisement"},
        {M::AWAKE, [](const AgentView& v, const ConsciousnessConfig& c) {
             return !exhausted(v, c) && focusTrigger(v, c);
         }, M::FOCUSED, "focalisation"},
        {M::ASLEEP, [](const AgentView& v, const ConsciousnessConfig& c) {
             return v.body.fatigue < c.wake_fatigue;
         }, M::AWAKE, "réveil"},
        {M::FOCUSED, exhausted, M::ASLEEP, "épuisement"},
        {M::FOCUSED, [](const AgentView& v, const ConsciousnessConfig& c) {
             return !exhausted(v, c) && !focusTrigger(v, c);
         }, M::AWAKE, "fin de focalisation"},
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// TRANSITIONS
// ═══════════════════════════════════════════════════════════════════════════

bool ConsciousnessMachine::step(const AgentView& view) {
    bool changed = false;
    for (const auto& rule : rules_) {
        if (rule.from != mode_) continue;
        if (rule.guard(view, config_)) {
            transitionTo(rule.to, view, rule.label);
            changed = true;
            break;
        }
    }

    if (!changed && mode_ == ConsciousnessMode::FOCUSED) {
        focus_ = selectFocus(view);
    }

    switch (mode_) {
        case ConsciousnessMode::AWAKE:   stats_.ticks_awake++; break;
        case ConsciousnessMode::ASLEEP:  stats_.ticks_asleep++; break;
        case ConsciousnessMode::FOCUSED: stats_.ticks_focused++; break;
    }
    return changed;
}

void ConsciousnessMachine::forceMode(ConsciousnessMode mode, const AgentView& view) {
    transitionTo(mode, view, "forcé");
}

void ConsciousnessMachine::transitionTo(ConsciousnessMode newMode, const AgentView& view,
                                        const std::string& label) {
    ConsciousnessMode oldMode = mode_;
    if (oldMode == newMode) return;

    // Sortie de FOCUSED et entrée en sommeil effacent le focus
    if (oldMode == ConsciousnessMode::FOCUSED || newMode == ConsciousnessMode::ASLEEP) {
        focus_ = AttentionFocus::NONE;
    }
    mode_ = newMode;
    if (newMode == ConsciousnessMode::FOCUSED) {
        focus_ = selectFocus(view);
    }
    stats_.transitions++;

    if (!quiet_mode_) {
        std::cout << "[Conscience] " << consciousnessModeToString(oldMode) << " → "
                  << consciousnessModeToString(newMode) << " (" << label << ")";
        if (newMode == ConsciousnessMode::FOCUSED) {
            std::cout << " focus=" << attentionFocusToString(focus_);
        }
        std::cout << std::endl;
    }
    if (callback_) {
        callback_(oldMode, newMode);
    }
}

AttentionFocus ConsciousnessMachine::selectFocus(const AgentView& view) const {
    const auto& body = view.body;
    if (body.hunger > config_.focus_need) return AttentionFocus::FOOD;
    if (body.thirst > config_.focus_need) return AttentionFocus::WATER;
    if (body.fatigue > config_.focus_need) return AttentionFocus::REST;

    const Goal* best = view.goals.selectBest();
    if (view.emotions.curiosity > 0.6 && view.goals.activeCount() == 0) {
        return AttentionFocus::CURIOSITY;
    }
    if (best) {
        return std::visit(overloaded{
            [](const ReachLocationGoal&)     { return AttentionFocus::LOCATION_TARGET; },
            [](const MaintainNeedLowGoal& g) { return focusForNeed(g.need); },
            [](const ClearPathGoal&)         { return AttentionFocus::OBSTACLE; },
            [](const ExploreAreaGoal&)       { return AttentionFocus::CURIOSITY; }
        }, best->kind);
    }
    if (view.perception.obstacleInSight()) return AttentionFocus::OBSTACLE;
    return AttentionFocus::NONE;
}

DecisionMode ConsciousnessMachine::decisionMode(const PhysiologySnapshot& body) const {
    // Un besoin pressant rend l'agent réactif, focalisé ou non
    if (mode_ != ConsciousnessMode::ASLEEP && body.maxNeed() > config_.reactive_need) {
        return DecisionMode::REACTIVE;
    }
    return DecisionMode::DELIBERATIVE;
}

double ConsciousnessMachine::perceptionBoost() const {
    return mode_ == ConsciousnessMode::FOCUSED ? config_.focus_perception_boost : 0.0;
}

// ═══════════════════════════════════════════════════════════════════════════
// PENSÉE
// ═══════════════════════════════════════════════════════════════════════════

Decision ConsciousnessMachine::think(const AgentView& view,
                                     const Arbiter& arbiter,
                                     const LearnerSuggestion& learner,
                                     std::mt19937& rng) const {
    if (mode_ == ConsciousnessMode::ASLEEP) {
        Decision d;
        d.action = Action::REST;
        d.stage = DecisionStage::SLEEP;
        return d;
    }

    Decision decision = arbiter.decide(view, decisionMode(view.body), learner, rng);
    if (mode_ == ConsciousnessMode::FOCUSED && decision.stage != DecisionStage::CRITICAL_OVERRIDE) {
        refineFocused(view, decision);
    }
    return decision;
}

void ConsciousnessMachine::refineFocused(const AgentView& view, Decision& decision) const {
    const Action before = decision.action;
    const GridPos& pos = view.perception.position;
    const int now = view.perception.tick;

    auto steerToResource = [&](CellContent kind, Action consume) {
        if (decision.action == consume) return;
        if (!isMovement(decision.action)) {
            decision.action = consume;
            return;
        }
        auto recalled = view.working_memory.recentMatching([&](const WorkingMemoryItem& item) {
            return item.kind == kind && now - item.tick <= config_.focus_recall_window &&
                   item.location != pos;
        });
        decision.action = recalled.empty() ? consume : stepToward(pos, recalled.front().location);
    };

    switch (focus_) {
        case AttentionFocus::FOOD:
            if (view.body.hunger > config_.focus_resource_need) {
                steerToResource(CellContent::FOOD, Action::SEEK_FOOD);
            }
            break;
        case AttentionFocus::WATER:
            if (view.body.thirst > config_.focus_resource_need) {
                steerToResource(CellContent::WATER, Action::DRINK_WATER);
            }
            break;
        case AttentionFocus::LOCATION_TARGET:
            for (const auto& goal : view.goals.all()) {
                const auto* reach = std::get_if<ReachLocationGoal>(&goal.kind);
                if (!reach || goal.completed) continue;
                if (reach->target != pos) decision.action = stepToward(pos, reach->target);
                break;
            }
            break;
        default:
            break;
    }

    if (decision.action != before) {
        decision.stage = DecisionStage::FOCUS;
        decision.target.reset();
        decision.procedure_id.reset();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// SOMMEIL
// ═══════════════════════════════════════════════════════════════════════════

ActionOutcome ConsciousnessMachine::actAsleep(Action requested, PhysiologicalState& body) const {
    ActionOutcome outcome;
    outcome.action = Action::REST;
    outcome.success = true;
    if (requested == Action::REST) {
        body.applyDelta(Need::FATIGUE, -config_.asleep_rest_fatigue);
        outcome.reward = config_.asleep_rest_reward;
    } else {
        body.applyDelta(Need::FATIGUE, -config_.asleep_partial_fatigue);
        outcome.reward = config_.asleep_partial_reward;
    }
    return outcome;
}

} // namespace animus
