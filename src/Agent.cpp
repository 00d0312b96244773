#include "animus/Agent.hpp"

#include <iostream>

namespace animus {

Agent::Agent(std::string id, const AgentConfig& config, const GridPos& start, std::uint32_t seed)
    : id_(std::move(id))
    , position_(start)
    , body_(config.physiology)
    , reward_shaper_(config.reward)
    , perception_builder_(config.perception)
    , goal_generator_(config.goal_generator)
    , procedures_(config.memory.procedural_capacity)
    , knowledge_(config.memory.semantic_capacity)
    , working_memory_(config.memory.working_capacity)
    , episodes_(config.memory.episodic_capacity)
    , learner_(config.learner)
    , arbiter_(config.arbiter)
    , consciousness_(config.consciousness)
    , rng_(seed)
{
}

void Agent::seedDefaults(const GridPos& center) {
    seedDefaultGoals(goals_, center);
    seedDefaultProcedures(procedures_);
    seedDefaultKnowledge(knowledge_);
}

void Agent::setQuietMode(bool quiet) {
    quiet_mode_ = quiet;
    learner_.setQuietMode(quiet);
    consciousness_.setQuietMode(quiet);
}

// ═══════════════════════════════════════════════════════════════════════════
// TICK
// ═══════════════════════════════════════════════════════════════════════════

TickReport Agent::tick(Environment& env) {
    // 1. Perception (état de conscience du tick précédent)
    EnvironmentSnapshot snapshot = env.observe(position_, perception_builder_.radius());
    perception_ = perception_builder_.build(snapshot, position_,
                                            consciousness_.getMode(),
                                            consciousness_.getFocus(),
                                            consciousness_.perceptionBoost(),
                                            rng_);

    // 2-3. Physiologie et émotions
    body_.update(body_.timeScaleFor(snapshot.time_of_day));
    PhysiologySnapshot before = body_.snapshot();
    emotion_updater_.update(emotions_, before,
                            EmotionContext{perception_.foodInSight(), snapshot.time_of_day, snapshot.weather});

    // 4. Nouveaux objectifs
    for (auto& goal : goal_generator_.propose(snapshot.tick, before, emotions_, goals_,
                                              env.dimensions(), rng_)) {
        if (goals_.add(goal) && !quiet_mode_) {
            std::cout << "[Agent " << id_ << "] Nouvel objectif : " << goal.name << std::endl;
        }
    }

    // 5. Transition de conscience
    consciousness_.step(AgentView{before, emotions_, perception_, goals_, procedures_,
                                  knowledge_, working_memory_, consciousness_.getFocus()});

    // 6. Décision
    const StateVector state = before.toStateVector();
    AgentView view{before, emotions_, perception_, goals_, procedures_,
                   knowledge_, working_memory_, consciousness_.getFocus()};
    Decision decision = consciousness_.think(view, arbiter_,
                                             [this, &state]() { return learner_.selectAction(state); },
                                             rng_);

    // 7. Mutations d'objectifs proposées par l'arbitre
    goals_.apply(decision.goal_deltas);

    // 8. Action
    ActionOutcome outcome;
    if (consciousness_.getMode() == ConsciousnessMode::ASLEEP) {
        outcome = consciousness_.actAsleep(decision.action, body_);
    } else {
        outcome = executor_.execute(decision.action, decision.target, position_, body_, env, perception_);
    }
    const Action performed = outcome.action.value_or(decision.action);

    // 9-10. Récompense modulée par l'humeur, apprentissage
    const double shaped = reward_shaper_.shape(outcome.reward, body_.mood());
    learner_.update(state, performed, shaped, body_.snapshot().toStateVector());

    // 11. Mémoire
    episodes_.add(snapshot.tick, body_.snapshot(), performed, emotions_.salience());
    rememberPerception();
    confirmClearedPaths(env);

    if (decision.procedure_id && performed == decision.action) {
        procedures_.recordOutcome(*decision.procedure_id, outcome.success);
        procedures_.markTriggered(*decision.procedure_id, snapshot.tick);
    }
    action_counts_[actionIndex(performed)]++;

    TickReport report;
    report.agent_id = id_;
    report.tick = snapshot.tick;
    report.position = position_;
    report.mode = consciousness_.getMode();
    report.focus = consciousness_.getFocus();
    report.requested = decision.action;
    report.performed = performed;
    report.stage = decision.stage;
    report.procedure_id = decision.procedure_id;
    report.success = outcome.success;
    report.raw_reward = outcome.reward;
    report.shaped_reward = shaped;
    report.body = body_.snapshot();
    report.emotions = emotions_;
    report.epsilon = learner_.getEpsilon();
    return report;
}

void Agent::rememberPerception() {
    const int now = perception_.tick;
    for (const auto& pos : perception_.food) working_memory_.push({CellContent::FOOD, pos, now});
    for (const auto& pos : perception_.water) working_memory_.push({CellContent::WATER, pos, now});
    for (const auto& pos : perception_.obstacles) working_memory_.push({CellContent::OBSTACLE, pos, now});
}

void Agent::confirmClearedPaths(const Environment& env) {
    std::vector<GoalDelta> cleared;
    for (const auto& goal : goals_.all()) {
        const auto* clear = std::get_if<ClearPathGoal>(&goal.kind);
        if (goal.completed || !clear || !clear->obstacle) continue;

        // Rayon 0 : la seule cellule de l'obstacle, sans bruit de perception
        auto cell = env.observe(*clear->obstacle, 0);
        if (cell.visible_cells.empty() || cell.visible_cells.front().content != CellContent::OBSTACLE) {
            cleared.push_back(MarkGoalCompleted{goal.id});
            if (!quiet_mode_) {
                std::cout << "[Agent " << id_ << "] Chemin dégagé : " << goal.name << std::endl;
            }
        }
    }
    goals_.apply(cleared);
}

} // namespace animus
