/**
 * @file Agent.hpp
 * @brief Agent cognitif : orchestration d'un tick
 *
 * Ordre d'un tick :
 *   perception → physiologie → émotions → génération d'objectifs →
 *   transition de conscience → décision → deltas d'objectifs → action →
 *   modulation de la récompense → apprentissage → écriture mémoire
 */
#pragma once

#include "animus/ActionExecutor.hpp"
#include "animus/AgentConfig.hpp"
#include "animus/Arbiter.hpp"
#include "animus/ConsciousnessMachine.hpp"
#include "animus/EmotionUpdater.hpp"
#include "animus/Environment.hpp"
#include "animus/EpisodicMemory.hpp"
#include "animus/GoalGenerator.hpp"
#include "animus/Goals.hpp"
#include "animus/Perception.hpp"
#include "animus/PhysiologicalState.hpp"
#include "animus/ProceduralMemory.hpp"
#include "animus/RewardShaper.hpp"
#include "animus/SemanticMemory.hpp"
#include "animus/TickReport.hpp"
#include "animus/ValueLearner.hpp"
#include "animus/WorkingMemory.hpp"

#include <array>
#include <random>
#include <string>

namespace animus {

class Agent {
public:
    /**
     * @param id Identifiant de l'agent (rapports, résumé)
     * @param config Configuration complète
     * @param start Position initiale
     * @param seed Graine de l'aléa de décision et de perception
     */
    Agent(std::string id, const AgentConfig& config, const GridPos& start, std::uint32_t seed);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;
    Agent(Agent&&) = default;

    /// Exécute un tick complet dans env
    TickReport tick(Environment& env);

    /// Objectifs, procédures et faits par défaut
    void seedDefaults(const GridPos& center);

    // ═══════════════════════════════════════════════════════════
    // ACCÈS
    // ═══════════════════════════════════════════════════════════

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const GridPos& position() const { return position_; }
    void setPosition(const GridPos& pos) { position_ = pos; }

    [[nodiscard]] PhysiologicalState& body() { return body_; }
    [[nodiscard]] const PhysiologicalState& body() const { return body_; }
    [[nodiscard]] const EmotionState& emotions() const { return emotions_; }
    [[nodiscard]] GoalStore& goals() { return goals_; }
    [[nodiscard]] const GoalStore& goals() const { return goals_; }
    [[nodiscard]] ProceduralMemory& procedures() { return procedures_; }
    [[nodiscard]] const ProceduralMemory& procedures() const { return procedures_; }
    [[nodiscard]] SemanticMemory& knowledge() { return knowledge_; }
    [[nodiscard]] const WorkingMemory& workingMemory() const { return working_memory_; }
    [[nodiscard]] const EpisodicMemory& episodes() const { return episodes_; }
    [[nodiscard]] ValueLearner& learner() { return learner_; }
    [[nodiscard]] const ValueLearner& learner() const { return learner_; }
    [[nodiscard]] ConsciousnessMachine& consciousness() { return consciousness_; }
    [[nodiscard]] const ConsciousnessMachine& consciousness() const { return consciousness_; }
    [[nodiscard]] const Perception& lastPerception() const { return perception_; }
    [[nodiscard]] const std::array<int, ACTION_COUNT>& actionCounts() const { return action_counts_; }

    void setQuietMode(bool quiet);

private:
    void rememberPerception();

    /// Accomplit les ClearPath dont l'obstacle a quitté la grille réelle
    void confirmClearedPaths(const Environment& env);

    std::string id_;
    GridPos position_;

    PhysiologicalState body_;
    EmotionState emotions_;
    EmotionUpdater emotion_updater_;
    RewardShaper reward_shaper_;

    PerceptionBuilder perception_builder_;
    Perception perception_;

    GoalStore goals_;
    GoalGenerator goal_generator_;

    ProceduralMemory procedures_;
    SemanticMemory knowledge_;
    WorkingMemory working_memory_;
    EpisodicMemory episodes_;

    ValueLearner learner_;
    Arbiter arbiter_;
    ConsciousnessMachine consciousness_;
    ActionExecutor executor_;

    std::mt19937 rng_;
    std::array<int, ACTION_COUNT> action_counts_{};
    bool quiet_mode_ = false;
};

} // namespace animus
