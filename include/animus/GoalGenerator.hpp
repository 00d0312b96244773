/**
 * @file GoalGenerator.hpp
 * @brief Génération d'objectifs à partir des besoins et de la curiosité
 *
 * Au plus une évaluation tous les cooldown_ticks ticks.
 */
#pragma once

#include "animus/AgentConfig.hpp"
#include "animus/EmotionUpdater.hpp"
#include "animus/Environment.hpp"
#include "animus/Goals.hpp"
#include "animus/PhysiologicalState.hpp"

#include <random>
#include <vector>

namespace animus {

class GoalGenerator {
public:
    explicit GoalGenerator(const GoalGeneratorConfig& config = GoalGeneratorConfig{})
        : config_(config) {}

    /**
     * @brief Objectifs à ajouter pour ce tick (vide pendant le cooldown)
     */
    std::vector<Goal> propose(int tick,
                              const PhysiologySnapshot& body,
                              const EmotionState& emotions,
                              const GoalStore& goals,
                              const GridSize& world,
                              std::mt19937& rng);

    [[nodiscard]] int lastGenerationTick() const { return last_generation_tick_; }

private:
    [[nodiscard]] Goal needGoal(int tick, Need need) const;

    GoalGeneratorConfig config_;
    int last_generation_tick_ = -1;
};

} // namespace animus
