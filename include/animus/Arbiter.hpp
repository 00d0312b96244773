/**
 * @file Arbiter.hpp
 * @brief Arbitrage de l'action finale d'un tick
 *
 * Précédence fixe, chaque niveau court-circuite les suivants :
 *   1. Surcharges critiques (besoin > 0.85)
 *   2. Mémoire procédurale (seuil 0.7 réactif / 0.9 délibératif)
 *   3. Suggestion de l'apprenant (candidat par défaut)
 *   4. Poursuite d'objectif (délibératif)
 *   5. Raffinement par la mémoire sémantique et de travail (délibératif)
 *   6. Modificateurs environnementaux et affectifs
 *
 * L'arbitre ne modifie rien : les mutations d'objectifs sont retournées
 * dans Decision::goal_deltas et appliquées par l'appelant.
 */

#pragma once

#include "animus/AgentConfig.hpp"
#include "animus/AgentView.hpp"
#include "animus/ConsciousnessMode.hpp"
#include "animus/Goals.hpp"
#include "animus/Types.hpp"

#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace animus {

enum class DecisionStage {
    CRITICAL_OVERRIDE,
    PROCEDURAL,
    LEARNER,
    GOAL,
    MEMORY,
    ENVIRONMENT,
    FOCUS,           // Raffinement de l'état focalisé
    SLEEP            // Décision imposée par l'état de sommeil
};

std::string decisionStageToString(DecisionStage stage);

struct Decision {
    Action action = Action::REST;
    DecisionStage stage = DecisionStage::LEARNER;
    std::vector<GoalDelta> goal_deltas;
    std::optional<std::string> procedure_id;
    std::optional<GridPos> target;          // Obstacle visé par move_object
};

/// Suggestion paresseuse de l'apprenant, invoquée seulement à l'étape 3
using LearnerSuggestion = std::function<Action()>;

class Arbiter {
public:
    explicit Arbiter(const ArbiterConfig& config = ArbiterConfig{});

    [[nodiscard]] Decision decide(const AgentView& view,
                                  DecisionMode mode,
                                  const LearnerSuggestion& learner,
                                  std::mt19937& rng) const;

    [[nodiscard]] const ArbiterConfig& getConfig() const { return config_; }

private:
    [[nodiscard]] std::optional<Decision> criticalOverride(const AgentView& view) const;
    [[nodiscard]] std::optional<Decision> proceduralStage(const AgentView& view, DecisionMode mode) const;

    void pursueGoal(const AgentView& view, Decision& decision) const;
    void pursueLocation(const AgentView& view, const Goal& goal, const GridPos& target,
                        Decision& decision) const;
    void pursueMaintain(const AgentView& view, const Goal& goal, const MaintainNeedLowGoal& maintain,
                        Decision& decision) const;
    void pursueClearPath(const AgentView& view, const ClearPathGoal& clear, Decision& decision) const;

    void refineWithMemory(const AgentView& view, Decision& decision) const;
    void applyModifiers(const AgentView& view, DecisionMode mode, Decision& decision,
                        std::mt19937& rng) const;

    ArbiterConfig config_;
};

} // namespace animus
