/**
 * @file TickReport.hpp
 * @brief Résumé d'un tick d'agent, sérialisable en JSON pour la télémétrie
 */
#pragma once

#include "animus/Arbiter.hpp"
#include "animus/ConsciousnessMode.hpp"
#include "animus/EmotionUpdater.hpp"
#include "animus/PhysiologicalState.hpp"
#include "animus/Types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace animus {

struct TickReport {
    std::string agent_id;
    int tick = 0;
    GridPos position;
    ConsciousnessMode mode = ConsciousnessMode::AWAKE;
    AttentionFocus focus = AttentionFocus::NONE;
    Action requested = Action::REST;        // Action décidée
    Action performed = Action::REST;        // Action effectivement exécutée
    DecisionStage stage = DecisionStage::LEARNER;
    std::optional<std::string> procedure_id;
    bool success = false;
    double raw_reward = 0.0;
    double shaped_reward = 0.0;
    PhysiologySnapshot body;
    EmotionState emotions;
    double epsilon = 0.0;

    [[nodiscard]] nlohmann::json toJson() const;
};

} // namespace animus
