/**
 * @file ConsciousnessMachine.hpp
 * @brief Machine à états de conscience : AWAKE / ASLEEP / FOCUSED
 *
 * Table de transitions évaluée une fois par tick, la première règle
 * applicable depuis l'état courant l'emporte. Au plus une transition par tick.
 *
 *   AWAKE   → ASLEEP  : fatigue > 0.9
 *   AWAKE   → FOCUSED : besoin > 0.7 ou objectif éligible de priorité >= 0.9
 *   ASLEEP  → AWAKE   : fatigue < 0.2
 *   FOCUSED → ASLEEP  : fatigue > 0.9
 *   FOCUSED → AWAKE   : plus aucun déclencheur de focalisation
 */
#pragma once

#include "animus/ActionExecutor.hpp"
#include "animus/AgentConfig.hpp"
#include "animus/AgentView.hpp"
#include "animus/Arbiter.hpp"
#include "animus/ConsciousnessMode.hpp"
#include "animus/PhysiologicalState.hpp"

#include <functional>
#include <random>
#include <string>
#include <vector>

namespace animus {

/**
 * Callback pour notifier les changements d'état
 */
using ModeChangeCallback = std::function<void(ConsciousnessMode oldMode, ConsciousnessMode newMode)>;

struct TransitionRule {
    ConsciousnessMode from;
    std::function<bool(const AgentView&, const ConsciousnessConfig&)> guard;
    ConsciousnessMode to;
    std::string label;
};

class ConsciousnessMachine {
public:
    explicit ConsciousnessMachine(const ConsciousnessConfig& config = ConsciousnessConfig{});

    // ═══════════════════════════════════════════════════════════
    // CYCLE
    // ═══════════════════════════════════════════════════════════

    /**
     * Évalue la table de transitions et met à jour le focus d'attention
     * @return true si l'état a changé
     */
    bool step(const AgentView& view);

    /**
     * Choix de l'action du tick
     *
     * Endormi : REST sans consulter l'arbitre. Focalisé : la décision de
     * l'arbitre est raffinée selon le focus, sauf surcharge critique.
     */
    [[nodiscard]] Decision think(const AgentView& view,
                                 const Arbiter& arbiter,
                                 const LearnerSuggestion& learner,
                                 std::mt19937& rng) const;

    /// Effet d'une action demandée pendant le sommeil
    ActionOutcome actAsleep(Action requested, PhysiologicalState& body) const;

    /// Cible d'attention selon besoins, émotions et objectifs
    [[nodiscard]] AttentionFocus selectFocus(const AgentView& view) const;

    // ═══════════════════════════════════════════════════════════
    // ACCÈS À L'ÉTAT
    // ═══════════════════════════════════════════════════════════

    [[nodiscard]] ConsciousnessMode getMode() const { return mode_; }
    [[nodiscard]] AttentionFocus getFocus() const { return focus_; }
    [[nodiscard]] DecisionMode decisionMode(const PhysiologySnapshot& body) const;
    [[nodiscard]] double perceptionBoost() const;
    [[nodiscard]] const std::vector<TransitionRule>& rules() const { return rules_; }

    /// Impose un état (chargement, tests), déclenche les hooks d'entrée/sortie
    void forceMode(ConsciousnessMode mode, const AgentView& view);

    void setStateChangeCallback(ModeChangeCallback callback) { callback_ = std::move(callback); }

    struct Stats {
        int transitions = 0;
        int ticks_awake = 0;
        int ticks_asleep = 0;
        int ticks_focused = 0;
    };
    [[nodiscard]] const Stats& getStats() const { return stats_; }

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    void transitionTo(ConsciousnessMode newMode, const AgentView& view, const std::string& label);
    void refineFocused(const AgentView& view, Decision& decision) const;

    ConsciousnessConfig config_;
    std::vector<TransitionRule> rules_;
    ConsciousnessMode mode_ = ConsciousnessMode::AWAKE;
    AttentionFocus focus_ = AttentionFocus::NONE;
    ModeChangeCallback callback_;
    Stats stats_;
    bool quiet_mode_ = false;
};

} // namespace animus
