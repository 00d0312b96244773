/**
 * @file ValueLearner.hpp
 * @brief Apprenant par renforcement Deep Q-Network
 *
 * Réseau de politique + réseau cible (copie périodique), replay buffer,
 * exploration ε-greedy avec décroissance multiplicative, cible de
 * Bellman r + γ·max_a Q_target(s', a) sans masquage terminal.
 */

#pragma once

#include "animus/AgentConfig.hpp"
#include "animus/QNetwork.hpp"
#include "animus/ReplayBuffer.hpp"
#include "animus/Types.hpp"

#include <random>
#include <string>

namespace animus {

struct LearnerStats {
    std::size_t updates = 0;          // Appels à update()
    std::size_t gradient_steps = 0;
    std::size_t target_syncs = 0;
    double last_loss = 0.0;
};

class ValueLearner {
public:
    /// @throws std::invalid_argument si la configuration est incohérente
    explicit ValueLearner(const LearnerConfig& config = LearnerConfig{});

    ValueLearner(const ValueLearner&) = delete;
    ValueLearner& operator=(const ValueLearner&) = delete;
    ValueLearner(ValueLearner&&) = default;

    /// ε-greedy : action aléatoire avec probabilité ε, sinon argmax Q
    Action selectAction(const StateVector& state);

    [[nodiscard]] Action greedyAction(const StateVector& state) const;
    [[nodiscard]] Eigen::VectorXd qValues(const StateVector& state) const;

    /**
     * @brief Enregistre la transition, décroît ε, entraîne si le buffer
     *        contient au moins un lot, synchronise la cible tous les N appels
     */
    void update(const StateVector& prev_state,
                Action action,
                double reward,
                const StateVector& next_state);

    /// Sauvegarde binaire (CBOR) des poids de politique et de l'architecture
    bool save(const std::string& path) const;

    /**
     * @brief Recharge les poids de politique et synchronise la cible
     *
     * Fichier absent ou invalide : réseau neuf, retourne false.
     */
    bool load(const std::string& path);

    [[nodiscard]] double getEpsilon() const { return epsilon_; }
    void setEpsilon(double epsilon);

    [[nodiscard]] const QNetwork& policyNetwork() const { return policy_; }
    [[nodiscard]] const QNetwork& targetNetwork() const { return target_; }
    [[nodiscard]] const ReplayBuffer& replayBuffer() const { return buffer_; }
    [[nodiscard]] const LearnerStats& getStats() const { return stats_; }
    [[nodiscard]] const LearnerConfig& getConfig() const { return config_; }

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    void checkWidth(const StateVector& state) const;
    void trainOnBatch();
    void reinitialize();

    LearnerConfig config_;
    std::mt19937 rng_;
    QNetwork policy_;
    QNetwork target_;
    AdamOptimizer optimizer_;
    ReplayBuffer buffer_;
    double epsilon_;
    LearnerStats stats_;
    bool quiet_mode_ = false;
};

} // namespace animus
