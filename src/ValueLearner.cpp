#include "animus/ValueLearner.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace animus {

using json = nlohmann::json;

namespace {

constexpr const char* MODEL_FORMAT = "animus-dqn";
constexpr int MODEL_VERSION = 1;

const LearnerConfig& validated(const LearnerConfig& c) {
    if (c.state_size == 0) throw std::invalid_argument("LearnerConfig: state_size nul");
    if (c.batch_size == 0) throw std::invalid_argument("LearnerConfig: batch_size nul");
    if (c.target_sync_interval == 0) {
        throw std::invalid_argument("LearnerConfig: target_sync_interval nul");
    }
    if (c.epsilon_decay <= 0.0 || c.epsilon_decay > 1.0) {
        throw std::invalid_argument("LearnerConfig: epsilon_decay hors de ]0, 1]");
    }
    return c;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTEUR
// ═══════════════════════════════════════════════════════════════════════════

ValueLearner::ValueLearner(const LearnerConfig& config)
    : config_(validated(config))
    , rng_(config.seed)
    , policy_(config.state_size, config.hidden_sizes, ACTION_COUNT, rng_)
    , target_(policy_)
    , optimizer_(config.learning_rate)
    , buffer_(config.buffer_capacity)
    , epsilon_(config.epsilon)
{
    optimizer_.reset(policy_.layers());
}

// ═══════════════════════════════════════════════════════════════════════════
// SÉLECTION
// ═══════════════════════════════════════════════════════════════════════════

Action ValueLearner::selectAction(const StateVector& state) {
    checkWidth(state);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) < epsilon_) {
        std::uniform_int_distribution<std::size_t> pick(0, ACTION_COUNT - 1);
        return ALL_ACTIONS[pick(rng_)];
    }
    return greedyAction(state);
}

Action ValueLearner::greedyAction(const StateVector& state) const {
    Eigen::VectorXd q = qValues(state);
    Eigen::Index best = 0;
    q.maxCoeff(&best);
    return ALL_ACTIONS[static_cast<std::size_t>(best)];
}

Eigen::VectorXd ValueLearner::qValues(const StateVector& state) const {
    checkWidth(state);
    return policy_.predict(state);
}

void ValueLearner::setEpsilon(double epsilon) {
    epsilon_ = clamp01(epsilon);
}

// ═══════════════════════════════════════════════════════════════════════════
// APPRENTISSAGE
// ═══════════════════════════════════════════════════════════════════════════

void ValueLearner::update(const StateVector& prev_state,
                          Action action,
                          double reward,
                          const StateVector& next_state) {
    checkWidth(prev_state);
    checkWidth(next_state);

    buffer_.push(Transition{prev_state, action, reward, next_state, false});

    // ε ne remonte jamais, plancher epsilon_min
    if (epsilon_ > config_.epsilon_min) {
        epsilon_ = std::max(config_.epsilon_min, epsilon_ * config_.epsilon_decay);
    }

    if (buffer_.size() >= config_.batch_size) {
        trainOnBatch();
    }

    ++stats_.updates;
    if (stats_.updates % config_.target_sync_interval == 0) {
        target_.copyWeightsFrom(policy_);
        ++stats_.target_syncs;
        if (!quiet_mode_) {
            std::cout << "[ValueLearner] Réseau cible synchronisé (update "
                      << stats_.updates << ", ε=" << epsilon_ << ")\n";
        }
    }
}

void ValueLearner::trainOnBatch() {
    auto batch = buffer_.sample(config_.batch_size, rng_);
    const auto n = static_cast<Eigen::Index>(batch.size());
    const auto width = static_cast<Eigen::Index>(config_.state_size);

    Eigen::MatrixXd states(width, n);
    Eigen::MatrixXd next_states(width, n);
    std::vector<std::size_t> actions;
    actions.reserve(batch.size());
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& t = batch[static_cast<std::size_t>(i)];
        states.col(i) = QNetwork::toEigen(t.prev_state);
        next_states.col(i) = QNetwork::toEigen(t.next_state);
        actions.push_back(actionIndex(t.action));
    }

    Eigen::MatrixXd next_q = target_.forwardBatch(next_states);
    Eigen::VectorXd targets(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& t = batch[static_cast<std::size_t>(i)];
        double future = t.terminal ? 0.0 : config_.gamma * next_q.col(i).maxCoeff();
        targets(i) = t.reward + future;
    }

    stats_.last_loss = policy_.trainStep(states, actions, targets, optimizer_);
    ++stats_.gradient_steps;
}

// ═══════════════════════════════════════════════════════════════════════════
// PERSISTANCE
// ═══════════════════════════════════════════════════════════════════════════

bool ValueLearner::save(const std::string& path) const {
    try {
        json doc;
        doc["format"] = MODEL_FORMAT;
        doc["version"] = MODEL_VERSION;
        doc["network"] = policy_.toJson();

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[ValueLearner] Impossible d'écrire " << path << "\n";
            return false;
        }
        json::to_cbor(doc, out);
        out.flush();
        if (!out) {
            std::cerr << "[ValueLearner] Écriture incomplète: " << path << "\n";
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ValueLearner] Erreur sauvegarde modèle: " << e.what() << "\n";
        return false;
    }
    if (!quiet_mode_) {
        std::cout << "[ValueLearner] Modèle sauvegardé: " << path << "\n";
    }
    return true;
}

bool ValueLearner::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[ValueLearner] Modèle introuvable: " << path
                  << " (réseau neuf)\n";
        reinitialize();
        return false;
    }

    try {
        json doc = json::from_cbor(in);

        if (doc.value("format", std::string{}) != MODEL_FORMAT) {
            throw std::runtime_error("format de modèle inconnu");
        }
        QNetwork loaded = QNetwork::fromJson(doc.at("network"));
        if (!loaded.sameArchitecture(policy_)) {
            throw std::runtime_error("architecture incompatible avec la configuration");
        }

        policy_.copyWeightsFrom(loaded);
        target_.copyWeightsFrom(policy_);
        optimizer_.reset(policy_.layers());
    } catch (const std::exception& e) {
        std::cerr << "[ValueLearner] Modèle invalide " << path << ": " << e.what()
                  << " (réseau neuf)\n";
        reinitialize();
        return false;
    }

    if (!quiet_mode_) {
        std::cout << "[ValueLearner] Modèle chargé: " << path << "\n";
    }
    return true;
}

void ValueLearner::reinitialize() {
    policy_ = QNetwork(config_.state_size, config_.hidden_sizes, ACTION_COUNT, rng_);
    target_.copyWeightsFrom(policy_);
    optimizer_.reset(policy_.layers());
}

void ValueLearner::checkWidth(const StateVector& state) const {
    if (state.size() != config_.state_size) {
        throw std::invalid_argument("ValueLearner: largeur d'état " +
                                    std::to_string(state.size()) + " != " +
                                    std::to_string(config_.state_size));
    }
}

} // namespace animus
