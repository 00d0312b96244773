/**
 * @file QNetwork.hpp
 * @brief Perceptron multicouche Q(s, ·) et optimiseur Adam (Eigen)
 *
 * Architecture : entrée → [couches cachées ReLU] → sortie linéaire,
 * une valeur par action. Les poids sont stockés en (sortie × entrée),
 * les lots en colonnes (entrée × taille_lot).
 */

#pragma once

#include "animus/Types.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <random>
#include <vector>

namespace animus {

struct DenseLayer {
    Eigen::MatrixXd weights;   // (out × in)
    Eigen::VectorXd bias;      // (out)
};

/**
 * @brief Adam (Kingma & Ba) avec moments par couche
 */
class AdamOptimizer {
public:
    explicit AdamOptimizer(double learning_rate,
                           double beta1 = 0.9,
                           double beta2 = 0.999,
                           double epsilon = 1e-8);

    /// Remet les moments à zéro pour la forme des couches données
    void reset(const std::vector<DenseLayer>& layers);

    void step(std::vector<DenseLayer>& layers, const std::vector<DenseLayer>& grads);

    [[nodiscard]] long stepCount() const { return t_; }

private:
    double lr_;
    double beta1_;
    double beta2_;
    double eps_;
    long t_ = 0;
    std::vector<DenseLayer> m_;
    std::vector<DenseLayer> v_;
};

class QNetwork {
public:
    /**
     * @param input_size  Largeur du vecteur d'état
     * @param hidden      Tailles des couches cachées
     * @param output_size Nombre d'actions
     * @param rng         Source des poids initiaux, U(±1/√fan_in)
     */
    QNetwork(std::size_t input_size,
             const std::vector<int>& hidden,
             std::size_t output_size,
             std::mt19937& rng);

    [[nodiscard]] Eigen::VectorXd predict(const StateVector& state) const;

    /// Passe avant sur un lot, une colonne par échantillon
    [[nodiscard]] Eigen::MatrixXd forwardBatch(const Eigen::MatrixXd& inputs) const;

    /**
     * @brief Une descente de gradient sur la MSE de Q(s, a) contre les cibles
     *
     * Seule la sortie de l'action jouée reçoit un gradient.
     * @return Perte moyenne avant la mise à jour
     */
    double trainStep(const Eigen::MatrixXd& inputs,
                     const std::vector<std::size_t>& actions,
                     const Eigen::VectorXd& targets,
                     AdamOptimizer& optimizer);

    /// Copie verbatim des poids (architectures identiques requises)
    void copyWeightsFrom(const QNetwork& other);

    [[nodiscard]] bool sameArchitecture(const QNetwork& other) const;
    [[nodiscard]] bool sameWeights(const QNetwork& other) const;

    [[nodiscard]] std::size_t inputSize() const { return input_size_; }
    [[nodiscard]] std::size_t outputSize() const { return output_size_; }
    [[nodiscard]] const std::vector<int>& hiddenSizes() const { return hidden_; }
    [[nodiscard]] const std::vector<DenseLayer>& layers() const { return layers_; }

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Reconstruit un réseau depuis toJson()
     * @throws std::runtime_error si une clé manque ou si les dimensions divergent
     */
    static QNetwork fromJson(const nlohmann::json& j);

    static Eigen::VectorXd toEigen(const StateVector& state);

private:
    QNetwork() = default;

    std::size_t input_size_ = 0;
    std::size_t output_size_ = 0;
    std::vector<int> hidden_;
    std::vector<DenseLayer> layers_;
};

} // namespace animus
