#include "animus/QNetwork.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace animus {

using json = nlohmann::json;
using Eigen::MatrixXd;
using Eigen::VectorXd;

// ═══════════════════════════════════════════════════════════════════════════
// ADAM
// ═══════════════════════════════════════════════════════════════════════════

AdamOptimizer::AdamOptimizer(double learning_rate, double beta1, double beta2, double epsilon)
    : lr_(learning_rate), beta1_(beta1), beta2_(beta2), eps_(epsilon)
{
    if (learning_rate <= 0.0) {
        throw std::invalid_argument("AdamOptimizer: learning_rate doit être > 0");
    }
}

void AdamOptimizer::reset(const std::vector<DenseLayer>& layers) {
    t_ = 0;
    m_.clear();
    v_.clear();
    for (const auto& layer : layers) {
        DenseLayer zero{MatrixXd::Zero(layer.weights.rows(), layer.weights.cols()),
                        VectorXd::Zero(layer.bias.size())};
        m_.push_back(zero);
        v_.push_back(zero);
    }
}

void AdamOptimizer::step(std::vector<DenseLayer>& layers, const std::vector<DenseLayer>& grads) {
    if (m_.size() != layers.size()) reset(layers);
    ++t_;

    const double bc1 = 1.0 - std::pow(beta1_, static_cast<double>(t_));
    const double bc2 = 1.0 - std::pow(beta2_, static_cast<double>(t_));

    for (std::size_t l = 0; l < layers.size(); ++l) {
        const auto& g = grads[l];
        auto& m = m_[l];
        auto& v = v_[l];

        m.weights = beta1_ * m.weights + (1.0 - beta1_) * g.weights;
        v.weights = beta2_ * v.weights + (1.0 - beta2_) * g.weights.cwiseProduct(g.weights);
        m.bias = beta1_ * m.bias + (1.0 - beta1_) * g.bias;
        v.bias = beta2_ * v.bias + (1.0 - beta2_) * g.bias.cwiseProduct(g.bias);

        layers[l].weights.array() -=
            lr_ * (m.weights.array() / bc1) / ((v.weights.array() / bc2).sqrt() + eps_);
        layers[l].bias.array() -=
            lr_ * (m.bias.array() / bc1) / ((v.bias.array() / bc2).sqrt() + eps_);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉSEAU
// ═══════════════════════════════════════════════════════════════════════════

QNetwork::QNetwork(std::size_t input_size,
                   const std::vector<int>& hidden,
                   std::size_t output_size,
                   std::mt19937& rng)
    : input_size_(input_size)
    , output_size_(output_size)
    , hidden_(hidden)
{
    if (input_size == 0 || output_size == 0) {
        throw std::invalid_argument("QNetwork: dimensions d'entrée/sortie nulles");
    }

    std::vector<std::size_t> sizes{input_size};
    for (int h : hidden) {
        if (h <= 0) throw std::invalid_argument("QNetwork: couche cachée de taille <= 0");
        sizes.push_back(static_cast<std::size_t>(h));
    }
    sizes.push_back(output_size);

    for (std::size_t l = 0; l + 1 < sizes.size(); ++l) {
        const auto fan_in = static_cast<Eigen::Index>(sizes[l]);
        const auto fan_out = static_cast<Eigen::Index>(sizes[l + 1]);
        const double bound = 1.0 / std::sqrt(static_cast<double>(fan_in));
        std::uniform_real_distribution<double> dist(-bound, bound);

        DenseLayer layer{MatrixXd(fan_out, fan_in), VectorXd(fan_out)};
        for (Eigen::Index r = 0; r < fan_out; ++r) {
            for (Eigen::Index c = 0; c < fan_in; ++c) layer.weights(r, c) = dist(rng);
            layer.bias(r) = dist(rng);
        }
        layers_.push_back(std::move(layer));
    }
}

VectorXd QNetwork::toEigen(const StateVector& state) {
    VectorXd x(static_cast<Eigen::Index>(state.size()));
    for (std::size_t i = 0; i < state.size(); ++i) x(static_cast<Eigen::Index>(i)) = state[i];
    return x;
}

VectorXd QNetwork::predict(const StateVector& state) const {
    if (state.size() != input_size_) {
        throw std::invalid_argument("QNetwork: largeur d'état " + std::to_string(state.size()) +
                                    " != " + std::to_string(input_size_));
    }
    MatrixXd out = forwardBatch(toEigen(state));
    return out.col(0);
}

MatrixXd QNetwork::forwardBatch(const MatrixXd& inputs) const {
    MatrixXd a = inputs;
    for (std::size_t l = 0; l < layers_.size(); ++l) {
        MatrixXd z = layers_[l].weights * a;
        z.colwise() += layers_[l].bias;
        a = (l + 1 < layers_.size()) ? MatrixXd(z.cwiseMax(0.0)) : z;
    }
    return a;
}

double QNetwork::trainStep(const MatrixXd& inputs,
                           const std::vector<std::size_t>& actions,
                           const VectorXd& targets,
                           AdamOptimizer& optimizer) {
    const Eigen::Index batch = inputs.cols();
    if (batch == 0) return 0.0;
    if (static_cast<Eigen::Index>(actions.size()) != batch || targets.size() != batch) {
        throw std::invalid_argument("QNetwork::trainStep: tailles de lot incohérentes");
    }

    // Passe avant en conservant pré-activations et activations
    std::vector<MatrixXd> pre;
    std::vector<MatrixXd> act{inputs};
    for (std::size_t l = 0; l < layers_.size(); ++l) {
        MatrixXd z = layers_[l].weights * act.back();
        z.colwise() += layers_[l].bias;
        pre.push_back(z);
        act.push_back((l + 1 < layers_.size()) ? MatrixXd(z.cwiseMax(0.0)) : z);
    }
    const MatrixXd& q = act.back();

    // dL/dQ : non nul uniquement sur l'action jouée
    MatrixXd delta = MatrixXd::Zero(q.rows(), batch);
    double loss = 0.0;
    for (Eigen::Index i = 0; i < batch; ++i) {
        const auto a = static_cast<Eigen::Index>(actions[static_cast<std::size_t>(i)]);
        const double err = q(a, i) - targets(i);
        loss += err * err;
        delta(a, i) = 2.0 * err / static_cast<double>(batch);
    }
    loss /= static_cast<double>(batch);

    std::vector<DenseLayer> grads(layers_.size());
    for (std::size_t l = layers_.size(); l-- > 0;) {
        grads[l].weights = delta * act[l].transpose();
        grads[l].bias = delta.rowwise().sum();
        if (l > 0) {
            MatrixXd relu_mask = (pre[l - 1].array() > 0.0).cast<double>().matrix();
            delta = (layers_[l].weights.transpose() * delta).cwiseProduct(relu_mask);
        }
    }

    optimizer.step(layers_, grads);
    return loss;
}

void QNetwork::copyWeightsFrom(const QNetwork& other) {
    if (!sameArchitecture(other)) {
        throw std::invalid_argument("QNetwork::copyWeightsFrom: architectures différentes");
    }
    layers_ = other.layers_;
}

bool QNetwork::sameArchitecture(const QNetwork& other) const {
    return input_size_ == other.input_size_ &&
           output_size_ == other.output_size_ &&
           hidden_ == other.hidden_;
}

bool QNetwork::sameWeights(const QNetwork& other) const {
    if (!sameArchitecture(other)) return false;
    for (std::size_t l = 0; l < layers_.size(); ++l) {
        if (layers_[l].weights != other.layers_[l].weights) return false;
        if (layers_[l].bias != other.layers_[l].bias) return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// SÉRIALISATION
// ═══════════════════════════════════════════════════════════════════════════

json QNetwork::toJson() const {
    json j;
    j["input_size"] = input_size_;
    j["output_size"] = output_size_;
    j["hidden_sizes"] = hidden_;
    j["layers"] = json::array();
    for (const auto& layer : layers_) {
        std::vector<double> w;
        w.reserve(static_cast<std::size_t>(layer.weights.size()));
        for (Eigen::Index r = 0; r < layer.weights.rows(); ++r) {
            for (Eigen::Index c = 0; c < layer.weights.cols(); ++c) w.push_back(layer.weights(r, c));
        }
        std::vector<double> b(layer.bias.data(), layer.bias.data() + layer.bias.size());
        j["layers"].push_back({
            {"rows", layer.weights.rows()},
            {"cols", layer.weights.cols()},
            {"weights", w},
            {"bias", b}
        });
    }
    return j;
}

QNetwork QNetwork::fromJson(const json& j) {
    for (const char* key : {"input_size", "output_size", "hidden_sizes", "layers"}) {
        if (!j.contains(key)) {
            throw std::runtime_error("Clé manquante dans le modèle : " + std::string(key));
        }
    }

    QNetwork net;
    net.input_size_ = j["input_size"].get<std::size_t>();
    net.output_size_ = j["output_size"].get<std::size_t>();
    net.hidden_ = j["hidden_sizes"].get<std::vector<int>>();

    std::vector<Eigen::Index> sizes{static_cast<Eigen::Index>(net.input_size_)};
    for (int h : net.hidden_) sizes.push_back(h);
    sizes.push_back(static_cast<Eigen::Index>(net.output_size_));

    const auto& layers = j["layers"];
    if (layers.size() + 1 != sizes.size()) {
        throw std::runtime_error("Nombre de couches incohérent avec l'architecture");
    }

    for (std::size_t l = 0; l < layers.size(); ++l) {
        const auto rows = layers[l].at("rows").get<Eigen::Index>();
        const auto cols = layers[l].at("cols").get<Eigen::Index>();
        auto w = layers[l].at("weights").get<std::vector<double>>();
        auto b = layers[l].at("bias").get<std::vector<double>>();

        if (rows != sizes[l + 1] || cols != sizes[l] ||
            static_cast<Eigen::Index>(w.size()) != rows * cols ||
            static_cast<Eigen::Index>(b.size()) != rows) {
            throw std::runtime_error("Dimensions invalides pour la couche " + std::to_string(l));
        }

        DenseLayer layer{MatrixXd(rows, cols), VectorXd(Eigen::Map<VectorXd>(b.data(), rows))};
        for (Eigen::Index r = 0; r < rows; ++r) {
            for (Eigen::Index c = 0; c < cols; ++c) {
                layer.weights(r, c) = w[static_cast<std::size_t>(r * cols + c)];
            }
        }
        net.layers_.push_back(std::move(layer));
    }
    return net;
}

} // namespace animus
