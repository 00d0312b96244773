/**
 * @file ReplayBuffer.hpp
 * @brief Mémoire d'expériences circulaire à capacité fixe (FIFO)
 */

#pragma once

#include "animus/Types.hpp"

#include <random>
#include <vector>

namespace animus {

/**
 * @brief Expérience (s, a, r, s', terminal)
 *
 * terminal vaut toujours false : horizon infini, l'agent ne meurt pas.
 */
struct Transition {
    StateVector prev_state;
    Action action = Action::REST;
    double reward = 0.0;
    StateVector next_state;
    bool terminal = false;
};

class ReplayBuffer {
public:
    /// @throws std::invalid_argument si capacity == 0
    explicit ReplayBuffer(std::size_t capacity);

    /// Ajoute une transition, écrase la plus ancienne si plein
    void push(Transition t);

    /**
     * @brief Tirage uniforme sans remise dans le lot
     * @throws std::invalid_argument si batch_size > size()
     */
    [[nodiscard]] std::vector<Transition> sample(std::size_t batch_size, std::mt19937& rng) const;

    /// i-ème transition, de la plus ancienne (0) à la plus récente
    [[nodiscard]] const Transition& at(std::size_t i) const;

    [[nodiscard]] std::size_t size() const { return full_ ? data_.size() : next_; }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] bool empty() const { return size() == 0; }

    void clear();

private:
    std::size_t capacity_;
    std::vector<Transition> data_;
    std::size_t next_ = 0;
    bool full_ = false;
};

} // namespace animus
