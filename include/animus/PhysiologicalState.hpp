/**
 * @file PhysiologicalState.hpp
 * @brief Besoins physiologiques de l'agent (faim, fatigue, soif) et humeur
 */

#pragma once

#include "animus/AgentConfig.hpp"
#include "animus/Types.hpp"

namespace animus {

/**
 * @brief Copie figée de l'état physiologique à un instant donné
 */
struct PhysiologySnapshot {
    double hunger = 0.0;
    double fatigue = 0.0;
    double thirst = 0.0;
    double mood = 1.0;

    [[nodiscard]] double need(Need n) const;
    [[nodiscard]] double maxNeed() const;
    [[nodiscard]] StateVector toStateVector() const {
        return StateVector::fromNeeds(hunger, fatigue, thirst);
    }
};

class PhysiologicalState {
public:
    explicit PhysiologicalState(const PhysiologyConfig& config = PhysiologyConfig{});

    /**
     * @brief Hausse des besoins pour un tick
     * @param time_scale 1.0 le jour, night_time_scale la nuit
     */
    void update(double time_scale);

    /// Applique un delta à un besoin (borné à [0, 1]) et recalcule l'humeur
    void applyDelta(Need need, double delta);

    void set(double hunger, double fatigue, double thirst);

    [[nodiscard]] PhysiologySnapshot snapshot() const { return state_; }
    [[nodiscard]] double hunger() const { return state_.hunger; }
    [[nodiscard]] double fatigue() const { return state_.fatigue; }
    [[nodiscard]] double thirst() const { return state_.thirst; }
    [[nodiscard]] double mood() const { return state_.mood; }

    [[nodiscard]] double timeScaleFor(TimeOfDay t) const {
        return t == TimeOfDay::NIGHT ? config_.night_time_scale : 1.0;
    }

private:
    void recomputeMood();

    PhysiologyConfig config_;
    PhysiologySnapshot state_;
};

} // namespace animus
