/**
 * @file Perception.hpp
 * @brief Construction de la perception d'un agent à partir d'une observation
 *
 * Chaque ressource ou obstacle visible est détecté avec une probabilité
 * égale à la précision de perception, augmentée pour le stimulus sur
 * lequel l'attention est focalisée. Pendant le sommeil, seuls l'heure et
 * la météo sont perçus.
 */

#pragma once

#include "animus/AgentConfig.hpp"
#include "animus/ConsciousnessMode.hpp"
#include "animus/Environment.hpp"
#include "animus/Types.hpp"

#include <optional>
#include <random>
#include <vector>

namespace animus {

struct Perception {
    int tick = 0;
    TimeOfDay time_of_day = TimeOfDay::DAY;
    Weather weather = Weather::SUNNY;
    GridPos position;
    int radius = 0;                     // 0 pendant le sommeil
    CellContent current_cell = CellContent::EMPTY;
    bool food_available = false;
    bool water_available = false;

    std::vector<GridPos> food;
    std::vector<GridPos> water;
    std::vector<GridPos> obstacles;
    std::vector<GridPos> other_agents;

    [[nodiscard]] bool foodInSight() const { return !food.empty(); }
    [[nodiscard]] bool waterInSight() const { return !water.empty(); }
    [[nodiscard]] bool obstacleInSight() const { return !obstacles.empty(); }

    /// Cellule perçue la plus proche (Manhattan) pour FOOD, WATER ou OBSTACLE
    [[nodiscard]] std::optional<GridPos> nearest(CellContent kind) const;

    [[nodiscard]] bool sees(CellContent kind, const GridPos& pos) const;

    /// Cellule dans le champ de vision courant
    [[nodiscard]] bool inView(const GridPos& pos) const {
        return radius > 0 && chebyshev(position, pos) <= radius;
    }

    /**
     * @brief Obstacle perçu dans le rectangle englobant position → target
     *
     * Le plus proche de l'agent en distance de Manhattan.
     */
    [[nodiscard]] std::optional<GridPos> obstacleBetween(const GridPos& target) const;
};

class PerceptionBuilder {
public:
    explicit PerceptionBuilder(const PerceptionConfig& config = PerceptionConfig{})
        : config_(config) {}

    [[nodiscard]] Perception build(const EnvironmentSnapshot& snapshot,
                                   const GridPos& self,
                                   ConsciousnessMode mode,
                                   AttentionFocus focus,
                                   double focus_boost,
                                   std::mt19937& rng) const;

    [[nodiscard]] int radius() const { return config_.radius; }
    [[nodiscard]] double accuracy() const { return config_.accuracy; }

private:
    PerceptionConfig config_;
};

} // namespace animus
