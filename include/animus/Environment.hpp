/**
 * @file Environment.hpp
 * @brief Interface entre les agents et le monde en grille
 *
 * Le moteur cognitif ne connaît le monde qu'à travers cette interface :
 * observation locale, déplacement, consommation, déplacement d'obstacle.
 */

#pragma once

#include "animus/Types.hpp"

#include <vector>

namespace animus {

struct GridSize {
    int rows = 0;
    int cols = 0;
};

struct VisibleCell {
    GridPos pos;
    CellContent content = CellContent::EMPTY;
};

/**
 * @brief Ce qu'un agent peut observer depuis sa position à un tick donné
 */
struct EnvironmentSnapshot {
    int tick = 0;
    TimeOfDay time_of_day = TimeOfDay::DAY;
    Weather weather = Weather::SUNNY;
    bool food_available = false;          // Indicateurs globaux
    bool water_available = false;
    std::vector<VisibleCell> visible_cells;
    std::vector<GridPos> other_agents;
};

enum class MoveResult {
    MOVED,
    BLOCKED,        // Obstacle sur la cellule cible
    OUT_OF_BOUNDS
};

class Environment {
public:
    virtual ~Environment() = default;

    /**
     * @brief Cellules dans le carré de rayon radius autour de pos
     * La cellule pos elle-même est exclue de other_agents.
     */
    [[nodiscard]] virtual EnvironmentSnapshot observe(const GridPos& pos, int radius) const = 0;

    /// Demande de déplacement d'une case, refusée sur obstacle ou hors limites
    virtual MoveResult requestMove(const GridPos& from, Action direction) = 0;

    /// Consomme la ressource de la cellule si elle y est présente
    virtual bool consumeResource(const GridPos& cell, CellContent resource) = 0;

    /// Déplace un obstacle vers une cellule adjacente vide
    virtual bool relocateObstacle(const GridPos& from, const GridPos& to) = 0;

    [[nodiscard]] virtual GridSize dimensions() const = 0;
};

} // namespace animus
