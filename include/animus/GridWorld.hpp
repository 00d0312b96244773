/**
 * @file GridWorld.hpp
 * @brief Monde en grille de référence : ressources, obstacles, cycle
 *        jour/nuit et météo
 */

#pragma once

#include "animus/AgentConfig.hpp"
#include "animus/Environment.hpp"

#include <optional>
#include <random>
#include <vector>

namespace animus {

class GridWorld : public Environment {
public:
    /// Monde peuplé aléatoirement selon la configuration (graine fixe)
    explicit GridWorld(const WorldConfig& config);

    /// Monde vide, journée ensoleillée, sans réapparition de nourriture
    GridWorld(int width, int height);

    [[nodiscard]] EnvironmentSnapshot observe(const GridPos& pos, int radius) const override;
    MoveResult requestMove(const GridPos& from, Action direction) override;
    bool consumeResource(const GridPos& cell, CellContent resource) override;
    bool relocateObstacle(const GridPos& from, const GridPos& to) override;
    [[nodiscard]] GridSize dimensions() const override { return {height_, width_}; }

    /// Avance d'un tick : horloge, météo, réapparition de nourriture
    void advance();

    void setCell(const GridPos& pos, CellContent content);
    [[nodiscard]] CellContent cellAt(const GridPos& pos) const;
    [[nodiscard]] bool inBounds(const GridPos& pos) const;
    [[nodiscard]] std::optional<GridPos> randomEmptyCell();

    /// Positions des agents présents, pour le champ other_agents
    void setOccupants(std::vector<GridPos> positions) { occupants_ = std::move(positions); }

    void setWeather(Weather w) { weather_ = w; }
    void setTimeOfDay(TimeOfDay t) { time_of_day_ = t; }

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }
    [[nodiscard]] int tick() const { return tick_; }
    [[nodiscard]] TimeOfDay timeOfDay() const { return time_of_day_; }
    [[nodiscard]] Weather weather() const { return weather_; }
    [[nodiscard]] int count(CellContent content) const;

private:
    [[nodiscard]] std::size_t index(const GridPos& pos) const;
    void scatter(CellContent content, int count);

    WorldConfig config_;
    int width_;
    int height_;
    std::vector<CellContent> cells_;
    std::vector<GridPos> occupants_;
    int tick_ = 0;
    TimeOfDay time_of_day_ = TimeOfDay::DAY;
    Weather weather_ = Weather::SUNNY;
    std::mt19937 rng_;
};

} // namespace animus
