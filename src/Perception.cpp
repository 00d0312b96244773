#include "animus/Perception.hpp"

#include <algorithm>

namespace animus {

std::optional<GridPos> Perception::nearest(CellContent kind) const {
    const std::vector<GridPos>* cells = nullptr;
    switch (kind) {
        case CellContent::FOOD:     cells = &food; break;
        case CellContent::WATER:    cells = &water; break;
        case CellContent::OBSTACLE: cells = &obstacles; break;
        default: return std::nullopt;
    }
    if (cells->empty()) return std::nullopt;
    return *std::min_element(cells->begin(), cells->end(),
        [this](const GridPos& a, const GridPos& b) {
            return manhattan(position, a) < manhattan(position, b);
        });
}

bool Perception::sees(CellContent kind, const GridPos& pos) const {
    const std::vector<GridPos>* cells = nullptr;
    switch (kind) {
        case CellContent::FOOD:     cells = &food; break;
        case CellContent::WATER:    cells = &water; break;
        case CellContent::OBSTACLE: cells = &obstacles; break;
        default: return false;
    }
    return std::find(cells->begin(), cells->end(), pos) != cells->end();
}

std::optional<GridPos> Perception::obstacleBetween(const GridPos& target) const {
    std::optional<GridPos> best;
    for (const auto& obs : obstacles) {
        bool inside = std::min(position.x, target.x) <= obs.x && obs.x <= std::max(position.x, target.x) &&
                      std::min(position.y, target.y) <= obs.y && obs.y <= std::max(position.y, target.y);
        if (!inside) continue;
        if (!best || manhattan(position, obs) < manhattan(position, *best)) best = obs;
    }
    return best;
}

Perception PerceptionBuilder::build(const EnvironmentSnapshot& snapshot,
                                    const GridPos& self,
                                    ConsciousnessMode mode,
                                    AttentionFocus focus,
                                    double focus_boost,
                                    std::mt19937& rng) const {
    Perception p;
    p.tick = snapshot.tick;
    p.time_of_day = snapshot.time_of_day;
    p.weather = snapshot.weather;
    p.position = self;

    if (mode == ConsciousnessMode::ASLEEP) return p;

    p.radius = config_.radius;
    p.food_available = snapshot.food_available;
    p.water_available = snapshot.water_available;
    p.other_agents = snapshot.other_agents;

    auto accuracyFor = [&](CellContent kind) {
        bool focused = (kind == CellContent::FOOD && focus == AttentionFocus::FOOD) ||
                       (kind == CellContent::WATER && focus == AttentionFocus::WATER) ||
                       (kind == CellContent::OBSTACLE && focus == AttentionFocus::OBSTACLE);
        return std::min(1.0, config_.accuracy + (focused ? focus_boost : 0.0));
    };

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    for (const auto& cell : snapshot.visible_cells) {
        if (cell.pos == self) {
            p.current_cell = cell.content;
        }
        if (cell.content == CellContent::EMPTY) continue;
        if (cell.pos != self && coin(rng) >= accuracyFor(cell.content)) continue;

        switch (cell.content) {
            case CellContent::FOOD:     p.food.push_back(cell.pos); break;
            case CellContent::WATER:    p.water.push_back(cell.pos); break;
            case CellContent::OBSTACLE: p.obstacles.push_back(cell.pos); break;
            default: break;
        }
    }
    return p;
}

} // namespace animus
