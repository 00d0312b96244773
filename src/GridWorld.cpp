#include "animus/GridWorld.hpp"

#include <stdexcept>

namespace animus {

GridWorld::GridWorld(const WorldConfig& config)
    : config_(config)
    , width_(config.width)
    , height_(config.height)
    , rng_(config.seed)
{
    if (width_ <= 0 || height_ <= 0) {
        throw std::invalid_argument("GridWorld: dimensions invalides");
    }
    cells_.assign(static_cast<std::size_t>(width_ * height_), CellContent::EMPTY);
    scatter(CellContent::OBSTACLE, config.obstacle_count);
    scatter(CellContent::FOOD, config.food_count);
    scatter(CellContent::WATER, config.water_count);
}

GridWorld::GridWorld(int width, int height)
    : GridWorld([&] {
          WorldConfig c;
          c.width = width;
          c.height = height;
          c.obstacle_count = 0;
          c.food_count = 0;
          c.water_count = 0;
          c.food_respawn_probability = 0.0;
          c.weather_change_probability = 0.0;
          return c;
      }())
{
}

// ═══════════════════════════════════════════════════════════════════════════
// INTERFACE ENVIRONNEMENT
// ═══════════════════════════════════════════════════════════════════════════

EnvironmentSnapshot GridWorld::observe(const GridPos& pos, int radius) const {
    EnvironmentSnapshot snap;
    snap.tick = tick_;
    snap.time_of_day = time_of_day_;
    snap.weather = weather_;
    snap.food_available = count(CellContent::FOOD) > 0;
    snap.water_available = count(CellContent::WATER) > 0;

    for (int dx = -radius; dx <= radius; ++dx) {
        for (int dy = -radius; dy <= radius; ++dy) {
            GridPos p{pos.x + dx, pos.y + dy};
            if (!inBounds(p)) continue;
            snap.visible_cells.push_back({p, cellAt(p)});
        }
    }

    bool self_skipped = false;
    for (const auto& other : occupants_) {
        if (other == pos && !self_skipped) {
            self_skipped = true;
            continue;
        }
        if (chebyshev(pos, other) <= radius) snap.other_agents.push_back(other);
    }
    return snap;
}

MoveResult GridWorld::requestMove(const GridPos& from, Action direction) {
    GridPos to = applyMove(from, direction);
    if (!inBounds(to)) return MoveResult::OUT_OF_BOUNDS;
    if (cellAt(to) == CellContent::OBSTACLE) return MoveResult::BLOCKED;
    return MoveResult::MOVED;
}

bool GridWorld::consumeResource(const GridPos& cell, CellContent resource) {
    if (!inBounds(cell) || cellAt(cell) != resource) return false;
    // L'eau est une source permanente, la nourriture disparaît
    if (resource == CellContent::FOOD) setCell(cell, CellContent::EMPTY);
    return resource == CellContent::FOOD || resource == CellContent::WATER;
}

bool GridWorld::relocateObstacle(const GridPos& from, const GridPos& to) {
    if (!inBounds(from) || !inBounds(to)) return false;
    if (cellAt(from) != CellContent::OBSTACLE) return false;
    if (manhattan(from, to) != 1 || cellAt(to) != CellContent::EMPTY) return false;
    for (const auto& agent : occupants_) {
        if (agent == to) return false;
    }
    setCell(to, CellContent::OBSTACLE);
    setCell(from, CellContent::EMPTY);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// DYNAMIQUE
// ═══════════════════════════════════════════════════════════════════════════

void GridWorld::advance() {
    ++tick_;

    if (config_.day_night_cycle > 1) {
        int half = config_.day_night_cycle / 2;
        time_of_day_ = (tick_ % config_.day_night_cycle) < half ? TimeOfDay::DAY : TimeOfDay::NIGHT;
    }

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) < config_.weather_change_probability) {
        std::uniform_int_distribution<int> pick(0, 2);
        weather_ = static_cast<Weather>(pick(rng_));
    }
    if (coin(rng_) < config_.food_respawn_probability) {
        if (auto cell = randomEmptyCell()) setCell(*cell, CellContent::FOOD);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// GRILLE
// ═══════════════════════════════════════════════════════════════════════════

bool GridWorld::inBounds(const GridPos& pos) const {
    return pos.x >= 0 && pos.x < height_ && pos.y >= 0 && pos.y < width_;
}

std::size_t GridWorld::index(const GridPos& pos) const {
    return static_cast<std::size_t>(pos.x * width_ + pos.y);
}

void GridWorld::setCell(const GridPos& pos, CellContent content) {
    if (!inBounds(pos)) throw std::out_of_range("GridWorld::setCell hors grille");
    cells_[index(pos)] = content;
}

CellContent GridWorld::cellAt(const GridPos& pos) const {
    if (!inBounds(pos)) return CellContent::OBSTACLE;
    return cells_[index(pos)];
}

int GridWorld::count(CellContent content) const {
    int n = 0;
    for (auto c : cells_) {
        if (c == content) ++n;
    }
    return n;
}

std::optional<GridPos> GridWorld::randomEmptyCell() {
    std::vector<GridPos> empty;
    for (int x = 0; x < height_; ++x) {
        for (int y = 0; y < width_; ++y) {
            GridPos p{x, y};
            if (cellAt(p) == CellContent::EMPTY) empty.push_back(p);
        }
    }
    if (empty.empty()) return std::nullopt;
    std::uniform_int_distribution<std::size_t> pick(0, empty.size() - 1);
    return empty[pick(rng_)];
}

void GridWorld::scatter(CellContent content, int count) {
    for (int i = 0; i < count; ++i) {
        auto cell = randomEmptyCell();
        if (!cell) return;
        setCell(*cell, content);
    }
}

} // namespace animus
