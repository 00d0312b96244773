#include "animus/Types.hpp"

#include <algorithm>
#include <cstdlib>

namespace animus {

namespace {

constexpr std::array<const char*, ACTION_COUNT> ACTION_NAMES = {
    "seek_food", "rest", "explore",
    "move_up", "move_down", "move_left", "move_right",
    "move_object", "drink_water"
};

} // namespace

const char* actionToString(Action a) {
    return ACTION_NAMES[actionIndex(a)];
}

std::optional<Action> actionFromString(const std::string& name) {
    for (std::size_t i = 0; i < ACTION_COUNT; ++i) {
        if (name == ACTION_NAMES[i]) return ALL_ACTIONS[i];
    }
    return std::nullopt;
}

bool isMovement(Action a) {
    return a == Action::MOVE_UP || a == Action::MOVE_DOWN ||
           a == Action::MOVE_LEFT || a == Action::MOVE_RIGHT;
}

const char* needToString(Need n) {
    switch (n) {
        case Need::HUNGER:  return "hunger";
        case Need::FATIGUE: return "fatigue";
        case Need::THIRST:  return "thirst";
    }
    return "unknown";
}

std::optional<Need> needFromString(const std::string& name) {
    if (name == "hunger") return Need::HUNGER;
    if (name == "fatigue") return Need::FATIGUE;
    if (name == "thirst") return Need::THIRST;
    return std::nullopt;
}

const char* timeOfDayToString(TimeOfDay t) {
    return t == TimeOfDay::DAY ? "day" : "night";
}

const char* weatherToString(Weather w) {
    switch (w) {
        case Weather::SUNNY:  return "sunny";
        case Weather::RAINY:  return "rainy";
        case Weather::STORMY: return "stormy";
    }
    return "unknown";
}

const char* cellContentToString(CellContent c) {
    switch (c) {
        case CellContent::EMPTY:    return "empty";
        case CellContent::FOOD:     return "food";
        case CellContent::WATER:    return "water";
        case CellContent::OBSTACLE: return "obstacle";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// GÉOMÉTRIE
// ═══════════════════════════════════════════════════════════════════════════

int manhattan(const GridPos& a, const GridPos& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

int chebyshev(const GridPos& a, const GridPos& b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

GridPos applyMove(const GridPos& from, Action move) {
    switch (move) {
        case Action::MOVE_UP:    return {from.x - 1, from.y};
        case Action::MOVE_DOWN:  return {from.x + 1, from.y};
        case Action::MOVE_LEFT:  return {from.x, from.y - 1};
        case Action::MOVE_RIGHT: return {from.x, from.y + 1};
        default:                return from;
    }
}

Action stepToward(const GridPos& from, const GridPos& to) {
    int dx = to.x - from.x;
    int dy = to.y - from.y;
    if (dx != 0) return dx > 0 ? Action::MOVE_DOWN : Action::MOVE_UP;
    if (dy != 0) return dy > 0 ? Action::MOVE_RIGHT : Action::MOVE_LEFT;
    return Action::EXPLORE;
}

Action stepAlongMajorAxis(const GridPos& from, const GridPos& to) {
    int dx = to.x - from.x;
    int dy = to.y - from.y;
    if (dx == 0 && dy == 0) return Action::EXPLORE;
    if (std::abs(dx) > std::abs(dy)) {
        return dx > 0 ? Action::MOVE_DOWN : Action::MOVE_UP;
    }
    return dy > 0 ? Action::MOVE_RIGHT : Action::MOVE_LEFT;
}

// ═══════════════════════════════════════════════════════════════════════════
// VECTEUR D'ÉTAT
// ═══════════════════════════════════════════════════════════════════════════

double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

StateVector::StateVector(std::vector<double> values)
    : values_(std::move(values))
{
    for (auto& v : values_) v = clamp01(v);
}

StateVector StateVector::fromNeeds(double hunger, double fatigue, double thirst) {
    return StateVector({hunger, fatigue, thirst});
}

} // namespace animus
