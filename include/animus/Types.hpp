/**
 * @file Types.hpp
 * @brief Types de base partagés par le moteur cognitif Animus
 *
 * Actions, besoins, conditions environnementales, positions sur la grille
 * et vecteur d'état physiologique transmis à l'apprenant.
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace animus {

// ═══════════════════════════════════════════════════════════════════════════
// ACTIONS
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Actions disponibles pour un agent
 *
 * L'ordre des valeurs est l'ordre des sorties du réseau de valeurs.
 */
enum class Action : int {
    SEEK_FOOD = 0,
    REST,
    EXPLORE,
    MOVE_UP,
    MOVE_DOWN,
    MOVE_LEFT,
    MOVE_RIGHT,
    MOVE_OBJECT,
    DRINK_WATER
};

constexpr std::size_t ACTION_COUNT = 9;

constexpr std::array<Action, ACTION_COUNT> ALL_ACTIONS = {
    Action::SEEK_FOOD, Action::REST, Action::EXPLORE,
    Action::MOVE_UP, Action::MOVE_DOWN, Action::MOVE_LEFT, Action::MOVE_RIGHT,
    Action::MOVE_OBJECT, Action::DRINK_WATER
};

inline std::size_t actionIndex(Action a) {
    return static_cast<std::size_t>(a);
}

/// Nom canonique ("seek_food", "move_up", ...)
const char* actionToString(Action a);

/// Conversion inverse, std::nullopt si le nom est inconnu
std::optional<Action> actionFromString(const std::string& name);

/// Vrai pour move_up / move_down / move_left / move_right
bool isMovement(Action a);

// ═══════════════════════════════════════════════════════════════════════════
// BESOINS ET ENVIRONNEMENT
// ═══════════════════════════════════════════════════════════════════════════

enum class Need { HUNGER, FATIGUE, THIRST };

const char* needToString(Need n);
std::optional<Need> needFromString(const std::string& name);

enum class TimeOfDay { DAY, NIGHT };

enum class Weather { SUNNY, RAINY, STORMY };

enum class CellContent { EMPTY, FOOD, WATER, OBSTACLE };

const char* timeOfDayToString(TimeOfDay t);
const char* weatherToString(Weather w);
const char* cellContentToString(CellContent c);

// ═══════════════════════════════════════════════════════════════════════════
// POSITIONS
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Cellule de la grille (x = ligne, y = colonne)
 */
struct GridPos {
    int x = 0;
    int y = 0;

    bool operator==(const GridPos& o) const { return x == o.x && y == o.y; }
    bool operator!=(const GridPos& o) const { return !(*this == o); }
    bool operator<(const GridPos& o) const { return x < o.x || (x == o.x && y < o.y); }
};

int manhattan(const GridPos& a, const GridPos& b);
int chebyshev(const GridPos& a, const GridPos& b);

/// Cellule atteinte par un mouvement (inchangée pour une action non motrice)
GridPos applyMove(const GridPos& from, Action move);

/**
 * @brief Pas de Manhattan vers une cible : lignes d'abord, puis colonnes
 * @return Explore si from == to
 */
Action stepToward(const GridPos& from, const GridPos& to);

/// Pas le long de l'axe de plus grand écart (approche d'un obstacle)
Action stepAlongMajorAxis(const GridPos& from, const GridPos& to);

// ═══════════════════════════════════════════════════════════════════════════
// VECTEUR D'ÉTAT
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Vecteur d'état transmis à l'apprenant, composantes dans [0, 1]
 *
 * Ordre canonique (hunger, fatigue, thirst). La largeur est une propriété
 * d'exécution pour permettre d'élargir l'état sans changer les types.
 */
class StateVector {
public:
    StateVector() = default;
    explicit StateVector(std::vector<double> values);

    static StateVector fromNeeds(double hunger, double fatigue, double thirst);

    [[nodiscard]] std::size_t size() const { return values_.size(); }
    [[nodiscard]] double operator[](std::size_t i) const { return values_[i]; }
    [[nodiscard]] const std::vector<double>& values() const { return values_; }

    bool operator==(const StateVector& o) const { return values_ == o.values_; }

private:
    std::vector<double> values_;
};

double clamp01(double v);

/// Visiteur multi-lambdas pour std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace animus
