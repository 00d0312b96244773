/**
 * @file Goals.hpp
 * @brief Objectifs hiérarchiques et registre d'objectifs
 *
 * Un objectif n'est jamais supprimé : il est seulement marqué accompli.
 * Un objectif dont un prérequis n'est pas accompli est inéligible.
 * Un sous-objectif dont le parent est actif reçoit un bonus de priorité
 * de 0.1 × priorité du parent (plafonné à 1).
 */

#pragma once

#include "animus/Types.hpp"

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace animus {

// ═══════════════════════════════════════════════════════════════════════════
// TYPES D'OBJECTIFS
// ═══════════════════════════════════════════════════════════════════════════

struct ReachLocationGoal {
    GridPos target;
};

struct MaintainNeedLowGoal {
    Need need = Need::HUNGER;
    double threshold = 0.3;        // Le besoin doit rester sous ce seuil
    int duration_steps = 10;       // ... pendant ce nombre de ticks
    int current_duration = 0;
};

struct ClearPathGoal {
    std::optional<GridPos> obstacle;   // Affecté par l'arbitre
};

struct ExploreAreaGoal {
    GridPos target;
};

using GoalKind = std::variant<ReachLocationGoal, MaintainNeedLowGoal, ClearPathGoal, ExploreAreaGoal>;

const char* goalKindName(const GoalKind& kind);

struct Goal {
    std::string id;
    std::string name;
    double priority = 0.5;
    bool completed = false;
    std::optional<std::string> parent_id;
    std::set<std::string> prerequisite_ids;
    GoalKind kind;
};

// ═══════════════════════════════════════════════════════════════════════════
// MUTATIONS PROPOSÉES PAR L'ARBITRE
// ═══════════════════════════════════════════════════════════════════════════

struct MarkGoalCompleted {
    std::string goal_id;
};

struct SetMaintainDuration {
    std::string goal_id;
    int duration = 0;
};

struct AssignObstacle {
    std::string goal_id;
    GridPos obstacle;
};

/// Nouveau sous-objectif ClearPath quand le parent n'en a plus d'actif
struct SpawnClearPath {
    std::string goal_id;
    std::string parent_id;
    GridPos obstacle;
    double priority = 0.5;
};

using GoalDelta = std::variant<MarkGoalCompleted, SetMaintainDuration, AssignObstacle, SpawnClearPath>;

// ═══════════════════════════════════════════════════════════════════════════
// REGISTRE
// ═══════════════════════════════════════════════════════════════════════════

class GoalStore {
public:
    GoalStore() = default;

    /// @return false si l'identifiant existe déjà
    bool add(Goal goal);

    [[nodiscard]] const Goal* find(const std::string& id) const;

    bool markCompleted(const std::string& id);

    /// Tous les prérequis existent et sont accomplis
    [[nodiscard]] bool prerequisitesMet(const Goal& goal) const;

    [[nodiscard]] bool isEligible(const Goal& goal) const {
        return !goal.completed && prerequisitesMet(goal);
    }

    [[nodiscard]] double effectivePriority(const Goal& goal) const;

    /// Objectif éligible de plus forte priorité effective (premier inséré en cas d'égalité)
    [[nodiscard]] const Goal* selectBest() const;

    /// Sous-objectif ClearPath non accompli rattaché à parent_id
    [[nodiscard]] const Goal* clearPathChildOf(const std::string& parent_id) const;

    void apply(const GoalDelta& delta);
    void apply(const std::vector<GoalDelta>& deltas);

    [[nodiscard]] bool hasActiveMaintain(Need need) const;
    [[nodiscard]] bool hasActiveLocationGoal() const;
    [[nodiscard]] std::size_t activeCount() const;

    [[nodiscard]] const std::vector<Goal>& all() const { return goals_; }
    [[nodiscard]] std::size_t size() const { return goals_.size(); }

private:
    Goal* findMutable(const std::string& id);

    std::vector<Goal> goals_;
};

/// Objectifs initiaux : atteindre le centre (+ dégager l'obstacle), rester nourri, rester hydraté
void seedDefaultGoals(GoalStore& store, const GridPos& center = GridPos{5, 5});

} // namespace animus
