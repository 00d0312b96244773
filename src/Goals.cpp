#include "animus/Goals.hpp"

#include <algorithm>

namespace animus {

const char* goalKindName(const GoalKind& kind) {
    return std::visit(overloaded{
        [](const ReachLocationGoal&)   { return "reach_location"; },
        [](const MaintainNeedLowGoal&) { return "maintain_need_low"; },
        [](const ClearPathGoal&)       { return "clear_path"; },
        [](const ExploreAreaGoal&)     { return "explore_area"; }
    }, kind);
}

bool GoalStore::add(Goal goal) {
    if (find(goal.id)) return false;
    goal.priority = clamp01(goal.priority);
    goals_.push_back(std::move(goal));
    return true;
}

const Goal* GoalStore::find(const std::string& id) const {
    for (const auto& g : goals_) {
        if (g.id == id) return &g;
    }
    return nullptr;
}

Goal* GoalStore::findMutable(const std::string& id) {
    for (auto& g : goals_) {
        if (g.id == id) return &g;
    }
    return nullptr;
}

bool GoalStore::markCompleted(const std::string& id) {
    Goal* g = findMutable(id);
    if (!g) return false;
    g->completed = true;
    return true;
}

bool GoalStore::prerequisitesMet(const Goal& goal) const {
    return std::all_of(goal.prerequisite_ids.begin(), goal.prerequisite_ids.end(),
        [this](const std::string& id) {
            const Goal* pre = find(id);
            return pre && pre->completed;
        });
}

double GoalStore::effectivePriority(const Goal& goal) const {
    double p = goal.priority;
    if (goal.parent_id) {
        const Goal* parent = find(*goal.parent_id);
        if (parent && !parent->completed) p += parent->priority * 0.1;
    }
    return std::min(1.0, p);
}

const Goal* GoalStore::selectBest() const {
    const Goal* best = nullptr;
    double best_priority = -1.0;
    for (const auto& g : goals_) {
        if (!isEligible(g)) continue;
        double p = effectivePriority(g);
        if (p > best_priority) {
            best = &g;
            best_priority = p;
        }
    }
    return best;
}

const Goal* GoalStore::clearPathChildOf(const std::string& parent_id) const {
    for (const auto& g : goals_) {
        if (!g.completed && g.parent_id && *g.parent_id == parent_id &&
            std::holds_alternative<ClearPathGoal>(g.kind)) {
            return &g;
        }
    }
    return nullptr;
}

void GoalStore::apply(const GoalDelta& delta) {
    std::visit(overloaded{
        [this](const MarkGoalCompleted& d) { markCompleted(d.goal_id); },
        [this](const SetMaintainDuration& d) {
            Goal* g = findMutable(d.goal_id);
            if (!g) return;
            if (auto* m = std::get_if<MaintainNeedLowGoal>(&g->kind)) m->current_duration = d.duration;
        },
        [this](const AssignObstacle& d) {
            Goal* g = findMutable(d.goal_id);
            if (!g) return;
            if (auto* c = std::get_if<ClearPathGoal>(&g->kind)) c->obstacle = d.obstacle;
        },
        [this](const SpawnClearPath& d) {
            add(Goal{d.goal_id, "Clear Obstacle on Path", d.priority, false,
                     d.parent_id, {}, ClearPathGoal{d.obstacle}});
        }
    }, delta);
}

void GoalStore::apply(const std::vector<GoalDelta>& deltas) {
    for (const auto& d : deltas) apply(d);
}

bool GoalStore::hasActiveMaintain(Need need) const {
    return std::any_of(goals_.begin(), goals_.end(), [need](const Goal& g) {
        const auto* m = std::get_if<MaintainNeedLowGoal>(&g.kind);
        return !g.completed && m && m->need == need;
    });
}

bool GoalStore::hasActiveLocationGoal() const {
    return std::any_of(goals_.begin(), goals_.end(), [](const Goal& g) {
        return !g.completed && (std::holds_alternative<ReachLocationGoal>(g.kind) ||
                                std::holds_alternative<ExploreAreaGoal>(g.kind));
    });
}

std::size_t GoalStore::activeCount() const {
    return static_cast<std::size_t>(std::count_if(goals_.begin(), goals_.end(),
        [](const Goal& g) { return !g.completed; }));
}

void seedDefaultGoals(GoalStore& store, const GridPos& center) {
    store.add(Goal{"goal_reach_center", "Reach Center of Map", 0.9, false,
                   std::nullopt, {}, ReachLocationGoal{center}});
    store.add(Goal{"sub_goal_clear_obstacle", "Clear Obstacle on Path", 0.85, false,
                   std::string("goal_reach_center"), {}, ClearPathGoal{}});
    store.add(Goal{"goal_stay_fed", "Stay Fed", 0.6, false,
                   std::nullopt, {}, MaintainNeedLowGoal{Need::HUNGER, 0.3, 20, 0}});
    store.add(Goal{"goal_stay_hydrated", "Stay Hydrated", 0.7, false,
                   std::nullopt, {}, MaintainNeedLowGoal{Need::THIRST, 0.2, 15, 0}});
}

} // namespace animus
