#include "animus/ProceduralMemory.hpp"

#include "animus/AgentView.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace animus {

std::string describeCondition(const ProcedureCondition& condition) {
    return std::visit(overloaded{
        [](const NeedAboveCondition& c) {
            std::ostringstream oss;
            oss << needToString(c.need) << " >= " << c.threshold;
            return oss.str();
        },
        [](const ResourceInSightCondition& c) {
            std::ostringstream oss;
            oss << cellContentToString(c.resource) << " in sight, "
                << needToString(c.need) << " > " << c.min_need;
            return oss.str();
        },
        [](const ObstacleBlockingCondition&) {
            return std::string("obstacle blocking goal path");
        }
    }, condition);
}

double Procedure::effectivePriority() const {
    if (success_count > failure_count) return std::min(1.0, base_priority * 1.1);
    if (failure_count > success_count) return std::max(0.0, base_priority * 0.8);
    return base_priority;
}

ProceduralMemory::ProceduralMemory(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity == 0) throw std::invalid_argument("ProceduralMemory: capacité nulle");
}

std::string ProceduralMemory::add(const std::string& name,
                                  const ProcedureCondition& condition,
                                  const std::vector<Action>& action_sequence,
                                  double priority) {
    if (action_sequence.empty()) {
        throw std::invalid_argument("ProceduralMemory: séquence d'actions vide pour " + name);
    }
    if (procedures_.size() >= capacity_) {
        auto weakest = std::min_element(procedures_.begin(), procedures_.end(),
            [](const Procedure& a, const Procedure& b) { return a.base_priority < b.base_priority; });
        procedures_.erase(weakest);
    }

    Procedure p;
    p.id = "proc_" + std::to_string(next_id_++);
    p.name = name;
    p.condition = condition;
    p.action_sequence = action_sequence;
    p.base_priority = clamp01(priority);
    procedures_.push_back(p);
    return p.id;
}

bool ProceduralMemory::conditionHolds(const ProcedureCondition& condition, const AgentView& view) const {
    return std::visit(overloaded{
        [&](const NeedAboveCondition& c) {
            return view.body.need(c.need) >= c.threshold;
        },
        [&](const ResourceInSightCondition& c) {
            bool seen = (c.resource == CellContent::FOOD && view.perception.foodInSight()) ||
                        (c.resource == CellContent::WATER && view.perception.waterInSight());
            return seen && view.body.need(c.need) > c.min_need;
        },
        [&](const ObstacleBlockingCondition&) {
            for (const auto& g : view.goals.all()) {
                if (!view.goals.isEligible(g)) continue;
                std::optional<GridPos> target;
                if (auto* r = std::get_if<ReachLocationGoal>(&g.kind)) target = r->target;
                if (auto* e = std::get_if<ExploreAreaGoal>(&g.kind)) target = e->target;
                if (!target) continue;
                auto obs = view.perception.obstacleBetween(*target);
                if (obs && chebyshev(view.perception.position, *obs) <= 1) return true;
            }
            return false;
        }
    }, condition);
}

std::optional<ProcedureMatch> ProceduralMemory::matching(const AgentView& view) const {
    const Procedure* best = nullptr;
    double best_priority = -1.0;
    for (const auto& p : procedures_) {
        if (!conditionHolds(p.condition, view)) continue;
        double priority = p.effectivePriority();
        if (priority > best_priority) {
            best = &p;
            best_priority = priority;
        }
    }
    if (!best) return std::nullopt;
    return ProcedureMatch{best->id, best->action_sequence.front(), best_priority};
}

bool ProceduralMemory::recordOutcome(const std::string& id, bool success) {
    Procedure* p = findMutable(id);
    if (!p) return false;
    if (success) {
        ++p->success_count;
    } else {
        ++p->failure_count;
    }
    return true;
}

void ProceduralMemory::markTriggered(const std::string& id, int tick) {
    if (Procedure* p = findMutable(id)) p->last_triggered_tick = tick;
}

const Procedure* ProceduralMemory::find(const std::string& id) const {
    for (const auto& p : procedures_) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

Procedure* ProceduralMemory::findMutable(const std::string& id) {
    for (auto& p : procedures_) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

void seedDefaultProcedures(ProceduralMemory& memory) {
    memory.add("Emergency Food Search", NeedAboveCondition{Need::HUNGER, 0.7}, {Action::SEEK_FOOD}, 0.8);
    memory.add("Fatigue Recovery", NeedAboveCondition{Need::FATIGUE, 0.7}, {Action::REST}, 0.7);
    memory.add("Clear Obstacle", ObstacleBlockingCondition{}, {Action::MOVE_OBJECT}, 0.9);
    memory.add("Emergency Water Search", NeedAboveCondition{Need::THIRST, 0.7}, {Action::DRINK_WATER}, 0.85);
}

} // namespace animus
