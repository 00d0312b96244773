#include "animus/SemanticMemory.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace animus {

SemanticMemory::SemanticMemory(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity == 0) throw std::invalid_argument("SemanticMemory: capacité nulle");
}

void SemanticMemory::addFacts(const std::string& concept_name, const FactMap& facts) {
    auto it = facts_.find(concept_name);
    if (it != facts_.end()) {
        for (const auto& [key, value] : facts) it->second[key] = value;
        return;
    }
    if (facts_.size() >= capacity_) {
        facts_.erase(insertion_order_.front());
        insertion_order_.pop_front();
    }
    facts_.emplace(concept_name, facts);
    insertion_order_.push_back(concept_name);
}

std::optional<FactMap> SemanticMemory::retrieve(const std::string& concept_name) const {
    auto it = facts_.find(concept_name);
    if (it == facts_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string>
SemanticMemory::inferProperty(const std::string& concept_name, const std::string& property) const {
    std::set<std::string> visited;
    std::string current = concept_name;
    while (visited.insert(current).second) {
        auto it = facts_.find(current);
        if (it == facts_.end()) return std::nullopt;
        auto prop = it->second.find(property);
        if (prop != it->second.end()) return prop->second;
        auto parent = it->second.find("is_a");
        if (parent == it->second.end()) return std::nullopt;
        current = parent->second;
    }
    return std::nullopt;   // cycle is_a
}

bool SemanticMemory::hasFact(const std::string& concept_name,
                             const std::string& property,
                             const std::string& value) const {
    auto v = inferProperty(concept_name, property);
    return v && *v == value;
}

void seedDefaultKnowledge(SemanticMemory& memory) {
    memory.addFacts("food", {{"is_a", "resource"}, {"property", "edible"}, {"effect", "reduces_hunger"}});
    memory.addFacts("water", {{"is_a", "resource"}, {"property", "drinkable"}, {"effect", "reduces_thirst"}});
    memory.addFacts("obstacle", {{"is_a", "barrier"}, {"property", "immovable_by_default"},
                                 {"action_needed", "move_object"}});
    memory.addFacts("rest", {{"is_a", "action"}, {"effect", "reduces_fatigue"}, {"context", "safe_place"}});
    memory.addFacts("explore", {{"is_a", "action"}, {"effect", "gains_information"},
                                {"cost", "increases_hunger_fatigue_thirst"}});
    memory.addFacts("shelter", {{"is_a", "structure"}, {"property", "provides_safety"},
                                {"context", "bad_weather"}});
}

} // namespace animus
