/**
 * @file SemanticMemory.hpp
 * @brief Connaissances générales : concept → {propriété → valeur}
 *
 * Inférence simple par héritage "is_a". Capacité bornée, le concept le
 * plus anciennement inséré est évincé en premier.
 */

#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>

namespace animus {

using FactMap = std::map<std::string, std::string>;

class SemanticMemory {
public:
    explicit SemanticMemory(std::size_t capacity = 100);

    /// Ajoute ou complète les faits d'un concept
    void addFacts(const std::string& concept_name, const FactMap& facts);

    [[nodiscard]] std::optional<FactMap> retrieve(const std::string& concept_name) const;

    /// Propriété directe, sinon héritée le long de la chaîne is_a
    [[nodiscard]] std::optional<std::string>
    inferProperty(const std::string& concept_name, const std::string& property) const;

    [[nodiscard]] bool hasFact(const std::string& concept_name,
                               const std::string& property,
                               const std::string& value) const;

    [[nodiscard]] std::size_t size() const { return facts_.size(); }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::map<std::string, FactMap> facts_;
    std::deque<std::string> insertion_order_;
};

/// Faits de base : food, water, obstacle, rest, explore, shelter
void seedDefaultKnowledge(SemanticMemory& memory);

} // namespace animus
