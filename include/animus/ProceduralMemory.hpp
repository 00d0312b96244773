/**
 * @file ProceduralMemory.hpp
 * @brief Habitudes condition → action avec confiance apprise
 *
 * La priorité de base n'est jamais modifiée. La priorité effective est
 * ×1.1 (plafonnée à 1) si les succès dominent, ×0.8 si les échecs dominent.
 */

#pragma once

#include "animus/Types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace animus {

struct AgentView;

// ═══════════════════════════════════════════════════════════════════════════
// CONDITIONS
// ═══════════════════════════════════════════════════════════════════════════

struct NeedAboveCondition {
    Need need = Need::HUNGER;
    double threshold = 0.7;        // Déclenché si besoin >= seuil
};

struct ResourceInSightCondition {
    CellContent resource = CellContent::FOOD;
    Need need = Need::HUNGER;
    double min_need = 0.5;         // ... et besoin associé > min_need
};

/// Obstacle adjacent sur le chemin d'un objectif de localisation actif
struct ObstacleBlockingCondition {};

using ProcedureCondition = std::variant<NeedAboveCondition, ResourceInSightCondition, ObstacleBlockingCondition>;

std::string describeCondition(const ProcedureCondition& condition);

// ═══════════════════════════════════════════════════════════════════════════
// PROCÉDURES
// ═══════════════════════════════════════════════════════════════════════════

struct Procedure {
    std::string id;
    std::string name;
    ProcedureCondition condition;
    std::vector<Action> action_sequence;
    double base_priority = 0.5;
    int success_count = 0;
    int failure_count = 0;
    int last_triggered_tick = -1;

    [[nodiscard]] double effectivePriority() const;
};

struct ProcedureMatch {
    std::string procedure_id;
    Action action = Action::REST;      // Première action de la séquence
    double priority = 0.0;             // Priorité effective
};

class ProceduralMemory {
public:
    explicit ProceduralMemory(std::size_t capacity = 50);

    /**
     * @brief Ajoute une procédure, évince la plus faible priorité de base si plein
     * @return Identifiant "proc_N"
     * @throws std::invalid_argument si la séquence d'actions est vide
     */
    std::string add(const std::string& name,
                    const ProcedureCondition& condition,
                    const std::vector<Action>& action_sequence,
                    double priority);

    /// Procédure satisfaite de plus forte priorité effective
    [[nodiscard]] std::optional<ProcedureMatch> matching(const AgentView& view) const;

    [[nodiscard]] bool conditionHolds(const ProcedureCondition& condition, const AgentView& view) const;

    bool recordOutcome(const std::string& id, bool success);
    void markTriggered(const std::string& id, int tick);

    [[nodiscard]] const Procedure* find(const std::string& id) const;
    [[nodiscard]] const std::vector<Procedure>& all() const { return procedures_; }
    [[nodiscard]] std::size_t size() const { return procedures_.size(); }

private:
    Procedure* findMutable(const std::string& id);

    std::size_t capacity_;
    std::vector<Procedure> procedures_;
    int next_id_ = 0;
};

/// Recherche de nourriture, récupération, dégagement d'obstacle, recherche d'eau
void seedDefaultProcedures(ProceduralMemory& memory);

} // namespace animus
