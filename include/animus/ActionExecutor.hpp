/**
 * @file ActionExecutor.hpp
 * @brief Exécution d'une action dans l'environnement et récompense brute
 */
#pragma once

#include "animus/Environment.hpp"
#include "animus/Perception.hpp"
#include "animus/PhysiologicalState.hpp"
#include "animus/Types.hpp"

#include <optional>
#include <string>

namespace animus {

struct ActionOutcome {
    std::optional<Action> action;   // Absent si l'action demandée est inconnue
    double reward = 0.0;            // Récompense brute, avant modulation par l'humeur
    bool success = false;
};

class ActionExecutor {
public:
    ActionExecutor() = default;

    /**
     * @brief Exécute action depuis position
     *
     * position est mise à jour si le déplacement réussit, les besoins sont
     * modifiés selon l'effet de l'action.
     * @param target Obstacle visé par MOVE_OBJECT (sinon le plus proche adjacent)
     */
    ActionOutcome execute(Action action,
                          const std::optional<GridPos>& target,
                          GridPos& position,
                          PhysiologicalState& body,
                          Environment& env,
                          const Perception& perception) const;

    /// Variante par nom ; un nom inconnu ne fait rien et coûte -0.2
    ActionOutcome executeNamed(const std::string& name,
                               GridPos& position,
                               PhysiologicalState& body,
                               Environment& env,
                               const Perception& perception) const;

private:
    ActionOutcome moveObject(const std::optional<GridPos>& target,
                             const GridPos& position,
                             Environment& env,
                             const Perception& perception) const;
};

} // namespace animus
