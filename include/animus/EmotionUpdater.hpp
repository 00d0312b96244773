/**
 * @file EmotionUpdater.hpp
 * @brief Mise à jour des émotions de base à partir des besoins et du contexte
 *
 * Quatre émotions dans [0, 1] :
 *   - joy         : nourriture visible, décroît avec la faim
 *   - fear        : nuit ou tempête
 *   - frustration : proportionnelle à la moyenne des besoins
 *   - curiosity   : élevée quand tous les besoins sont satisfaits
 */

#pragma once

#include "animus/PhysiologicalState.hpp"
#include "animus/Types.hpp"

namespace animus {

struct EmotionState {
    double joy = 0.5;
    double fear = 0.0;
    double frustration = 0.0;
    double curiosity = 0.5;

    /// Intensité maximale, utilisée comme poids émotionnel épisodique
    [[nodiscard]] double salience() const;
};

/**
 * @brief Contexte perçu qui influence les émotions
 */
struct EmotionContext {
    bool food_in_sight = false;
    TimeOfDay time_of_day = TimeOfDay::DAY;
    Weather weather = Weather::SUNNY;
};

class EmotionUpdater {
public:
    EmotionUpdater() = default;

    void update(EmotionState& emotions,
                const PhysiologySnapshot& body,
                const EmotionContext& context) const;
};

} // namespace animus
