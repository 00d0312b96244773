/**
 * @file ConsciousnessMode.hpp
 * @brief Modes de conscience, focus attentionnel et étapes de décision
 */
#pragma once

#include <string>

namespace animus {

/**
 * États de conscience d'un agent
 */
enum class ConsciousnessMode {
    AWAKE,      // Veille, délibération par défaut
    ASLEEP,     // Sommeil, seule action possible : rest
    FOCUSED     // Attention focalisée sur un besoin ou un objectif
};

/**
 * Mode de décision transmis à l'arbitre
 */
enum class DecisionMode {
    REACTIVE,
    DELIBERATIVE
};

/**
 * Cible de l'attention en mode focalisé
 */
enum class AttentionFocus {
    NONE,
    FOOD,
    WATER,
    REST,
    LOCATION_TARGET,
    OBSTACLE,
    CURIOSITY
};

inline std::string consciousnessModeToString(ConsciousnessMode mode) {
    switch (mode) {
        case ConsciousnessMode::AWAKE:   return "AWAKE";
        case ConsciousnessMode::ASLEEP:  return "ASLEEP";
        case ConsciousnessMode::FOCUSED: return "FOCUSED";
        default: return "UNKNOWN";
    }
}

inline std::string decisionModeToString(DecisionMode mode) {
    return mode == DecisionMode::REACTIVE ? "REACTIVE" : "DELIBERATIVE";
}

inline std::string attentionFocusToString(AttentionFocus focus) {
    switch (focus) {
        case AttentionFocus::NONE:            return "NONE";
        case AttentionFocus::FOOD:            return "FOOD";
        case AttentionFocus::WATER:           return "WATER";
        case AttentionFocus::REST:            return "REST";
        case AttentionFocus::LOCATION_TARGET: return "LOCATION_TARGET";
        case AttentionFocus::OBSTACLE:        return "OBSTACLE";
        case AttentionFocus::CURIOSITY:       return "CURIOSITY";
        default: return "UNKNOWN";
    }
}

inline bool isAwake(ConsciousnessMode mode) {
    return mode != ConsciousnessMode::ASLEEP;
}

} // namespace animus
