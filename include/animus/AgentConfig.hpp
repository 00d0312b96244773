/**
 * @file AgentConfig.hpp
 * @brief Configuration de l'agent, de l'apprenant et de la simulation
 *
 * Toutes les valeurs par défaut correspondent au comportement de référence.
 * Le fichier JSON (config/agent_config.json) ne surcharge que les clés
 * présentes, section par section.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace animus {

// ═══════════════════════════════════════════════════════════════════════════
// PHYSIOLOGIE
// ═══════════════════════════════════════════════════════════════════════════

struct PhysiologyConfig {
    double hunger_rate = 0.10;           // Hausse de la faim par tick
    double fatigue_rate = 0.05;          // Hausse de la fatigue par tick
    double thirst_rate = 0.07;           // Hausse de la soif par tick
    double night_time_scale = 1.5;       // Multiplicateur nocturne
    double initial_hunger = 0.0;
    double initial_fatigue = 0.0;
    double initial_thirst = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════
// APPRENANT (DQN)
// ═══════════════════════════════════════════════════════════════════════════

struct LearnerConfig {
    std::size_t state_size = 3;                  // (hunger, fatigue, thirst)
    std::vector<int> hidden_sizes = {64, 128};   // Couches cachées ReLU
    double learning_rate = 0.001;                // Adam
    double gamma = 0.99;                         // Facteur d'actualisation
    double epsilon = 1.0;                        // Exploration initiale
    double epsilon_min = 0.01;
    double epsilon_decay = 0.995;                // Appliqué à chaque update()
    std::size_t buffer_capacity = 10000;
    std::size_t batch_size = 64;
    std::size_t target_sync_interval = 100;      // Copie policy → target
    std::uint32_t seed = 42;
};

// ═══════════════════════════════════════════════════════════════════════════
// ARBITRAGE
// ═══════════════════════════════════════════════════════════════════════════

struct ArbiterConfig {
    double critical_threshold = 0.85;            // Surcharges critiques
    double procedural_threshold_reactive = 0.7;  // Priorité min. procédure (réactif)
    double procedural_threshold_deliberative = 0.9;
    double maintain_suggest_ratio = 0.8;         // Action dès need >= ratio * seuil
    double memory_need_threshold = 0.6;          // Raffinement mémoire
    int working_memory_window = 3;               // Ticks de rappel
    double curiosity_threshold = 0.6;
    double curiosity_need_ceiling = 0.7;
    double rain_rest_fatigue_ceiling = 0.8;
    double rain_redirect_probability = 0.5;
    double social_hunger_threshold = 0.5;
};

// ═══════════════════════════════════════════════════════════════════════════
// CONSCIENCE
// ═══════════════════════════════════════════════════════════════════════════

struct ConsciousnessConfig {
    double sleep_fatigue = 0.9;          // Awake/Focused → Asleep si fatigue >
    double wake_fatigue = 0.2;           // Asleep → Awake si fatigue <
    double focus_need = 0.7;             // Awake → Focused si un besoin >
    double focus_goal_priority = 0.9;    // ... ou priorité d'objectif >=
    double reactive_need = 0.8;          // Mode réactif si un besoin >
    double focus_perception_boost = 0.3;
    double focus_resource_need = 0.3;    // Raffinement focalisé
    int focus_recall_window = 5;

    double asleep_rest_fatigue = 0.7;    // Repos demandé pendant le sommeil
    double asleep_rest_reward = 0.6;
    double asleep_partial_fatigue = 0.2; // Toute autre demande
    double asleep_partial_reward = 0.1;
};

// ═══════════════════════════════════════════════════════════════════════════
// MÉMOIRE / PERCEPTION / OBJECTIFS / RÉCOMPENSE
// ═══════════════════════════════════════════════════════════════════════════

struct MemoryConfig {
    std::size_t episodic_capacity = 1000;
    std::size_t semantic_capacity = 100;
    std::size_t procedural_capacity = 50;
    std::size_t working_capacity = 5;
};

struct PerceptionConfig {
    int radius = 2;
    double accuracy = 0.9;
};

struct GoalGeneratorConfig {
    int cooldown_ticks = 10;
    double need_threshold = 0.6;
    double need_goal_priority = 0.75;
    double need_goal_threshold = 0.3;
    int need_goal_duration = 5;
    double curiosity_threshold = 0.7;
    double explore_goal_priority = 0.3;
};

struct RewardShaperConfig {
    double high_mood = 0.7;
    double low_mood = 0.3;
    double high_mood_positive = 1.2;
    double high_mood_negative = 0.8;
    double low_mood_positive = 0.7;
    double low_mood_negative = 1.3;
};

// ═══════════════════════════════════════════════════════════════════════════
// MONDE / SIMULATION / TÉLÉMÉTRIE
// ═══════════════════════════════════════════════════════════════════════════

struct WorldConfig {
    int width = 10;
    int height = 10;
    int obstacle_count = 8;
    int food_count = 5;
    int water_count = 3;
    double food_respawn_probability = 0.3;
    int day_night_cycle = 24;            // Ticks par cycle jour/nuit
    double weather_change_probability = 0.1;
    std::uint32_t seed = 7;
};

struct SimulationConfig {
    int ticks = 100;
    int agent_count = 1;
    std::string output_dir = ".";
    std::string model_in;                // Vide = réseau neuf
    std::string model_out;               // Vide = pas de sauvegarde
    std::uint32_t seed = 42;
    bool quiet = false;
};

struct RabbitMQConfig {
    bool enabled = false;
    std::string host = "localhost";
    int port = 5672;
    std::string user = "guest";
    std::string password = "guest";
    std::string exchange = "animus.agent.ticks";
    std::string routing_key = "agent.tick";
};

/**
 * @brief Configuration complète d'une exécution
 */
struct AgentConfig {
    PhysiologyConfig physiology;
    LearnerConfig learner;
    ArbiterConfig arbiter;
    ConsciousnessConfig consciousness;
    MemoryConfig memory;
    PerceptionConfig perception;
    GoalGeneratorConfig goal_generator;
    RewardShaperConfig reward;
    WorldConfig world;
    SimulationConfig simulation;
    RabbitMQConfig rabbitmq;
};

/**
 * @brief Charge un fichier JSON dans cfg
 *
 * Les clés absentes gardent leur valeur courante. Une section mal typée est
 * ignorée (message sur std::cerr) sans invalider les autres.
 * @return false si le fichier est absent ou n'est pas du JSON valide
 */
bool loadConfig(const std::string& path, AgentConfig& cfg);

} // namespace animus
