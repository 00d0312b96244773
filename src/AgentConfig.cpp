#include "animus/AgentConfig.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

namespace animus {

using json = nlohmann::json;

namespace {

// Applique la section sur une copie : une erreur de type laisse la cible intacte
template <typename Section, typename Fn>
void loadSection(const json& root, const char* name, Section& target, Fn&& apply) {
    if (!root.contains(name)) return;
    try {
        Section copy = target;
        apply(root.at(name), copy);
        target = copy;
    } catch (const json::exception& e) {
        std::cerr << "[Config] Section '" << name << "' ignorée: " << e.what() << "\n";
    }
}

} // namespace

bool loadConfig(const std::string& path, AgentConfig& cfg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Fichier introuvable: " << path
                  << " (valeurs par défaut)\n";
        return false;
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] JSON invalide dans " << path << ": " << e.what() << "\n";
        return false;
    }

    loadSection(root, "physiology", cfg.physiology, [](const json& j, auto& c) {
        c.hunger_rate = j.value("hunger_rate", c.hunger_rate);
        c.fatigue_rate = j.value("fatigue_rate", c.fatigue_rate);
        c.thirst_rate = j.value("thirst_rate", c.thirst_rate);
        c.night_time_scale = j.value("night_time_scale", c.night_time_scale);
        c.initial_hunger = j.value("initial_hunger", c.initial_hunger);
        c.initial_fatigue = j.value("initial_fatigue", c.initial_fatigue);
        c.initial_thirst = j.value("initial_thirst", c.initial_thirst);
    });

    loadSection(root, "learner", cfg.learner, [](const json& j, auto& c) {
        c.state_size = j.value("state_size", c.state_size);
        c.hidden_sizes = j.value("hidden_sizes", c.hidden_sizes);
        c.learning_rate = j.value("learning_rate", c.learning_rate);
        c.gamma = j.value("gamma", c.gamma);
        c.epsilon = j.value("epsilon", c.epsilon);
        c.epsilon_min = j.value("epsilon_min", c.epsilon_min);
        c.epsilon_decay = j.value("epsilon_decay", c.epsilon_decay);
        c.buffer_capacity = j.value("buffer_capacity", c.buffer_capacity);
        c.batch_size = j.value("batch_size", c.batch_size);
        c.target_sync_interval = j.value("target_sync_interval", c.target_sync_interval);
        c.seed = j.value("seed", c.seed);
    });

    loadSection(root, "arbiter", cfg.arbiter, [](const json& j, auto& c) {
        c.critical_threshold = j.value("critical_threshold", c.critical_threshold);
        c.procedural_threshold_reactive =
            j.value("procedural_threshold_reactive", c.procedural_threshold_reactive);
        c.procedural_threshold_deliberative =
            j.value("procedural_threshold_deliberative", c.procedural_threshold_deliberative);
        c.maintain_suggest_ratio = j.value("maintain_suggest_ratio", c.maintain_suggest_ratio);
        c.memory_need_threshold = j.value("memory_need_threshold", c.memory_need_threshold);
        c.working_memory_window = j.value("working_memory_window", c.working_memory_window);
        c.curiosity_threshold = j.value("curiosity_threshold", c.curiosity_threshold);
        c.curiosity_need_ceiling = j.value("curiosity_need_ceiling", c.curiosity_need_ceiling);
        c.rain_rest_fatigue_ceiling = j.value("rain_rest_fatigue_ceiling", c.rain_rest_fatigue_ceiling);
        c.rain_redirect_probability = j.value("rain_redirect_probability", c.rain_redirect_probability);
        c.social_hunger_threshold = j.value("social_hunger_threshold", c.social_hunger_threshold);
    });

    loadSection(root, "consciousness", cfg.consciousness, [](const json& j, auto& c) {
        c.sleep_fatigue = j.value("sleep_fatigue", c.sleep_fatigue);
        c.wake_fatigue = j.value("wake_fatigue", c.wake_fatigue);
        c.focus_need = j.value("focus_need", c.focus_need);
        c.focus_goal_priority = j.value("focus_goal_priority", c.focus_goal_priority);
        c.reactive_need = j.value("reactive_need", c.reactive_need);
        c.focus_perception_boost = j.value("focus_perception_boost", c.focus_perception_boost);
        c.focus_resource_need = j.value("focus_resource_need", c.focus_resource_need);
        c.focus_recall_window = j.value("focus_recall_window", c.focus_recall_window);
        c.asleep_rest_fatigue = j.value("asleep_rest_fatigue", c.asleep_rest_fatigue);
        c.asleep_rest_reward = j.value("asleep_rest_reward", c.asleep_rest_reward);
        c.asleep_partial_fatigue = j.value("asleep_partial_fatigue", c.asleep_partial_fatigue);
        c.asleep_partial_reward = j.value("asleep_partial_reward", c.asleep_partial_reward);
    });

    loadSection(root, "memory", cfg.memory, [](const json& j, auto& c) {
        c.episodic_capacity = j.value("episodic_capacity", c.episodic_capacity);
        c.semantic_capacity = j.value("semantic_capacity", c.semantic_capacity);
        c.procedural_capacity = j.value("procedural_capacity", c.procedural_capacity);
        c.working_capacity = j.value("working_capacity", c.working_capacity);
    });

    loadSection(root, "perception", cfg.perception, [](const json& j, auto& c) {
        c.radius = j.value("radius", c.radius);
        c.accuracy = j.value("accuracy", c.accuracy);
    });

    loadSection(root, "goal_generator", cfg.goal_generator, [](const json& j, auto& c) {
        c.cooldown_ticks = j.value("cooldown_ticks", c.cooldown_ticks);
        c.need_threshold = j.value("need_threshold", c.need_threshold);
        c.need_goal_priority = j.value("need_goal_priority", c.need_goal_priority);
        c.need_goal_threshold = j.value("need_goal_threshold", c.need_goal_threshold);
        c.need_goal_duration = j.value("need_goal_duration", c.need_goal_duration);
        c.curiosity_threshold = j.value("curiosity_threshold", c.curiosity_threshold);
        c.explore_goal_priority = j.value("explore_goal_priority", c.explore_goal_priority);
    });

    loadSection(root, "reward", cfg.reward, [](const json& j, auto& c) {
        c.high_mood = j.value("high_mood", c.high_mood);
        c.low_mood = j.value("low_mood", c.low_mood);
        c.high_mood_positive = j.value("high_mood_positive", c.high_mood_positive);
        c.high_mood_negative = j.value("high_mood_negative", c.high_mood_negative);
        c.low_mood_positive = j.value("low_mood_positive", c.low_mood_positive);
        c.low_mood_negative = j.value("low_mood_negative", c.low_mood_negative);
    });

    loadSection(root, "world", cfg.world, [](const json& j, auto& c) {
        c.width = j.value("width", c.width);
        c.height = j.value("height", c.height);
        c.obstacle_count = j.value("obstacle_count", c.obstacle_count);
        c.food_count = j.value("food_count", c.food_count);
        c.water_count = j.value("water_count", c.water_count);
        c.food_respawn_probability = j.value("food_respawn_probability", c.food_respawn_probability);
        c.day_night_cycle = j.value("day_night_cycle", c.day_night_cycle);
        c.weather_change_probability =
            j.value("weather_change_probability", c.weather_change_probability);
        c.seed = j.value("seed", c.seed);
    });

    loadSection(root, "simulation", cfg.simulation, [](const json& j, auto& c) {
        c.ticks = j.value("ticks", c.ticks);
        c.agent_count = j.value("agent_count", c.agent_count);
        c.output_dir = j.value("output_dir", c.output_dir);
        c.model_in = j.value("model_in", c.model_in);
        c.model_out = j.value("model_out", c.model_out);
        c.seed = j.value("seed", c.seed);
        c.quiet = j.value("quiet", c.quiet);
    });

    loadSection(root, "rabbitmq", cfg.rabbitmq, [](const json& j, auto& c) {
        c.enabled = j.value("enabled", c.enabled);
        c.host = j.value("host", c.host);
        c.port = j.value("port", c.port);
        c.user = j.value("user", c.user);
        c.password = j.value("password", c.password);
        c.exchange = j.value("exchange", c.exchange);
        c.routing_key = j.value("routing_key", c.routing_key);
    });

    return true;
}

} // namespace animus
