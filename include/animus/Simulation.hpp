/**
 * @file Simulation.hpp
 * @brief Boucle de simulation : nombre fixe de ticks, agents séquentiels
 *
 * À chaque tick, tous les agents sont traités dans l'ordre avant que le
 * monde n'avance. Aucun verrou : tout l'état est local à la boucle.
 */
#pragma once

#include "animus/Agent.hpp"
#include "animus/AgentConfig.hpp"
#include "animus/GridWorld.hpp"
#include "animus/TickReport.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace animus {

/// Appelé après chaque tick d'agent (télémétrie, tests)
using TickObserver = std::function<void(const TickReport&)>;

struct AgentSummary {
    std::string id;
    GridPos position;
    std::array<int, ACTION_COUNT> action_counts{};
    PhysiologySnapshot body;
    double epsilon = 0.0;
    LearnerStats learner;
    ConsciousnessMachine::Stats consciousness;
    std::size_t goals_completed = 0;
    std::size_t goals_total = 0;
};

struct SimulationSummary {
    int ticks = 0;
    std::vector<AgentSummary> agents;

    [[nodiscard]] nlohmann::json toJson() const;
};

class Simulation {
public:
    /// @throws std::invalid_argument si ticks < 0 ou agent_count < 1
    explicit Simulation(const AgentConfig& config);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    void setTickObserver(TickObserver observer) { observer_ = std::move(observer); }

    /// Exécute tous les ticks, sauvegarde le modèle si demandé
    SimulationSummary run();

    /// Écrit summary.json dans output_dir
    bool writeSummary(const SimulationSummary& summary) const;

    [[nodiscard]] GridWorld& world() { return world_; }
    [[nodiscard]] std::vector<Agent>& agents() { return agents_; }
    [[nodiscard]] const AgentConfig& getConfig() const { return config_; }

private:
    [[nodiscard]] SimulationSummary summarize(int ticks) const;

    AgentConfig config_;
    GridWorld world_;
    std::vector<Agent> agents_;
    TickObserver observer_;
};

} // namespace animus
