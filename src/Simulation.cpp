#include "animus/Simulation.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace animus {

nlohmann::json SimulationSummary::toJson() const {
    nlohmann::json j;
    j["ticks"] = ticks;
    j["agents"] = nlohmann::json::array();
    for (const auto& a : agents) {
        nlohmann::json counts;
        for (Action action : ALL_ACTIONS) {
            counts[actionToString(action)] = a.action_counts[actionIndex(action)];
        }
        j["agents"].push_back({
            {"id", a.id},
            {"position", {{"x", a.position.x}, {"y", a.position.y}}},
            {"action_counts", counts},
            {"physiology", {
                {"hunger", a.body.hunger},
                {"fatigue", a.body.fatigue},
                {"thirst", a.body.thirst},
                {"mood", a.body.mood}
            }},
            {"learner", {
                {"epsilon", a.epsilon},
                {"updates", a.learner.updates},
                {"gradient_steps", a.learner.gradient_steps},
                {"target_syncs", a.learner.target_syncs},
                {"last_loss", a.learner.last_loss}
            }},
            {"consciousness", {
                {"transitions", a.consciousness.transitions},
                {"ticks_awake", a.consciousness.ticks_awake},
                {"ticks_asleep", a.consciousness.ticks_asleep},
                {"ticks_focused", a.consciousness.ticks_focused}
            }},
            {"goals", {{"completed", a.goals_completed}, {"total", a.goals_total}}}
        });
    }
    return j;
}

Simulation::Simulation(const AgentConfig& config)
    : config_(config)
    , world_(config.world)
{
    const auto& sim = config_.simulation;
    if (sim.ticks < 0) {
        throw std::invalid_argument("Nombre de ticks négatif");
    }
    if (sim.agent_count < 1) {
        throw std::invalid_argument("Au moins un agent est requis");
    }

    const GridPos center{world_.height() / 2, world_.width() / 2};
    agents_.reserve(static_cast<std::size_t>(sim.agent_count));
    for (int i = 0; i < sim.agent_count; ++i) {
        auto start = world_.randomEmptyCell();
        if (!start) {
            throw std::runtime_error("Aucune cellule libre pour placer l'agent " + std::to_string(i));
        }

        AgentConfig agent_config = config_;
        agent_config.learner.seed = config_.learner.seed + static_cast<std::uint32_t>(i);
        agents_.emplace_back("agent_" + std::to_string(i), agent_config, *start,
                             sim.seed + static_cast<std::uint32_t>(i));

        Agent& agent = agents_.back();
        agent.setQuietMode(sim.quiet);
        agent.seedDefaults(center);
        if (!sim.model_in.empty()) {
            agent.learner().load(sim.model_in);
        }
    }
}

SimulationSummary Simulation::run() {
    const auto& sim = config_.simulation;
    if (!sim.quiet) {
        std::cout << "[Simulation] " << sim.ticks << " ticks, " << agents_.size()
                  << " agent(s), monde " << world_.height() << "x" << world_.width() << std::endl;
    }

    for (int t = 0; t < sim.ticks; ++t) {
        for (auto& agent : agents_) {
            std::vector<GridPos> occupants;
            occupants.reserve(agents_.size());
            for (const auto& other : agents_) occupants.push_back(other.position());
            world_.setOccupants(std::move(occupants));

            TickReport report = agent.tick(world_);
            if (observer_) observer_(report);
        }
        world_.advance();
    }

    if (!sim.model_out.empty() && !agents_.empty()) {
        if (agents_.front().learner().save(sim.model_out)) {
            if (!sim.quiet) {
                std::cout << "[Simulation] Modèle sauvegardé : " << sim.model_out << std::endl;
            }
        } else {
            std::cerr << "[Simulation] Échec de sauvegarde du modèle : " << sim.model_out << std::endl;
        }
    }
    return summarize(sim.ticks);
}

SimulationSummary Simulation::summarize(int ticks) const {
    SimulationSummary summary;
    summary.ticks = ticks;
    for (const auto& agent : agents_) {
        AgentSummary a;
        a.id = agent.id();
        a.position = agent.position();
        a.action_counts = agent.actionCounts();
        a.body = agent.body().snapshot();
        a.epsilon = agent.learner().getEpsilon();
        a.learner = agent.learner().getStats();
        a.consciousness = agent.consciousness().getStats();
        a.goals_total = agent.goals().size();
        a.goals_completed = agent.goals().size() - agent.goals().activeCount();
        summary.agents.push_back(std::move(a));
    }
    return summary;
}

bool Simulation::writeSummary(const SimulationSummary& summary) const {
    namespace fs = std::filesystem;
    const fs::path dir(config_.simulation.output_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[Simulation] Impossible de créer " << dir << " : " << ec.message() << std::endl;
        return false;
    }

    const fs::path path = dir / "summary.json";
    std::ofstream out(path);
    if (!out) {
        std::cerr << "[Simulation] Impossible d'écrire " << path << std::endl;
        return false;
    }
    out << summary.toJson().dump(2) << std::endl;
    if (!config_.simulation.quiet) {
        std::cout << "[Simulation] Résumé écrit : " << path << std::endl;
    }
    return true;
}

} // namespace animus
