/**
 * @file main.cpp
 * @brief Point d'entrée de la simulation Animus
 *
 * Charge la configuration JSON, applique les options de ligne de commande,
 * exécute un nombre fixe de ticks et écrit le résumé JSON. Les rapports de
 * tick peuvent être publiés sur RabbitMQ (--publish).
 */

#include "animus/AgentConfig.hpp"
#include "animus/Simulation.hpp"
#include "animus/StatePublisher.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace animus;

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -h, --help            Affiche cette aide\n"
              << "  -c, --config <file>   Fichier de configuration JSON (défaut: config/agent_config.json)\n"
              << "  --ticks <n>           Nombre de ticks (défaut: 100)\n"
              << "  --agents <n>          Nombre d'agents (défaut: 1)\n"
              << "  --seed <n>            Graine de la simulation\n"
              << "  --model-in <file>     Modèle DQN à charger\n"
              << "  --model-out <file>    Sauvegarde du modèle DQN en fin de simulation\n"
              << "  --output <dir>        Répertoire du résumé JSON (défaut: .)\n"
              << "  --publish             Publie chaque tick sur RabbitMQ\n"
              << "  --host <host>         Hôte RabbitMQ (défaut: localhost)\n"
              << "  --port <port>         Port RabbitMQ (défaut: 5672)\n"
              << "  --user <user>         Utilisateur RabbitMQ (défaut: guest)\n"
              << "  --pass <password>     Mot de passe RabbitMQ\n"
              << "  --quiet               Désactive les logs de simulation\n"
              << "\n";
}

int main(int argc, char* argv[]) {
    AgentConfig config;
    std::string config_file = "config/agent_config.json";

    // Premier passage : fichier de configuration
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        }
    }

    if (std::ifstream(config_file).good()) {
        if (loadConfig(config_file, config)) {
            std::cout << "[Main] Configuration chargée : " << config_file << std::endl;
        }
    } else {
        std::cout << "[Main] Fichier config non trouvé, utilisation des valeurs par défaut" << std::endl;
    }

    try {
        // Second passage : les options surchargent le fichier
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "-c" || arg == "--config") {
                ++i;
            } else if (arg == "--ticks" && has_value) {
                config.simulation.ticks = std::stoi(argv[++i]);
            } else if (arg == "--agents" && has_value) {
                config.simulation.agent_count = std::stoi(argv[++i]);
            } else if (arg == "--seed" && has_value) {
                config.simulation.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--model-in" && has_value) {
                config.simulation.model_in = argv[++i];
            } else if (arg == "--model-out" && has_value) {
                config.simulation.model_out = argv[++i];
            } else if (arg == "--output" && has_value) {
                config.simulation.output_dir = argv[++i];
            } else if (arg == "--publish") {
                config.rabbitmq.enabled = true;
            } else if (arg == "--host" && has_value) {
                config.rabbitmq.host = argv[++i];
            } else if (arg == "--port" && has_value) {
                config.rabbitmq.port = std::stoi(argv[++i]);
            } else if (arg == "--user" && has_value) {
                config.rabbitmq.user = argv[++i];
            } else if (arg == "--pass" && has_value) {
                config.rabbitmq.password = argv[++i];
            } else if (arg == "--quiet") {
                config.simulation.quiet = true;
            } else {
                std::cerr << "[Main] Option inconnue ignorée : " << arg << std::endl;
            }
        }

        Simulation simulation(config);

        std::unique_ptr<StatePublisher> publisher;
        if (config.rabbitmq.enabled) {
            publisher = std::make_unique<StatePublisher>(config.rabbitmq);
            if (publisher->connect()) {
                simulation.setTickObserver([&publisher](const TickReport& report) {
                    publisher->publish(report);
                });
            }
        }

        SimulationSummary summary = simulation.run();
        if (!simulation.writeSummary(summary)) {
            return 1;
        }

        if (publisher) {
            std::cout << "[Main] Rapports publiés : " << publisher->publishedCount() << std::endl;
        }

        if (!config.simulation.quiet) {
            for (const auto& agent : summary.agents) {
                std::cout << "[Main] " << agent.id << " :";
                for (Action action : ALL_ACTIONS) {
                    std::cout << " " << actionToString(action) << "=" << agent.action_counts[actionIndex(action)];
                }
                std::cout << std::endl;
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "[Main] Erreur fatale : " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
