/**
 * @file StatePublisher.hpp
 * @brief Publication des rapports de tick sur un exchange RabbitMQ (topic)
 *
 * Toute erreur de connexion ou de publication est journalisée une fois,
 * puis le publieur se désactive : la simulation continue sans télémétrie.
 */
#pragma once

#include "animus/AgentConfig.hpp"
#include "animus/TickReport.hpp"

#include <SimpleAmqpClient/SimpleAmqpClient.h>

#include <cstddef>

namespace animus {

class StatePublisher {
public:
    explicit StatePublisher(const RabbitMQConfig& config);

    /// Ouvre le channel et déclare l'exchange
    bool connect();

    /// Publie un rapport ; sans effet si le publieur est désactivé
    bool publish(const TickReport& report);

    [[nodiscard]] bool isActive() const { return channel_ != nullptr && !disabled_; }
    [[nodiscard]] std::size_t publishedCount() const { return published_; }

private:
    void disable(const char* context, const std::exception& e);

    RabbitMQConfig config_;
    AmqpClient::Channel::ptr_t channel_;
    bool disabled_ = false;
    std::size_t published_ = 0;
};

} // namespace animus
