#include "animus/StatePublisher.hpp"

#include <iostream>

namespace animus {

StatePublisher::StatePublisher(const RabbitMQConfig& config)
    : config_(config)
{
}

bool StatePublisher::connect() {
    if (disabled_) return false;
    try {
        AmqpClient::Channel::OpenOpts opts;
        opts.host = config_.host;
        opts.port = config_.port;
        opts.auth = AmqpClient::Channel::OpenOpts::BasicAuth{config_.user, config_.password};

        channel_ = AmqpClient::Channel::Open(opts);
        channel_->DeclareExchange(
            config_.exchange,
            AmqpClient::Channel::EXCHANGE_TYPE_TOPIC,
            false, true, false
        );

        std::cout << "[Publisher] Connecté à " << config_.host << ":" << config_.port
                  << " (exchange " << config_.exchange << ")" << std::endl;
        return true;

    } catch (const std::exception& e) {
        disable("connexion", e);
        return false;
    }
}

bool StatePublisher::publish(const TickReport& report) {
    if (!isActive()) return false;
    try {
        std::string body = report.toJson().dump();
        channel_->BasicPublish(
            config_.exchange,
            config_.routing_key,
            AmqpClient::BasicMessage::Create(body),
            false, false
        );
        published_++;
        return true;

    } catch (const std::exception& e) {
        disable("publication", e);
        return false;
    }
}

void StatePublisher::disable(const char* context, const std::exception& e) {
    std::cerr << "[Publisher] Erreur RabbitMQ (" << context << "): " << e.what()
              << " - télémétrie désactivée" << std::endl;
    disabled_ = true;
    channel_.reset();
}

} // namespace animus
