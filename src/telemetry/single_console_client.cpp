#include "telemetry/single_console_client.hpp"

SingleConsoleClient::SingleConsoleClient(const TelemetryConfig& config) : engine_(config) {
    engine_.add_peer(config.console_ip, config.port);
}

void SingleConsoleClient::start() {
    engine_.start();
}

void SingleConsoleClient::stop() {
    engine_.stop();
}

bool SingleConsoleClient::is_connected() const {
    return liveness() == Liveness::Live;
}

Liveness SingleConsoleClient::liveness() const {
    auto status = engine_.status();
    auto it = status.find(engine_.config().console_ip);
    return it == status.end() ? Liveness::Unknown : it->second;
}
