#pragma once
#include "telemetry/telemetry_engine.hpp"
#include <memory>

// One engine bound to config.console_ip, for hosts that only ever talk to a
// single console.
class SingleConsoleClient {
public:
    explicit SingleConsoleClient(const TelemetryConfig& config);

    void start();
    void stop();

    bool is_connected() const;
    Liveness liveness() const;
    std::shared_ptr<FrameSubscription> subscribe() { return engine_.subscribe(); }

    const std::string& console_ip() const { return engine_.config().console_ip; }
    TelemetryEngine& engine() { return engine_; }

private:
    TelemetryEngine engine_;
};
