#pragma once
#include "config/constants.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct TelemetryConfig {
    // Primary console
    std::string console_ip = "192.168.1.30";
    uint16_t port = Constants::GT7_PORT;

    // Liveness threshold in seconds
    uint64_t timeout_s = 5;

    // Heartbeat cadence
    uint64_t heartbeat_interval_ms = 100;

    // Fan-out tap and log sink
    bool enable_logging = false;
    std::optional<std::string> log_file_path;

    // Tuning
    uint64_t monitor_interval_ms = Constants::MONITOR_INTERVAL_MS;
    size_t channel_capacity = Constants::CHANNEL_CAPACITY;
};

enum class GamepadBackend {
    Auto,
    Sim,
    ViGEm,
    MacSimulation,
    MacIOKit,
    MacDriverKit
};

struct GamepadConfig {
    GamepadBackend backend = GamepadBackend::Auto;
    std::string vigem_library = Constants::VIGEM_LIBRARY;
};

struct BridgeConfig {
    // Logging
    bool verbose = false;

    TelemetryConfig telemetry;
    std::vector<std::string> extra_peers;

    bool enable_gamepad = true;
    GamepadConfig gamepad;
};

const char* to_string(GamepadBackend backend);
std::optional<GamepadBackend> parse_gamepad_backend(const std::string& name);
