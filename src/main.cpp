#include "config/constants.hpp"
#include "config/config.hpp"
#include "utils/logging.hpp"
#include "utils/signal_handler.hpp"
#include "telemetry/telemetry_engine.hpp"
#include "telemetry/telemetry_error.hpp"
#include "gamepad/gamepad_error.hpp"
#include "gamepad/vgamepad_client.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --console <ip>       primary console (default 192.168.1.30)\n"
              << "  --peer <ip>          additional console, repeatable\n"
              << "  --port <n>           console telemetry port (default 33740)\n"
              << "  --timeout <s>        staleness threshold (default 5)\n"
              << "  --heartbeat <ms>     heartbeat interval (default 100)\n"
              << "  --log-file <path>    mirror the log to a file\n"
              << "  --tap                log a summary of every frame\n"
              << "  --gamepad <backend>  auto, sim, vigem, mac-sim, mac-iokit, mac-driverkit\n"
              << "  --no-gamepad         do not create a virtual controller\n"
              << "  --verbose            debug logging\n";
}

bool parse_number(const char* flag, const char* text, uint64_t max, uint64_t& out) {
    char* end = nullptr;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (text[0] == '\0' || text[0] == '-' || *end != '\0' || value > max) {
        std::cerr << TelemetryError::config_error(flag, text, "expected an integer in 0-" + std::to_string(max)).what()
                  << "\n";
        return false;
    }
    out = value;
    return true;
}

// Mirrors the primary console's pedals onto the virtual controller triggers.
void bridge_thread_main(std::shared_ptr<FrameSubscription> frames, DS4Controller* controller,
                        const std::string& console_ip, std::atomic<bool>& running) {
    int error_counter = 0;
    while (running.load()) {
        std::optional<TelemetryEvent> event = frames->recv(std::chrono::milliseconds(100));
        if (!event) {
            if (frames->closed()) break;
            continue;
        }
        if (event->peer_ip != console_ip) continue;

        const EngineInfo& engine = event->frame.car.engine;
        try {
            controller->set_right_trigger(engine.throttle);
            controller->set_left_trigger(engine.brake);
        } catch (const GamepadError& e) {
            if ((error_counter++ % Constants::WARN_EVERY_N) == 0) {
                Logger::warn(std::string("Controller update failed: ") + e.what());
            }
            if (!e.is_recoverable()) {
                Logger::error("Virtual controller lost, shutting down");
                SignalHandler::request_exit();
                return;
            }
        }
    }
}

void status_thread_main(TelemetryEngine& engine, std::atomic<bool>& running) {
    int status_counter = 0;
    uint64_t last_frames = 0;

    while (running.load()) {
        for (int i = 0; i < 50 && running.load(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!running.load()) break;

        int live = 0, stale = 0;
        for (const auto& entry : engine.status()) {
            if (entry.second == Liveness::Live) live++;
            if (entry.second == Liveness::Stale) stale++;
        }
        uint64_t frames = engine.frames_received();

        if ((++status_counter % 6) == 0 || frames != last_frames || stale > 0) {
            Logger::info("Status: " + std::to_string(live) + " live, " + std::to_string(stale) + " stale, " +
                         std::to_string(frames) + " frames, " + std::to_string(engine.frames_dropped()) +
                         " dropped");
        }
        last_frames = frames;
    }
}

}

int main(int argc, char** argv) {
    BridgeConfig config;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        uint64_t value = 0;
        if (std::strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
            Logger::set_verbose(true);
        } else if (std::strcmp(argv[i], "--console") == 0 && i + 1 < argc) {
            config.telemetry.console_ip = argv[++i];
        } else if (std::strcmp(argv[i], "--peer") == 0 && i + 1 < argc) {
            config.extra_peers.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            if (!parse_number("port", argv[++i], 65535, value)) return 2;
            config.telemetry.port = static_cast<uint16_t>(value);
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            if (!parse_number("timeout", argv[++i], 3600, value)) return 2;
            config.telemetry.timeout_s = value;
        } else if (std::strcmp(argv[i], "--heartbeat") == 0 && i + 1 < argc) {
            if (!parse_number("heartbeat_interval", argv[++i], 60000, value)) return 2;
            config.telemetry.heartbeat_interval_ms = value;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            config.telemetry.log_file_path = std::string(argv[++i]);
        } else if (std::strcmp(argv[i], "--tap") == 0) {
            config.telemetry.enable_logging = true;
        } else if (std::strcmp(argv[i], "--gamepad") == 0 && i + 1 < argc) {
            const char* name = argv[++i];
            std::optional<GamepadBackend> backend = parse_gamepad_backend(name);
            if (!backend) {
                std::cerr << TelemetryError::config_error("gamepad", name, "unknown backend").what() << "\n";
                return 2;
            }
            config.gamepad.backend = *backend;
        } else if (std::strcmp(argv[i], "--no-gamepad") == 0) {
            config.enable_gamepad = false;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    // Initialize logging
    Logger::initialize(config.verbose);

    // Setup signal handling
    SignalHandler::setup();

    std::unique_ptr<TelemetryEngine> engine;
    try {
        engine = std::make_unique<TelemetryEngine>(config.telemetry);
        engine->add_peer(config.telemetry.console_ip);
        for (const auto& peer : config.extra_peers) {
            engine->add_peer(peer);
        }
    } catch (const TelemetryError& e) {
        Logger::error(e.what());
        return e.is_config() ? 2 : 1;
    }

    std::unique_ptr<VGamepadClient> gamepad;
    DS4Controller* controller = nullptr;
    if (config.enable_gamepad) {
        try {
            gamepad = std::make_unique<VGamepadClient>(config.gamepad);
            controller = &gamepad->create_dualshock4();
        } catch (const GamepadError& e) {
            Logger::warn(std::string("Virtual gamepad unavailable: ") + e.what());
            controller = nullptr;
            gamepad.reset();
        }
    }

    std::atomic<bool> running(true);
    std::thread bridge_thread;
    if (controller) {
        bridge_thread = std::thread(bridge_thread_main, engine->subscribe(), controller,
                                    config.telemetry.console_ip, std::ref(running));
    }

    try {
        engine->start();
    } catch (const TelemetryError& e) {
        Logger::error(e.what());
        running = false;
        if (bridge_thread.joinable()) bridge_thread.join();
        return 1;
    }

    std::thread status_thread;
    if (!config.verbose) {
        status_thread = std::thread(status_thread_main, std::ref(*engine), std::ref(running));
    }

    Logger::info("GT7 link running. Press Ctrl-C to stop.");
    if (!config.verbose) {
        Logger::info("Use --verbose for per-frame logs.");
    }

    // Wait for shutdown signal
    SignalHandler::wait_for_exit(std::chrono::milliseconds(100));
    Logger::info(std::string("Shutting down (") + SignalHandler::reason() + ")");

    running = false;
    engine->stop();
    if (bridge_thread.joinable()) bridge_thread.join();
    if (status_thread.joinable()) status_thread.join();

    gamepad.reset();
    engine.reset();

    Logger::info("GT7 link shutdown complete.");
    return 0;
}
