#include "config/config.hpp"

const char* to_string(GamepadBackend backend) {
    switch (backend) {
        case GamepadBackend::Auto: return "auto";
        case GamepadBackend::Sim: return "sim";
        case GamepadBackend::ViGEm: return "vigem";
        case GamepadBackend::MacSimulation: return "mac-sim";
        case GamepadBackend::MacIOKit: return "mac-iokit";
        case GamepadBackend::MacDriverKit: return "mac-driverkit";
    }
    return "unknown";
}

std::optional<GamepadBackend> parse_gamepad_backend(const std::string& name) {
    if (name == "auto") return GamepadBackend::Auto;
    if (name == "sim") return GamepadBackend::Sim;
    if (name == "vigem") return GamepadBackend::ViGEm;
    if (name == "mac-sim") return GamepadBackend::MacSimulation;
    if (name == "mac-iokit") return GamepadBackend::MacIOKit;
    if (name == "mac-driverkit") return GamepadBackend::MacDriverKit;
    return {};
}
