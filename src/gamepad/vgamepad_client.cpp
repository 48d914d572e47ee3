#include "gamepad/vgamepad_client.hpp"
#include "gamepad/gamepad_error.hpp"
#include "gamepad/sim_adapter.hpp"
#include "utils/logging.hpp"

#ifdef _WIN32
#include "gamepad/vigem_adapter.hpp"
#endif
#ifdef __APPLE__
#include "gamepad/mac_hid_adapter.hpp"
#endif

namespace {
const char* platform_name() {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#else
    return "Linux";
#endif
}
}

std::unique_ptr<GamepadAdapter> make_adapter(const GamepadConfig& config) {
    GamepadBackend backend = config.backend;
    if (backend == GamepadBackend::Auto) {
#if defined(_WIN32)
        backend = GamepadBackend::ViGEm;
#elif defined(__APPLE__)
        backend = GamepadBackend::MacSimulation;
#else
        backend = GamepadBackend::Sim;
#endif
    }

    switch (backend) {
        case GamepadBackend::Sim:
            return std::make_unique<SimAdapter>();
#ifdef _WIN32
        case GamepadBackend::ViGEm:
            return std::make_unique<ViGEmAdapter>(config.vigem_library);
#endif
#ifdef __APPLE__
        case GamepadBackend::MacSimulation:
            return std::make_unique<MacHidAdapter>(MacHidAdapter::Method::Simulation);
        case GamepadBackend::MacIOKit:
            return std::make_unique<MacHidAdapter>(MacHidAdapter::Method::IOKitUserspace);
        case GamepadBackend::MacDriverKit:
            return std::make_unique<MacHidAdapter>(MacHidAdapter::Method::DriverKit);
#endif
        default:
            break;
    }
    throw GamepadError::unsupported_platform(platform_name(), std::string(to_string(backend)) + " backend");
}

VGamepadClient::VGamepadClient(const GamepadConfig& config) : adapter_(make_adapter(config)) {
    Logger::info(std::string("Virtual gamepad client ready (") + adapter_->name() + ")");
}

VGamepadClient::VGamepadClient(std::unique_ptr<GamepadAdapter> adapter) : adapter_(std::move(adapter)) {
    Logger::info(std::string("Virtual gamepad client ready (") + adapter_->name() + ")");
}

VGamepadClient::~VGamepadClient() {
    while (!controllers_.empty()) {
        controllers_.pop_back();
    }
    adapter_.reset();
}

DS4Controller& VGamepadClient::create_dualshock4() {
    controllers_.push_back(std::make_unique<DS4Controller>(*adapter_));
    return *controllers_.back();
}

void VGamepadClient::destroy(DS4Controller& controller) {
    for (auto it = controllers_.begin(); it != controllers_.end(); ++it) {
        if (it->get() == &controller) {
            controllers_.erase(it);
            return;
        }
    }
    throw GamepadError::controller_disconnected();
}
