#pragma once
#include "config/config.hpp"
#include "gamepad/ds4_controller.hpp"
#include "gamepad/gamepad_adapter.hpp"
#include <memory>
#include <vector>

// Builds the adapter for `config.backend`. Auto picks ViGEm on Windows,
// the macOS simulation on macOS and the in-memory backend elsewhere.
// Throws GamepadError (UnsupportedPlatform for a backend this build lacks).
std::unique_ptr<GamepadAdapter> make_adapter(const GamepadConfig& config);

// Owns one adapter and every controller created against it. Controllers are
// destroyed in reverse creation order before the adapter is released.
class VGamepadClient {
public:
    explicit VGamepadClient(const GamepadConfig& config = GamepadConfig());
    explicit VGamepadClient(std::unique_ptr<GamepadAdapter> adapter);
    ~VGamepadClient();

    VGamepadClient(const VGamepadClient&) = delete;
    VGamepadClient& operator=(const VGamepadClient&) = delete;

    // The reference stays valid until destroy() or the client goes away.
    DS4Controller& create_dualshock4();
    // Throws ControllerDisconnected if the controller is not owned here.
    void destroy(DS4Controller& controller);

    size_t controller_count() const { return controllers_.size(); }
    const char* backend_name() const { return adapter_->name(); }
    GamepadAdapter& adapter() { return *adapter_; }

private:
    std::unique_ptr<GamepadAdapter> adapter_;
    std::vector<std::unique_ptr<DS4Controller>> controllers_;
};
