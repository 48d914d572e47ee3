#include "gamepad/gamepad_error.hpp"
#include <iomanip>
#include <sstream>

GamepadError::GamepadError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

GamepadError GamepadError::driver_not_installed(const std::string& driver, const std::string& url) {
    GamepadError e(Kind::DriverNotInstalled, "required driver not installed: " + driver + " (download: " + url + ")");
    e.subject_ = driver;
    e.detail_ = url;
    return e;
}

GamepadError GamepadError::unsupported_platform(const std::string& platform, const std::string& feature) {
    GamepadError e(Kind::UnsupportedPlatform, "platform '" + platform + "' does not support " + feature);
    e.subject_ = platform;
    e.detail_ = feature;
    return e;
}

GamepadError GamepadError::insufficient_permissions(const std::string& operation) {
    GamepadError e(Kind::InsufficientPermissions, "insufficient permissions for " + operation);
    e.subject_ = operation;
    return e;
}

GamepadError GamepadError::driver_rpc_failure(const std::string& function, uint32_t code,
                                              const std::string& status_name) {
    std::ostringstream ss;
    ss << "driver call '" << function << "' failed";
    if (!status_name.empty()) {
        ss << ": " << status_name;
    }
    ss << " (0x" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << code << ")";
    GamepadError e(Kind::DriverRpcFailure, ss.str());
    e.subject_ = function;
    e.detail_ = status_name;
    e.code_ = code;
    return e;
}

GamepadError GamepadError::controller_disconnected() {
    return GamepadError(Kind::ControllerDisconnected, "controller is disconnected");
}

GamepadError GamepadError::controller_update_failure(const std::string& reason) {
    GamepadError e(Kind::ControllerUpdateFailure, "controller update failed: " + reason);
    e.detail_ = reason;
    return e;
}

GamepadError GamepadError::invalid_input(const std::string& field, const std::string& expected,
                                         const std::string& actual) {
    GamepadError e(Kind::InvalidInput, "invalid " + field + ": expected " + expected + ", got " + actual);
    e.subject_ = field;
    e.detail_ = expected;
    e.actual_ = actual;
    return e;
}

const char* GamepadError::kind_name() const {
    switch (kind_) {
        case Kind::DriverNotInstalled: return "DriverNotInstalled";
        case Kind::UnsupportedPlatform: return "UnsupportedPlatform";
        case Kind::InsufficientPermissions: return "InsufficientPermissions";
        case Kind::DriverRpcFailure: return "DriverRpcFailure";
        case Kind::ControllerDisconnected: return "ControllerDisconnected";
        case Kind::ControllerUpdateFailure: return "ControllerUpdateFailure";
        case Kind::InvalidInput: return "InvalidInput";
    }
    return "Unknown";
}

bool GamepadError::is_driver_error() const {
    return kind_ == Kind::DriverNotInstalled || kind_ == Kind::DriverRpcFailure;
}

bool GamepadError::is_recoverable() const {
    return kind_ == Kind::ControllerUpdateFailure || kind_ == Kind::InvalidInput;
}
