#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

// Error raised by the virtual gamepad layer. Every failure is surfaced to the
// caller; nothing in this layer retries on its own.
class GamepadError : public std::runtime_error {
public:
    enum class Kind {
        DriverNotInstalled,
        UnsupportedPlatform,
        InsufficientPermissions,
        DriverRpcFailure,
        ControllerDisconnected,
        ControllerUpdateFailure,
        InvalidInput
    };

    static GamepadError driver_not_installed(const std::string& driver, const std::string& url);
    static GamepadError unsupported_platform(const std::string& platform, const std::string& feature);
    static GamepadError insufficient_permissions(const std::string& operation);
    static GamepadError driver_rpc_failure(const std::string& function, uint32_t code,
                                           const std::string& status_name = std::string());
    static GamepadError controller_disconnected();
    static GamepadError controller_update_failure(const std::string& reason);
    static GamepadError invalid_input(const std::string& field, const std::string& expected,
                                      const std::string& actual);

    Kind kind() const { return kind_; }
    const char* kind_name() const;

    const std::string& driver() const { return subject_; }
    const std::string& url() const { return detail_; }
    const std::string& platform() const { return subject_; }
    const std::string& feature() const { return detail_; }
    const std::string& operation() const { return subject_; }
    const std::string& function() const { return subject_; }
    uint32_t code() const { return code_; }
    const std::string& status_name() const { return detail_; }
    const std::string& reason() const { return detail_; }
    const std::string& field() const { return subject_; }
    const std::string& expected() const { return detail_; }
    const std::string& actual() const { return actual_; }

    bool is_driver_error() const;
    bool is_recoverable() const;

private:
    GamepadError(Kind kind, const std::string& message);

    Kind kind_;
    std::string subject_;
    std::string detail_;
    std::string actual_;
    uint32_t code_ = 0;
};
