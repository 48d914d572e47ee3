#include "config/config.hpp"
#include "telemetry/config_validation.hpp"
#include "telemetry/telemetry_error.hpp"

#include <gtest/gtest.h>

TEST(ConfigTests, Defaults) {
    TelemetryConfig config;
    EXPECT_EQ(config.console_ip, "192.168.1.30");
    EXPECT_EQ(config.port, 33740);
    EXPECT_EQ(config.timeout_s, 5u);
    EXPECT_EQ(config.heartbeat_interval_ms, 100u);
    EXPECT_FALSE(config.enable_logging);
    EXPECT_FALSE(config.log_file_path.has_value());
    EXPECT_EQ(config.channel_capacity, 1000u);

    BridgeConfig bridge;
    EXPECT_TRUE(bridge.enable_gamepad);
    EXPECT_EQ(bridge.gamepad.backend, GamepadBackend::Auto);
    EXPECT_TRUE(bridge.extra_peers.empty());

    EXPECT_NO_THROW(validate_config(config));
}

TEST(ConfigTests, ValidationNamesTheField) {
    TelemetryConfig config;
    config.channel_capacity = 0;
    try {
        validate_config(config);
        FAIL() << "expected ConfigError";
    } catch (const TelemetryError& e) {
        EXPECT_EQ(e.kind(), TelemetryError::Kind::ConfigError);
        EXPECT_EQ(e.field(), "channel_capacity");
    }

    config = TelemetryConfig();
    config.log_file_path = std::string();
    EXPECT_THROW(validate_config(config), TelemetryError);

    config = TelemetryConfig();
    config.monitor_interval_ms = 0;
    EXPECT_THROW(validate_config(config), TelemetryError);
}

TEST(ConfigTests, BackendNames) {
    for (GamepadBackend backend : {GamepadBackend::Auto, GamepadBackend::Sim, GamepadBackend::ViGEm,
                                   GamepadBackend::MacSimulation, GamepadBackend::MacIOKit,
                                   GamepadBackend::MacDriverKit}) {
        std::optional<GamepadBackend> parsed = parse_gamepad_backend(to_string(backend));
        ASSERT_TRUE(parsed.has_value()) << to_string(backend);
        EXPECT_EQ(*parsed, backend);
    }
    EXPECT_STREQ(to_string(GamepadBackend::ViGEm), "vigem");
    EXPECT_FALSE(parse_gamepad_backend("xbox").has_value());
    EXPECT_FALSE(parse_gamepad_backend("").has_value());
}
