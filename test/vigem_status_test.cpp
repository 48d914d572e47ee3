#include "gamepad/vigem_status.hpp"
#include "gamepad/gamepad_error.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(ViGEmStatusTests, KnownCodes) {
    EXPECT_STREQ(vigem_status_name(0x20000000), "None");
    EXPECT_STREQ(vigem_status_name(0xE0000001), "BusNotFound");
    EXPECT_STREQ(vigem_status_name(0xE0000002), "NoFreeSlot");
    EXPECT_STREQ(vigem_status_name(0xE0000008), "BusVersionMismatch");
    EXPECT_STREQ(vigem_status_name(0xE0000010), "NotSupported");
}

TEST(ViGEmStatusTests, UnknownCodes) {
    EXPECT_STREQ(vigem_status_name(0), "Unknown");
    EXPECT_STREQ(vigem_status_name(0xE0000000), "Unknown");
    EXPECT_STREQ(vigem_status_name(0xE0000011), "Unknown");
    EXPECT_STREQ(vigem_status_name(0xFFFFFFFF), "Unknown");
}

TEST(ViGEmStatusTests, SuccessCheck) {
    EXPECT_TRUE(vigem_success(0x20000000));
    EXPECT_FALSE(vigem_success(0xE0000001));
    EXPECT_FALSE(vigem_success(0));
}

TEST(ViGEmStatusTests, RpcFailureMessage) {
    uint32_t code = 0xE0000001;
    GamepadError e = GamepadError::driver_rpc_failure("vigem_connect", code, vigem_status_name(code));
    EXPECT_TRUE(e.is_driver_error());
    EXPECT_FALSE(e.is_recoverable());
    EXPECT_EQ(e.function(), "vigem_connect");
    EXPECT_EQ(e.code(), code);
    std::string message = e.what();
    EXPECT_NE(message.find("BusNotFound"), std::string::npos);
    EXPECT_NE(message.find("0xE0000001"), std::string::npos);
}

TEST(GamepadErrorTests, Classification) {
    GamepadError missing = GamepadError::driver_not_installed("ViGEm Bus Driver",
                                                              "https://github.com/nefarius/ViGEmBus/releases");
    EXPECT_TRUE(missing.is_driver_error());
    EXPECT_EQ(missing.driver(), "ViGEm Bus Driver");
    EXPECT_EQ(missing.url(), "https://github.com/nefarius/ViGEmBus/releases");

    GamepadError platform = GamepadError::unsupported_platform("Linux", "vigem backend");
    EXPECT_FALSE(platform.is_driver_error());
    EXPECT_FALSE(platform.is_recoverable());
    EXPECT_EQ(platform.platform(), "Linux");
    EXPECT_EQ(platform.feature(), "vigem backend");

    EXPECT_EQ(GamepadError::insufficient_permissions("IOHIDUserDeviceCreate").operation(),
              "IOHIDUserDeviceCreate");
    EXPECT_FALSE(GamepadError::controller_disconnected().is_recoverable());
    EXPECT_TRUE(GamepadError::controller_update_failure("busy").is_recoverable());
    EXPECT_STREQ(GamepadError::invalid_input("dpad", "0 to 8", "9").kind_name(), "InvalidInput");
}
