#include "telemetry/telemetry_error.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(TelemetryErrorTests, PacketErrorsClassify) {
    TelemetryError incomplete = TelemetryError::incomplete(296, 100);
    EXPECT_TRUE(incomplete.is_packet());
    EXPECT_TRUE(incomplete.is_recoverable());
    EXPECT_FALSE(incomplete.is_network());
    EXPECT_EQ(incomplete.expected(), 296u);
    EXPECT_EQ(incomplete.actual(), 100u);

    TelemetryError format = TelemetryError::invalid_format("magic");
    EXPECT_TRUE(format.is_packet());
    EXPECT_FALSE(format.is_recoverable());
    EXPECT_EQ(format.field(), "magic");
    EXPECT_NE(std::string(format.what()).find("magic"), std::string::npos);

    TelemetryError parse = TelemetryError::parse_error("rpm", 186, 4);
    EXPECT_TRUE(parse.is_packet());
    EXPECT_EQ(parse.offset(), 186u);
    EXPECT_EQ(parse.length(), 4u);
}

TEST(TelemetryErrorTests, NetworkErrorsClassify) {
    TelemetryError network = TelemetryError::network_error("192.168.1.30", "connection not found");
    EXPECT_TRUE(network.is_network());
    EXPECT_TRUE(network.is_recoverable());
    EXPECT_EQ(network.address(), "192.168.1.30");
    EXPECT_EQ(network.reason(), "connection not found");

    EXPECT_TRUE(TelemetryError::socket_error("bind failed").is_network());
    EXPECT_FALSE(TelemetryError::socket_error("bind failed").is_recoverable());
    EXPECT_TRUE(TelemetryError::address_parse_error("x").is_network());
}

TEST(TelemetryErrorTests, ConfigErrorsClassify) {
    EXPECT_TRUE(TelemetryError::invalid_ip("8.8.8.8").is_config());
    EXPECT_FALSE(TelemetryError::invalid_ip("8.8.8.8").is_network());
    EXPECT_TRUE(TelemetryError::invalid_port(0).is_config());
    EXPECT_EQ(TelemetryError::invalid_port(0).actual(), 0u);

    TelemetryError config = TelemetryError::config_error("timeout", "0", "must be positive");
    EXPECT_TRUE(config.is_config());
    EXPECT_FALSE(config.is_recoverable());
    EXPECT_EQ(config.field(), "timeout");
}

TEST(TelemetryErrorTests, StateAndTimeoutErrors) {
    TelemetryError state = TelemetryError::invalid_game_state("running", "start");
    EXPECT_EQ(state.kind(), TelemetryError::Kind::InvalidGameState);
    EXPECT_FALSE(state.is_recoverable());
    EXPECT_FALSE(state.is_config());

    EXPECT_TRUE(TelemetryError::timeout("recv", 100).is_recoverable());
    EXPECT_TRUE(TelemetryError::game_not_connected("never").is_recoverable());
    EXPECT_TRUE(TelemetryError::incomplete_data(296, 12).is_recoverable());
}

TEST(TelemetryErrorTests, ChecksumMessageIsHex) {
    TelemetryError e = TelemetryError::checksum_error(0xDEADBEEF, 0x1);
    EXPECT_TRUE(e.is_packet());
    std::string message = e.what();
    EXPECT_NE(message.find("0xDEADBEEF"), std::string::npos);
    EXPECT_NE(message.find("0x00000001"), std::string::npos);
}

TEST(TelemetryErrorTests, KindNames) {
    EXPECT_STREQ(TelemetryError::version_mismatch(1, 2).kind_name(), "VersionMismatch");
    EXPECT_STREQ(TelemetryError::invalid_ip("1.1.1.1").kind_name(), "InvalidIP");
    EXPECT_STREQ(TelemetryError::incomplete_data(296, 0).kind_name(), "IncompleteData");
}
