#include "utils/logging.hpp"
#include "telemetry/telemetry_engine.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

TEST(LoggingTests, FileSinkMirrorsLines) {
    std::string path = ::testing::TempDir() + "gt7link_logging_test.log";
    std::remove(path.c_str());

    ASSERT_TRUE(Logger::set_file_sink(path));
    Logger::info("sink check info");
    Logger::warn("sink check warn");
    Logger::close_file_sink();
    Logger::info("after close");

    std::string contents = read_file(path);
    EXPECT_NE(contents.find("[INFO] sink check info"), std::string::npos);
    EXPECT_NE(contents.find("[WARN] sink check warn"), std::string::npos);
    EXPECT_EQ(contents.find("after close"), std::string::npos);
    std::remove(path.c_str());
}

TEST(LoggingTests, DebugFollowsVerbose) {
    std::string path = ::testing::TempDir() + "gt7link_verbose_test.log";
    std::remove(path.c_str());
    ASSERT_TRUE(Logger::set_file_sink(path));

    Logger::set_verbose(false);
    Logger::debug("hidden line");
    Logger::set_verbose(true);
    EXPECT_TRUE(Logger::is_verbose());
    Logger::debug("shown line");
    Logger::set_verbose(false);
    Logger::close_file_sink();

    std::string contents = read_file(path);
    EXPECT_EQ(contents.find("hidden line"), std::string::npos);
    EXPECT_NE(contents.find("[DEBUG] shown line"), std::string::npos);
    std::remove(path.c_str());
}

TEST(LoggingTests, UnopenableSinkFails) {
    EXPECT_FALSE(Logger::set_file_sink(::testing::TempDir() + "no_such_dir/sub/log.txt"));
}

TEST(LoggingTests, EngineOwnsConfiguredSink) {
    std::string path = ::testing::TempDir() + "gt7link_engine_sink.log";
    std::remove(path.c_str());

    TelemetryConfig config;
    config.log_file_path = path;
    {
        TelemetryEngine engine(config);
        engine.add_peer("192.168.1.30");
    }
    Logger::info("after engine");

    std::string contents = read_file(path);
    EXPECT_NE(contents.find("Added console 192.168.1.30"), std::string::npos);
    EXPECT_EQ(contents.find("after engine"), std::string::npos);
    std::remove(path.c_str());
}
