#include "utils/signal_handler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <thread>

TEST(SignalHandlerTests, RequestRaisesFlag) {
    SignalHandler::reset();
    EXPECT_FALSE(SignalHandler::should_exit());
    EXPECT_STREQ(SignalHandler::reason(), "");

    SignalHandler::request_exit();
    EXPECT_TRUE(SignalHandler::should_exit());
    EXPECT_STREQ(SignalHandler::reason(), "request");
    SignalHandler::reset();
}

TEST(SignalHandlerTests, WaitReturnsOnceRaised) {
    SignalHandler::reset();
    std::thread raiser([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        SignalHandler::request_exit();
    });

    SignalHandler::wait_for_exit(std::chrono::milliseconds(5));
    raiser.join();
    EXPECT_TRUE(SignalHandler::should_exit());
    SignalHandler::reset();
}

#ifndef _WIN32
TEST(SignalHandlerTests, SigtermIsRecorded) {
    SignalHandler::reset();
    SignalHandler::setup();
    std::raise(SIGTERM);

    EXPECT_TRUE(SignalHandler::should_exit());
    EXPECT_STREQ(SignalHandler::reason(), "SIGTERM");
    SignalHandler::reset();
}
#endif
