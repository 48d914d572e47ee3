#pragma once
#include <atomic>
#include <chrono>
#include <signal.h>

#ifdef _WIN32
#include "utils/platform.hpp"
#endif

// Process-wide shutdown flag raised by Ctrl-C / SIGTERM or by the host itself.
class SignalHandler {
public:
    static void setup();
    static bool should_exit();

    // Raises the flag from code, e.g. when a worker hits a fatal error.
    static void request_exit();
    static void reset();

    // Polls the flag every `poll` until it is raised.
    static void wait_for_exit(std::chrono::milliseconds poll);

    // Name of the signal that raised the flag, "request" if raised from
    // code, or "" if it has not been raised.
    static const char* reason();

private:
    static std::atomic<bool> exit_requested_;
    static std::atomic<int> last_signal_;

#ifdef _WIN32
    static BOOL WINAPI console_ctrl_handler(DWORD ctrl_type);
#else
    static void handle_signal(int signum);
#endif
};
