#include "utils/signal_handler.hpp"
#include <thread>

namespace {
// Stored in last_signal_ when the flag is raised without a signal.
constexpr int REQUESTED = -1;
}

std::atomic<bool> SignalHandler::exit_requested_(false);
std::atomic<int> SignalHandler::last_signal_(0);

void SignalHandler::setup() {
#ifdef _WIN32
    SetConsoleCtrlHandler(console_ctrl_handler, TRUE);
#else
    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);
#endif
}

bool SignalHandler::should_exit() {
    return exit_requested_.load();
}

void SignalHandler::request_exit() {
    int expected = 0;
    last_signal_.compare_exchange_strong(expected, REQUESTED);
    exit_requested_ = true;
}

void SignalHandler::reset() {
    last_signal_ = 0;
    exit_requested_ = false;
}

void SignalHandler::wait_for_exit(std::chrono::milliseconds poll) {
    while (!exit_requested_.load()) {
        std::this_thread::sleep_for(poll);
    }
}

const char* SignalHandler::reason() {
    switch (last_signal_.load()) {
        case 0: return "";
        case REQUESTED: return "request";
        case SIGINT: return "SIGINT";
        case SIGTERM: return "SIGTERM";
#ifdef _WIN32
        case CTRL_BREAK_EVENT + 100: return "Ctrl-Break";
        case CTRL_CLOSE_EVENT + 100: return "console close";
        case CTRL_SHUTDOWN_EVENT + 100: return "system shutdown";
#endif
    }
    return "signal";
}

#ifdef _WIN32
BOOL WINAPI SignalHandler::console_ctrl_handler(DWORD ctrl_type) {
    switch (ctrl_type) {
        case CTRL_C_EVENT:
            last_signal_ = SIGINT;
            exit_requested_ = true;
            return TRUE;
        case CTRL_BREAK_EVENT:
        case CTRL_CLOSE_EVENT:
        case CTRL_SHUTDOWN_EVENT:
            // offset keeps console events apart from CRT signal numbers
            last_signal_ = static_cast<int>(ctrl_type) + 100;
            exit_requested_ = true;
            return TRUE;
        default:
            return FALSE;
    }
}
#else
void SignalHandler::handle_signal(int signum) {
    last_signal_ = signum;
    exit_requested_ = true;
}
#endif
