#include "utils/logging.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
std::string wall_clock_stamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}
}

std::atomic<bool> Logger::verbose_(false);
std::mutex Logger::mutex_;
std::ofstream Logger::file_sink_;

void Logger::initialize(bool verbose) {
    set_verbose(verbose);
}

void Logger::set_verbose(bool verbose) {
    verbose_ = verbose;
}

bool Logger::is_verbose() {
    return verbose_.load();
}

bool Logger::set_file_sink(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_sink_.is_open()) {
            file_sink_.close();
        }
        file_sink_.open(path, std::ios::out | std::ios::app);
        if (file_sink_.is_open()) {
            return true;
        }
    }
    error("Failed to open log file: " + path);
    return false;
}

void Logger::close_file_sink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_sink_.is_open()) {
        file_sink_.flush();
        file_sink_.close();
    }
}

void Logger::emit(std::ostream& console, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    console << tag << ' ' << message << std::endl;
    if (file_sink_.is_open()) {
        file_sink_ << wall_clock_stamp() << ' ' << tag << ' ' << message << '\n';
        file_sink_.flush();
    }
}

void Logger::info(const std::string& message) {
    emit(std::cout, "[INFO]", message);
}

void Logger::debug(const std::string& message) {
    if (!verbose_.load()) return;
    emit(std::cout, "[DEBUG]", message);
}

void Logger::error(const std::string& message) {
    emit(std::cerr, "[ERROR]", message);
}

void Logger::warn(const std::string& message) {
    emit(std::cout, "[WARN]", message);
}
