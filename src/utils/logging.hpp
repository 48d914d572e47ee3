#pragma once
#include <atomic>
#include <string>
#include <iostream>
#include <fstream>
#include <mutex>

class Logger {
public:
    static void initialize(bool verbose);
    static void set_verbose(bool verbose);
    static bool is_verbose();

    // Mirrors every emitted line to a file. Returns false if the file
    // could not be opened; console output is unaffected either way.
    static bool set_file_sink(const std::string& path);
    static void close_file_sink();

    static void info(const std::string& message);
    static void debug(const std::string& message);
    static void error(const std::string& message);
    static void warn(const std::string& message);

private:
    static void emit(std::ostream& console, const char* tag, const std::string& message);

    static std::atomic<bool> verbose_;
    static std::mutex mutex_;
    static std::ofstream file_sink_;
};
