// utils.hpp
#pragma once

#include <chrono>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace awss {

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    double elapsed_ms() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    std::chrono::steady_clock::duration elapsed() const {
        return std::chrono::steady_clock::now() - start_;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Simple logger
class Logger {
public:
    enum Level {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    static void log(Level level, const std::string& message);
    static void setLevel(Level level) { min_level_ = level; }
    static Level getLevel() { return min_level_; }
    static Level parseLevel(const std::string& name);

private:
    static std::atomic<Level> min_level_;
    static std::mutex mutex_;
};

// Local-time formatting with strftime patterns, e.g. "%Y%m%d_%H%M%S".
std::string format_local_time(std::chrono::system_clock::time_point tp, const char* pattern);

// ISO-8601 local time with milliseconds: 2024-05-01T14:03:22.517
std::string iso_timestamp(std::chrono::system_clock::time_point tp);

std::string format_fixed(double value, int precision);

template <typename Rep, typename Period>
void sleep_for(std::chrono::duration<Rep, Period> d) {
    if (d > std::chrono::duration<Rep, Period>::zero()) {
        std::this_thread::sleep_for(d);
    }
}

}  // namespace awss
