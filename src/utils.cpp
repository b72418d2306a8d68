// utils.cpp
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace awss {

std::atomic<Logger::Level> Logger::min_level_{Logger::INFO};
std::mutex Logger::mutex_;

void Logger::log(Level level, const std::string& message) {
    if (level < min_level_.load()) return;

    const char* level_str[] = {"DEBUG", "INFO", "WARN", "ERROR"};

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[" << std::put_time(&tm, "%H:%M:%S");
    std::cout << "." << std::setfill('0') << std::setw(3) << ms.count();
    std::cout << "] [" << level_str[level] << "] " << message << std::endl;
}

Logger::Level Logger::parseLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "debug") return DEBUG;
    if (n == "warn" || n == "warning") return WARNING;
    if (n == "error") return ERROR;
    return INFO;
}

std::string format_local_time(std::chrono::system_clock::time_point tp, const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << format_local_time(tp, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

}  // namespace awss
