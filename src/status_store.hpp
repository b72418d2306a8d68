// status_store.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "detection_record.hpp"

namespace awss {

struct SystemStatus {
    bool running{false};
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<DetectionRecord> last;
    std::deque<DetectionRecord> history;  // newest first
    std::optional<std::string> last_error;
    std::optional<std::string> last_image_path;
};

// Shared between the worker thread and any number of status readers.
class StatusStore {
public:
    static constexpr std::size_t kMaxHistory = 20;

    // Resets everything and marks the session running.
    void beginSession(std::chrono::system_clock::time_point started_at);
    // Keeps the last results visible.
    void endSession();

    void record(const DetectionRecord& rec);
    void setError(const std::string& message);

    SystemStatus snapshot() const;
    bool running() const;

private:
    mutable std::mutex mutex_;
    SystemStatus status_;
};

}  // namespace awss
