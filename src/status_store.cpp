// status_store.cpp
#include "status_store.hpp"

namespace awss {

void StatusStore::beginSession(std::chrono::system_clock::time_point started_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = SystemStatus{};
    status_.running = true;
    status_.started_at = started_at;
}

void StatusStore::endSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.running = false;
}

void StatusStore::record(const DetectionRecord& rec) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.last = rec;
    status_.history.push_front(rec);
    while (status_.history.size() > kMaxHistory) {
        status_.history.pop_back();
    }
    if (rec.isError()) {
        status_.last_error = rec.reason;
    } else if (rec.image_path) {
        status_.last_image_path = rec.image_path;
    }
}

void StatusStore::setError(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.last_error = message;
}

SystemStatus StatusStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool StatusStore::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_.running;
}

}  // namespace awss
