// capture_store.hpp
#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <mutex>
#include <string>

#include "detection_record.hpp"

namespace awss {

struct StoredImage {
    std::string path;
    std::string filename;
};

/**
 * On-disk side of a detection:
 *   <captures_dir>/bag_YYYYMMDD_HHMMSS.jpg   one JPEG per detection
 *   <logs_dir>/awss_log_YYYYMMDD.txt         one append-only log per day
 * Both directories are (re)created on demand.
 */
class CaptureStore {
public:
    CaptureStore(const std::string& captures_dir, const std::string& logs_dir);

    // Throws std::runtime_error if the image cannot be written.
    StoredImage saveImage(const cv::Mat& bgr, std::chrono::system_clock::time_point taken_at);

    // Throws std::runtime_error if the log cannot be opened.
    void appendLog(const DetectionRecord& record);

    std::string imageFilename(std::chrono::system_clock::time_point t) const;
    std::string logPath(std::chrono::system_clock::time_point t) const;

    const std::string& capturesDir() const { return captures_dir_; }
    const std::string& logsDir() const { return logs_dir_; }

private:
    std::string captures_dir_;
    std::string logs_dir_;
    std::mutex log_mutex_;
};

}  // namespace awss
