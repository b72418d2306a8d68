// capture_store.cpp
#include "capture_store.hpp"
#include "utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace awss {

CaptureStore::CaptureStore(const std::string& captures_dir, const std::string& logs_dir)
    : captures_dir_(captures_dir), logs_dir_(logs_dir) {
    std::error_code ec;
    fs::create_directories(captures_dir_, ec);
    if (ec) {
        Logger::log(Logger::WARNING, "Cannot create " + captures_dir_ + ": " + ec.message());
    }
    fs::create_directories(logs_dir_, ec);
    if (ec) {
        Logger::log(Logger::WARNING, "Cannot create " + logs_dir_ + ": " + ec.message());
    }
}

std::string CaptureStore::imageFilename(std::chrono::system_clock::time_point t) const {
    return "bag_" + format_local_time(t, "%Y%m%d_%H%M%S") + ".jpg";
}

std::string CaptureStore::logPath(std::chrono::system_clock::time_point t) const {
    return (fs::path(logs_dir_) / ("awss_log_" + format_local_time(t, "%Y%m%d") + ".txt")).string();
}

StoredImage CaptureStore::saveImage(const cv::Mat& bgr, std::chrono::system_clock::time_point taken_at) {
    StoredImage img;
    img.filename = imageFilename(taken_at);
    img.path = (fs::path(captures_dir_) / img.filename).string();

    std::error_code ec;
    fs::create_directories(captures_dir_, ec);

    bool ok = false;
    try {
        ok = cv::imwrite(img.path, bgr);
    } catch (const cv::Exception& e) {
        Logger::log(Logger::ERROR, std::string("imwrite: ") + e.what());
        ok = false;
    }
    if (!ok) {
        throw std::runtime_error("Failed to write image to " + img.path);
    }
    return img;
}

void CaptureStore::appendLog(const DetectionRecord& record) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    std::error_code ec;
    fs::create_directories(logs_dir_, ec);

    const std::string path = logPath(record.timestamp);
    std::ofstream f(path, std::ios::app);
    if (!f) {
        throw std::runtime_error("Failed to open log file " + path);
    }

    f << "\n" << std::string(60, '=') << "\n";
    f << "Time: " << iso_timestamp(record.timestamp) << "\n";
    f << "Color: " << record.color << "\n";
    f << "Category: " << record.category << "\n";
    if (record.hsv) {
        const cv::Scalar& hsv = *record.hsv;
        f << "HSV: H=" << format_fixed(hsv[0], 2)
          << ", S=" << format_fixed(hsv[1], 2)
          << ", V=" << format_fixed(hsv[2], 2) << "\n";
    } else {
        f << "HSV: H=-, S=-, V=-\n";
    }
    f << "Confidence: " << format_fixed(record.confidence, 1) << "%\n";
    f << "Reason: " << record.reason << "\n";
    f << "Image: " << record.image_path.value_or("") << "\n";
    f.flush();
    if (!f) {
        throw std::runtime_error("Failed to append to log file " + path);
    }
}

}  // namespace awss
