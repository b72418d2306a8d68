// detection_record.hpp
#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "classifier.hpp"

namespace awss {

// One detection as persisted to disk and shown to operators.
struct DetectionRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string category;   // RECYCLING, COMPOST, GARBAGE or ERROR
    std::string color;      // blue, green, black or error
    double confidence{0.0};
    std::string reason;
    std::optional<cv::Scalar> hsv;
    std::vector<std::pair<std::string, double>> color_matches;
    std::optional<std::string> image_path;
    std::optional<std::string> image_filename;

    bool isError() const { return category == kErrorCategory; }

    static constexpr const char* kErrorCategory = "ERROR";

    static DetectionRecord fromClassification(const ClassificationResult& result,
                                              std::chrono::system_clock::time_point timestamp,
                                              const std::string& image_path,
                                              const std::string& image_filename);

    static DetectionRecord error(const std::string& reason,
                                 std::chrono::system_clock::time_point timestamp =
                                     std::chrono::system_clock::now());
};

}  // namespace awss
