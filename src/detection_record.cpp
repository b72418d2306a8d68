// detection_record.cpp
#include "detection_record.hpp"

namespace awss {

DetectionRecord DetectionRecord::fromClassification(const ClassificationResult& result,
                                                    std::chrono::system_clock::time_point timestamp,
                                                    const std::string& image_path,
                                                    const std::string& image_filename) {
    DetectionRecord rec;
    rec.timestamp = timestamp;
    rec.category = category_name(result.category);
    rec.color = color_name(result.color);
    rec.confidence = result.confidence;
    rec.reason = result.reason;
    rec.hsv = result.mean_hsv;
    for (const auto& m : result.matches) {
        rec.color_matches.emplace_back(color_name(m.color), m.percent);
    }
    rec.image_path = image_path;
    rec.image_filename = image_filename;
    return rec;
}

DetectionRecord DetectionRecord::error(const std::string& reason,
                                       std::chrono::system_clock::time_point timestamp) {
    DetectionRecord rec;
    rec.timestamp = timestamp;
    rec.category = kErrorCategory;
    rec.color = "error";
    rec.confidence = 0.0;
    rec.reason = reason;
    return rec;
}

}  // namespace awss
