// classifier.hpp
#pragma once

#include <opencv2/opencv.hpp>
#include <yaml-cpp/yaml.h>
#include <array>
#include <string>
#include <vector>

namespace awss {

enum class BagColor {
    BLUE = 0,
    GREEN = 1,
    BLACK = 2
};

enum class WasteCategory {
    RECYCLING,
    COMPOST,
    GARBAGE
};

const char* color_name(BagColor color);
const char* category_name(WasteCategory category);
WasteCategory category_for(BagColor color);

struct HsvRange {
    cv::Scalar lower;
    cv::Scalar upper;
};

struct ColorMatch {
    BagColor color;
    double percent;  // 0..100 of ROI pixels inside the range
};

struct ClassificationResult {
    BagColor color;
    WasteCategory category;
    cv::Scalar mean_hsv;            // [0]=H, [1]=S, [2]=V
    double confidence;              // 0..100
    std::string reason;
    std::vector<ColorMatch> matches;  // blue, green, black
};

/**
 * Threshold-based bag colour classifier. Works on the centre half of the
 * frame in both directions to keep the conveyor edges out of the statistics.
 */
class ColorClassifier {
public:
    static constexpr double kBlueMinMatch = 30.0;
    static constexpr double kGreenMinMatch = 20.0;
    static constexpr double kDarkValue = 120.0;
    static constexpr double kMaxConfidence = 95.0;

    ColorClassifier();
    explicit ColorClassifier(const YAML::Node& config);

    // `hsv` is an 8-bit 3-channel HSV image (OpenCV ranges, H in 0..179).
    ClassificationResult classify(const cv::Mat& hsv) const;

    // Rule cascade on precomputed statistics.
    static ClassificationResult decide(const std::vector<ColorMatch>& matches,
                                       const cv::Scalar& mean_hsv);

    static cv::Rect centerRoi(const cv::Size& size);

    const HsvRange& range(BagColor color) const { return ranges_[static_cast<int>(color)]; }

private:
    std::array<HsvRange, 3> ranges_;

    void loadRange(const YAML::Node& config, BagColor color);
};

}  // namespace awss
