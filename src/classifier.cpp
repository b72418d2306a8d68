// classifier.cpp
#include "classifier.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace awss {

const char* color_name(BagColor color) {
    switch (color) {
        case BagColor::BLUE: return "blue";
        case BagColor::GREEN: return "green";
        default: return "black";
    }
}

const char* category_name(WasteCategory category) {
    switch (category) {
        case WasteCategory::RECYCLING: return "RECYCLING";
        case WasteCategory::COMPOST: return "COMPOST";
        default: return "GARBAGE";
    }
}

WasteCategory category_for(BagColor color) {
    switch (color) {
        case BagColor::BLUE: return WasteCategory::RECYCLING;
        case BagColor::GREEN: return WasteCategory::COMPOST;
        default: return WasteCategory::GARBAGE;
    }
}

ColorClassifier::ColorClassifier() {
    // Calibrated on the Pi camera's channel order. Green starts at H=51 so
    // it never overlaps blue.
    ranges_[static_cast<int>(BagColor::BLUE)] = {cv::Scalar(15, 50, 170), cv::Scalar(50, 255, 255)};
    ranges_[static_cast<int>(BagColor::GREEN)] = {cv::Scalar(51, 40, 120), cv::Scalar(90, 255, 255)};
    ranges_[static_cast<int>(BagColor::BLACK)] = {cv::Scalar(0, 0, 0), cv::Scalar(179, 255, 100)};
}

ColorClassifier::ColorClassifier(const YAML::Node& config) : ColorClassifier() {
    loadRange(config, BagColor::BLUE);
    loadRange(config, BagColor::GREEN);
    loadRange(config, BagColor::BLACK);
}

void ColorClassifier::loadRange(const YAML::Node& config, BagColor color) {
    if (!config || !config.IsMap()) return;
    const YAML::Node section = config["classifier"];
    if (!section || !section.IsMap()) return;
    const YAML::Node node = section[color_name(color)];
    if (!node || !node.IsMap()) return;

    HsvRange& r = ranges_[static_cast<int>(color)];
    if (node["lower"]) {
        auto lower = node["lower"].as<std::vector<int>>();
        if (lower.size() == 3) {
            r.lower = cv::Scalar(lower[0], lower[1], lower[2]);
        }
    }
    if (node["upper"]) {
        auto upper = node["upper"].as<std::vector<int>>();
        if (upper.size() == 3) {
            r.upper = cv::Scalar(upper[0], upper[1], upper[2]);
        }
    }
}

cv::Rect ColorClassifier::centerRoi(const cv::Size& size) {
    int x0 = size.width / 4;
    int y0 = size.height / 4;
    int x1 = 3 * size.width / 4;
    int y1 = 3 * size.height / 4;
    return cv::Rect(x0, y0, x1 - x0, y1 - y0);
}

ClassificationResult ColorClassifier::classify(const cv::Mat& hsv) const {
    if (hsv.empty() || hsv.type() != CV_8UC3) {
        throw std::invalid_argument("classify expects a non-empty 8-bit 3-channel HSV image");
    }
    cv::Rect roi_rect = centerRoi(hsv.size());
    if (roi_rect.area() == 0) {
        throw std::invalid_argument("image too small for a centre ROI");
    }

    cv::Mat roi = hsv(roi_rect);
    cv::Scalar mean_hsv = cv::mean(roi);

    std::vector<ColorMatch> matches;
    matches.reserve(ranges_.size());
    cv::Mat mask;
    for (BagColor color : {BagColor::BLUE, BagColor::GREEN, BagColor::BLACK}) {
        const HsvRange& r = range(color);
        cv::inRange(roi, r.lower, r.upper, mask);
        double pct = cv::countNonZero(mask) * 100.0 / static_cast<double>(mask.total());
        matches.push_back(ColorMatch{color, pct});
    }

    return decide(matches, mean_hsv);
}

ClassificationResult ColorClassifier::decide(const std::vector<ColorMatch>& matches,
                                             const cv::Scalar& mean_hsv) {
    auto percent_of = [&](BagColor c) {
        for (const auto& m : matches) {
            if (m.color == c) return m.percent;
        }
        return 0.0;
    };

    const double blue = percent_of(BagColor::BLUE);
    const double green = percent_of(BagColor::GREEN);
    const double mean_v = mean_hsv[2];

    ClassificationResult res;
    res.mean_hsv = mean_hsv;
    res.matches = matches;

    // First matching rule wins; brightness is tested before green.
    if (blue > kBlueMinMatch) {
        res.color = BagColor::BLUE;
        res.confidence = std::min(kMaxConfidence, blue);
        res.reason = "Blue range match: " + format_fixed(blue, 1) + "%";
    } else if (mean_v < kDarkValue) {
        res.color = BagColor::BLACK;
        double conf = (kDarkValue - mean_v) / kDarkValue * 100.0;
        res.confidence = std::max(0.0, std::min(kMaxConfidence, conf));
        res.reason = "V=" + format_fixed(mean_v, 1) + " < 120 (low brightness)";
    } else if (green > kGreenMinMatch) {
        res.color = BagColor::GREEN;
        res.confidence = std::min(kMaxConfidence, green);
        res.reason = "Green range match: " + format_fixed(green, 1) + "%";
    } else {
        // strict > keeps the first colour on ties
        res.color = BagColor::BLUE;
        double best = -1.0;
        for (const auto& m : matches) {
            if (m.percent > best) {
                best = m.percent;
                res.color = m.color;
            }
        }
        best = std::max(0.0, std::min(100.0, best));
        res.confidence = best;
        res.reason = "Best match: " + format_fixed(best, 1) + "%";
    }

    res.category = category_for(res.color);
    return res;
}

}  // namespace awss
