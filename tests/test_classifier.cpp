#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

#include "classifier.hpp"

using awss::BagColor;
using awss::ColorClassifier;
using awss::ColorMatch;
using awss::WasteCategory;

namespace {

std::vector<ColorMatch> matches(double blue, double green, double black) {
    return {ColorMatch{BagColor::BLUE, blue},
            ColorMatch{BagColor::GREEN, green},
            ColorMatch{BagColor::BLACK, black}};
}

cv::Mat solid_hsv(int h, int s, int v, int rows = 40, int cols = 40) {
    return cv::Mat(rows, cols, CV_8UC3, cv::Scalar(h, s, v));
}

}  // namespace

TEST(ColorClassifierTest, BlueMatchAboveThirtyWins) {
    auto r = ColorClassifier::decide(matches(45.0, 0.0, 0.0), cv::Scalar(30, 120, 150));
    EXPECT_EQ(r.color, BagColor::BLUE);
    EXPECT_EQ(r.category, WasteCategory::RECYCLING);
    EXPECT_DOUBLE_EQ(r.confidence, 45.0);
    EXPECT_EQ(r.reason, "Blue range match: 45.0%");
}

TEST(ColorClassifierTest, DarkFrameIsBlackWhenBlueIsWeak) {
    auto r = ColorClassifier::decide(matches(10.0, 0.0, 0.0), cv::Scalar(0, 0, 80));
    EXPECT_EQ(r.color, BagColor::BLACK);
    EXPECT_EQ(r.category, WasteCategory::GARBAGE);
    EXPECT_NEAR(r.confidence, 33.33, 0.01);
    EXPECT_EQ(r.reason, "V=80.0 < 120 (low brightness)");
}

TEST(ColorClassifierTest, GreenMatchAboveTwentyOnBrightFrame) {
    auto r = ColorClassifier::decide(matches(20.0, 25.0, 0.0), cv::Scalar(60, 100, 140));
    EXPECT_EQ(r.color, BagColor::GREEN);
    EXPECT_EQ(r.category, WasteCategory::COMPOST);
    EXPECT_DOUBLE_EQ(r.confidence, 25.0);
    EXPECT_EQ(r.reason, "Green range match: 25.0%");
}

TEST(ColorClassifierTest, FallbackPicksHighestMatch) {
    auto r = ColorClassifier::decide(matches(5.0, 8.0, 15.0), cv::Scalar(90, 50, 140));
    EXPECT_EQ(r.color, BagColor::BLACK);
    EXPECT_EQ(r.category, WasteCategory::GARBAGE);
    EXPECT_DOUBLE_EQ(r.confidence, 15.0);
    EXPECT_EQ(r.reason, "Best match: 15.0%");
}

TEST(ColorClassifierTest, FallbackTieKeepsFirstColour) {
    auto r = ColorClassifier::decide(matches(12.0, 12.0, 12.0), cv::Scalar(90, 50, 200));
    EXPECT_EQ(r.color, BagColor::BLUE);

    r = ColorClassifier::decide(matches(3.0, 18.0, 18.0), cv::Scalar(90, 50, 200));
    EXPECT_EQ(r.color, BagColor::GREEN);
}

TEST(ColorClassifierTest, BlueOutranksDarkness) {
    auto r = ColorClassifier::decide(matches(31.0, 0.0, 60.0), cv::Scalar(30, 100, 40));
    EXPECT_EQ(r.color, BagColor::BLUE);
}

TEST(ColorClassifierTest, DarknessOutranksGreen) {
    auto r = ColorClassifier::decide(matches(0.0, 90.0, 0.0), cv::Scalar(60, 200, 119));
    EXPECT_EQ(r.color, BagColor::BLACK);
}

TEST(ColorClassifierTest, RuleConfidenceIsCappedAtNinetyFive) {
    EXPECT_DOUBLE_EQ(ColorClassifier::decide(matches(100.0, 0.0, 0.0), cv::Scalar(30, 200, 200)).confidence, 95.0);
    EXPECT_DOUBLE_EQ(ColorClassifier::decide(matches(0.0, 100.0, 0.0), cv::Scalar(60, 200, 200)).confidence, 95.0);
    EXPECT_DOUBLE_EQ(ColorClassifier::decide(matches(0.0, 0.0, 100.0), cv::Scalar(0, 0, 0)).confidence, 95.0);
}

TEST(ColorClassifierTest, CategoryMappingIsFixed) {
    EXPECT_EQ(awss::category_for(BagColor::BLUE), WasteCategory::RECYCLING);
    EXPECT_EQ(awss::category_for(BagColor::GREEN), WasteCategory::COMPOST);
    EXPECT_EQ(awss::category_for(BagColor::BLACK), WasteCategory::GARBAGE);
    EXPECT_STREQ(awss::category_name(WasteCategory::RECYCLING), "RECYCLING");
    EXPECT_STREQ(awss::color_name(BagColor::GREEN), "green");
}

TEST(ColorClassifierTest, ClassifiesSolidFrames) {
    ColorClassifier classifier;

    auto blue = classifier.classify(solid_hsv(30, 200, 220));
    EXPECT_EQ(blue.color, BagColor::BLUE);
    EXPECT_DOUBLE_EQ(blue.confidence, 95.0);
    ASSERT_EQ(blue.matches.size(), 3u);
    EXPECT_DOUBLE_EQ(blue.matches[0].percent, 100.0);

    auto green = classifier.classify(solid_hsv(70, 200, 200));
    EXPECT_EQ(green.color, BagColor::GREEN);
    EXPECT_EQ(green.category, WasteCategory::COMPOST);

    auto black = classifier.classify(solid_hsv(0, 0, 50));
    EXPECT_EQ(black.color, BagColor::BLACK);
    EXPECT_NEAR(black.confidence, 58.33, 0.01);
    EXPECT_DOUBLE_EQ(black.mean_hsv[2], 50.0);
}

TEST(ColorClassifierTest, NoMatchAnywhereFallsBackToBlueAtZero) {
    ColorClassifier classifier;
    auto r = classifier.classify(solid_hsv(120, 200, 200));
    EXPECT_EQ(r.color, BagColor::BLUE);
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
    EXPECT_EQ(r.reason, "Best match: 0.0%");
}

TEST(ColorClassifierTest, OnlyCentreRegionIsAnalysed) {
    // Dark border, blue centre half
    cv::Mat hsv = solid_hsv(0, 0, 0, 80, 80);
    hsv(ColorClassifier::centerRoi(hsv.size())).setTo(cv::Scalar(30, 200, 220));

    ColorClassifier classifier;
    auto r = classifier.classify(hsv);
    EXPECT_EQ(r.color, BagColor::BLUE);
    EXPECT_DOUBLE_EQ(r.matches[0].percent, 100.0);
    EXPECT_DOUBLE_EQ(r.mean_hsv[2], 220.0);
}

TEST(ColorClassifierTest, CentreRoiBounds) {
    cv::Rect roi = ColorClassifier::centerRoi(cv::Size(1920, 1080));
    EXPECT_EQ(roi, cv::Rect(480, 270, 960, 540));

    roi = ColorClassifier::centerRoi(cv::Size(7, 5));
    EXPECT_EQ(roi, cv::Rect(1, 1, 4, 2));
}

TEST(ColorClassifierTest, PartialMatchPercentages) {
    // ROI is 20x20; top half blue-ish, bottom half neutral grey
    cv::Mat hsv = solid_hsv(120, 10, 200, 40, 40);
    cv::Rect roi = ColorClassifier::centerRoi(hsv.size());
    hsv(cv::Rect(roi.x, roi.y, roi.width, roi.height / 2)).setTo(cv::Scalar(30, 200, 220));

    ColorClassifier classifier;
    auto r = classifier.classify(hsv);
    EXPECT_DOUBLE_EQ(r.matches[0].percent, 50.0);
    EXPECT_EQ(r.color, BagColor::BLUE);
    EXPECT_DOUBLE_EQ(r.confidence, 50.0);
}

TEST(ColorClassifierTest, RangesLoadFromYaml) {
    YAML::Node cfg = YAML::Load(
        "classifier:\n"
        "  blue: {lower: [100, 50, 50], upper: [130, 255, 255]}\n");
    ColorClassifier classifier(cfg);

    EXPECT_EQ(classifier.range(BagColor::BLUE).lower, cv::Scalar(100, 50, 50));
    EXPECT_EQ(classifier.range(BagColor::GREEN).lower, cv::Scalar(51, 40, 120));

    auto r = classifier.classify(solid_hsv(115, 200, 200));
    EXPECT_EQ(r.color, BagColor::BLUE);
}

TEST(ColorClassifierTest, RejectsEmptyImage) {
    ColorClassifier classifier;
    EXPECT_THROW(classifier.classify(cv::Mat()), std::invalid_argument);
    EXPECT_THROW(classifier.classify(solid_hsv(0, 0, 0, 1, 1)), std::invalid_argument);
}
