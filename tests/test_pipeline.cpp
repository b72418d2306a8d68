#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "capture.hpp"
#include "capture_store.hpp"
#include "classifier.hpp"
#include "pipeline.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using awss::test::bgr_from_hsv;

namespace {

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest()
        : camera_(64, 48, {bgr_from_hsv(30, 200, 220)}),
          store_((tmp_.path() / "captures").string(), (tmp_.path() / "logs").string()) {}

    YAML::Node config(double settle_s = 0.0, bool swap = false) {
        YAML::Node cfg;
        cfg["pipeline"]["settle_s"] = settle_s;
        cfg["camera"]["swap_red_blue"] = swap;
        return cfg;
    }

    awss::test::TempDir tmp_;
    awss::SimulatedFrameSource camera_;
    awss::ColorClassifier classifier_;
    awss::CaptureStore store_;
};

}  // namespace

TEST_F(PipelineTest, ProducesPersistedClassifiedRecord) {
    awss::DetectionPipeline pipeline(camera_, classifier_, store_, config());

    auto rec = pipeline.run();

    EXPECT_EQ(rec.category, "RECYCLING");
    EXPECT_EQ(rec.color, "blue");
    EXPECT_DOUBLE_EQ(rec.confidence, 95.0);
    ASSERT_TRUE(rec.image_path.has_value());
    ASSERT_TRUE(rec.image_filename.has_value());
    EXPECT_TRUE(fs::exists(*rec.image_path));
    EXPECT_EQ(fs::path(*rec.image_path).filename().string(), *rec.image_filename);
    EXPECT_EQ(rec.image_filename->rfind("bag_", 0), 0u);
    ASSERT_TRUE(rec.hsv.has_value());
    ASSERT_EQ(rec.color_matches.size(), 3u);
    EXPECT_EQ(rec.color_matches[0].first, "blue");
    EXPECT_FALSE(rec.isError());

    std::ifstream log(store_.logPath(rec.timestamp));
    ASSERT_TRUE(log.good());
    std::string content((std::istreambuf_iterator<char>(log)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("Category: RECYCLING"), std::string::npos);
    EXPECT_NE(content.find("Image: " + *rec.image_path), std::string::npos);
}

TEST_F(PipelineTest, KeepsInMemoryResultsAndCounter) {
    camera_.setColors({bgr_from_hsv(30, 200, 220), bgr_from_hsv(70, 200, 200), cv::Scalar(20, 20, 20)});
    awss::DetectionPipeline pipeline(camera_, classifier_, store_, config());

    EXPECT_EQ(pipeline.run().category, "RECYCLING");
    EXPECT_EQ(pipeline.run().category, "COMPOST");
    EXPECT_EQ(pipeline.run().category, "GARBAGE");

    EXPECT_EQ(pipeline.totalRuns(), 3u);
    auto results = pipeline.results();
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].color, "blue");
    EXPECT_EQ(results[2].color, "black");
}

TEST_F(PipelineTest, SwappedChannelOrderUsesCalibratedThresholds) {
    // Blue bag as the Pi camera hands it over: red and blue channels swapped
    cv::Scalar true_bgr = bgr_from_hsv(30, 200, 220);
    camera_.setColors({cv::Scalar(true_bgr[2], true_bgr[1], true_bgr[0])});
    awss::DetectionPipeline pipeline(camera_, classifier_, store_, config(0.0, true));

    EXPECT_EQ(pipeline.run().color, "blue");
}

TEST_F(PipelineTest, WaitsForSettleDelay) {
    awss::DetectionPipeline pipeline(camera_, classifier_, store_, config(0.2));
    EXPECT_EQ(pipeline.settleDelay(), std::chrono::milliseconds(200));

    awss::Timer timer;
    pipeline.run();
    EXPECT_GE(timer.elapsed_ms(), 200.0);
}

TEST_F(PipelineTest, CaptureFailureThrows) {
    awss::DetectionPipeline pipeline(camera_, classifier_, store_, config());
    camera_.failNextCaptures(1);

    EXPECT_THROW(pipeline.run(), std::runtime_error);
    EXPECT_TRUE(pipeline.results().empty());

    EXPECT_EQ(pipeline.run().color, "blue");
}

TEST_F(PipelineTest, ImageWriteFailureThrowsWithPath) {
    awss::DetectionPipeline pipeline(camera_, classifier_, store_, config());
    fs::remove_all(store_.capturesDir());
    std::ofstream(store_.capturesDir()) << "blocked";

    try {
        pipeline.run();
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to write image to"), std::string::npos);
    }
    EXPECT_TRUE(pipeline.results().empty());
}
