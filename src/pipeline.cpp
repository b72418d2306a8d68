// pipeline.cpp
#include "pipeline.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace awss {

DetectionPipeline::DetectionPipeline(FrameSource& camera, const ColorClassifier& classifier,
                                     CaptureStore& store, const YAML::Node& config)
    : camera_(camera), classifier_(classifier), store_(store) {
    double settle_s = setting<double>(config, "pipeline", "settle_s", 1.0);
    settle_ = std::chrono::milliseconds(static_cast<int64_t>(settle_s * 1000.0));
    swap_red_blue_ = setting<bool>(config, "camera", "swap_red_blue", true);
}

DetectionRecord DetectionPipeline::run() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    uint64_t run_id = ++total_runs_;

    // Let the bag come to rest in front of the camera
    sleep_for(settle_);

    Timer timer;
    Frame frame;
    if (!camera_.capture(frame) || frame.image.empty()) {
        throw std::runtime_error("Camera capture failed");
    }

    cv::Mat hsv;
    cv::cvtColor(frame.image, hsv, swap_red_blue_ ? cv::COLOR_RGB2HSV : cv::COLOR_BGR2HSV);

    StoredImage stored = store_.saveImage(frame.image, frame.captured_at);

    ClassificationResult result = classifier_.classify(hsv);

    DetectionRecord record = DetectionRecord::fromClassification(
        result, frame.captured_at, stored.path, stored.filename);

    {
        std::lock_guard<std::mutex> results_lock(results_mutex_);
        results_.push_back(record);
    }
    store_.appendLog(record);

    Logger::log(Logger::INFO, "Bag #" + std::to_string(run_id) + ": " + record.color +
                " -> " + record.category + " (" + format_fixed(record.confidence, 1) + "%, " +
                record.reason + ") in " + format_fixed(timer.elapsed_ms(), 1) + " ms");
    return record;
}

std::vector<DetectionRecord> DetectionPipeline::results() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return results_;
}

}  // namespace awss
