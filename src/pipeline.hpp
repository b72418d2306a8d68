// pipeline.hpp
#pragma once

#include <yaml-cpp/yaml.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

#include "capture.hpp"
#include "capture_store.hpp"
#include "classifier.hpp"
#include "detection_record.hpp"

namespace awss {

/**
 * One confirmed trigger in, one persisted and classified record out:
 * settle -> capture -> HSV -> save JPEG -> classify -> record -> day log.
 *
 * run() throws std::runtime_error when the frame cannot be captured or any
 * part of it cannot be persisted. Calls are serialised because the camera
 * has a single consumer.
 */
class DetectionPipeline {
public:
    DetectionPipeline(FrameSource& camera, const ColorClassifier& classifier,
                      CaptureStore& store, const YAML::Node& config);

    DetectionRecord run();

    uint64_t totalRuns() const { return total_runs_; }
    std::vector<DetectionRecord> results() const;
    std::chrono::milliseconds settleDelay() const { return settle_; }

private:
    FrameSource& camera_;
    const ColorClassifier& classifier_;
    CaptureStore& store_;

    std::chrono::milliseconds settle_;
    bool swap_red_blue_;

    std::mutex run_mutex_;
    mutable std::mutex results_mutex_;
    std::vector<DetectionRecord> results_;
    std::atomic<uint64_t> total_runs_{0};
};

}  // namespace awss
