// engine.hpp
#pragma once

#include <yaml-cpp/yaml.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

#include "capture.hpp"
#include "capture_store.hpp"
#include "classifier.hpp"
#include "detection_record.hpp"
#include "pipeline.hpp"
#include "status_store.hpp"
#include "trigger.hpp"

namespace awss {

/**
 * Owns the sensor, the camera and the background worker for one station.
 *
 * start()/stop() are idempotent and may be called from any thread. While a
 * session runs, a single worker thread loops:
 *   wait for trigger -> run pipeline -> update status -> cool down
 * Failures inside an iteration become ERROR records; the worker only exits
 * when the running flag is cleared.
 */
class SortingEngine {
public:
    SortingEngine(const YAML::Node& config,
                  std::unique_ptr<TriggerInput> trigger,
                  std::unique_ptr<FrameSource> camera);
    ~SortingEngine();

    SortingEngine(const SortingEngine&) = delete;
    SortingEngine& operator=(const SortingEngine&) = delete;

    // false if the camera could not be opened (reason in lastError).
    bool start();
    void stop();
    SystemStatus status() const { return status_.snapshot(); }

    // Single shot that skips the trigger. Opens the camera for the shot when
    // no session is running.
    DetectionRecord processOnce();

    bool running() const { return running_; }
    const TriggerMonitor& monitor() const { return monitor_; }
    const DetectionPipeline& pipeline() const { return *pipeline_; }
    const CaptureStore& store() const { return *store_; }

private:
    void workerLoop();
    DetectionRecord runDetection();
    void cooldown();

    std::chrono::milliseconds warmup_;
    std::chrono::milliseconds verify_;
    std::chrono::milliseconds clear_timeout_;
    std::chrono::milliseconds clear_poll_;
    std::chrono::milliseconds cooldown_;
    std::chrono::milliseconds error_backoff_;

    std::unique_ptr<TriggerInput> trigger_;
    std::unique_ptr<FrameSource> camera_;
    TriggerMonitor monitor_;
    ColorClassifier classifier_;
    std::unique_ptr<CaptureStore> store_;
    std::unique_ptr<DetectionPipeline> pipeline_;
    StatusStore status_;

    std::mutex control_mutex_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

}  // namespace awss
