// engine.cpp
#include "engine.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <filesystem>

namespace awss {

using std::chrono::milliseconds;

namespace {

milliseconds seconds_setting(const YAML::Node& config, const char* section,
                             const char* key, double fallback) {
    double s = setting<double>(config, section, key, fallback);
    return milliseconds(static_cast<int64_t>(s * 1000.0));
}

}  // namespace

SortingEngine::SortingEngine(const YAML::Node& config,
                             std::unique_ptr<TriggerInput> trigger,
                             std::unique_ptr<FrameSource> camera)
    : trigger_(std::move(trigger)),
      camera_(std::move(camera)),
      monitor_(*trigger_, config),
      classifier_(config) {
    warmup_ = seconds_setting(config, "camera", "warmup_s", 1.5);
    verify_ = seconds_setting(config, "sensor", "verify_s", 2.0);
    clear_timeout_ = seconds_setting(config, "worker", "clear_timeout_s", 2.0);
    clear_poll_ = milliseconds(setting<int>(config, "worker", "clear_poll_ms", 50));
    cooldown_ = seconds_setting(config, "worker", "cooldown_s", 1.0);
    error_backoff_ = milliseconds(setting<int>(config, "worker", "error_backoff_ms", 500));

    std::filesystem::path data_dir = setting<std::string>(config, "pipeline", "data_dir", "data");
    store_ = std::make_unique<CaptureStore>((data_dir / "captures").string(),
                                            (data_dir / "logs").string());
    pipeline_ = std::make_unique<DetectionPipeline>(*camera_, classifier_, *store_, config);
}

SortingEngine::~SortingEngine() {
    stop();
}

bool SortingEngine::start() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (running_) {
        Logger::log(Logger::DEBUG, "start ignored, already running");
        return true;
    }

    Logger::log(Logger::INFO, "Starting camera...");
    if (!camera_->start()) {
        status_.setError("Camera failed to start");
        Logger::log(Logger::ERROR, "Camera failed to start");
        return false;
    }
    sleep_for(warmup_);

    std::string sensor_error;
    if (verify_.count() > 0) {
        try {
            double clear = monitor_.verify(verify_);
            if (clear > 0.9) {
                Logger::log(Logger::INFO, "IR sensor looks OK");
            } else {
                Logger::log(Logger::WARNING, "IR sensor may be blocked / misaligned");
            }
        } catch (const std::exception& e) {
            sensor_error = std::string("Sensor read failed: ") + e.what();
            Logger::log(Logger::WARNING, "IR sensor check failed: " + sensor_error);
        }
    }

    status_.beginSession(std::chrono::system_clock::now());
    if (!sensor_error.empty()) {
        status_.setError(sensor_error);
    }
    running_ = true;
    worker_ = std::thread(&SortingEngine::workerLoop, this);

    Logger::log(Logger::INFO, "System started");
    return true;
}

void SortingEngine::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!running_) return;

    running_ = false;
    if (worker_.joinable()) {
        worker_.join();
    }
    camera_->stop();
    trigger_->release();
    status_.endSession();
    Logger::log(Logger::INFO, "System stopped");
}

DetectionRecord SortingEngine::processOnce() {
    std::lock_guard<std::mutex> lock(control_mutex_);

    const bool in_session = running_;
    if (!in_session && !camera_->start()) {
        DetectionRecord rec = DetectionRecord::error("Camera failed to start");
        status_.record(rec);
        return rec;
    }

    DetectionRecord rec = runDetection();

    if (!in_session) {
        camera_->stop();
        trigger_->release();
    }
    return rec;
}

DetectionRecord SortingEngine::runDetection() {
    DetectionRecord rec;
    try {
        rec = pipeline_->run();
    } catch (const std::exception& e) {
        Logger::log(Logger::ERROR, std::string("Detection failed: ") + e.what());
        rec = DetectionRecord::error(e.what());
    }
    status_.record(rec);
    return rec;
}

void SortingEngine::workerLoop() {
    Logger::log(Logger::INFO, "Worker running, waiting for bags");

    while (running_) {
        bool triggered = false;
        try {
            triggered = monitor_.waitForTrigger(&running_);
        } catch (const std::exception& e) {
            Logger::log(Logger::WARNING, std::string("Sensor read failed: ") + e.what());
            status_.setError(std::string("Sensor read failed: ") + e.what());
            sleep_for(error_backoff_);
            continue;
        }

        // stop() may have landed while we were blocked
        if (!triggered || !running_) break;

        Logger::log(Logger::DEBUG, "Trigger confirmed");
        runDetection();
        cooldown();
    }

    Logger::log(Logger::INFO, "Worker exited");
}

void SortingEngine::cooldown() {
    try {
        if (!monitor_.waitForClear(clear_timeout_, clear_poll_)) {
            Logger::log(Logger::WARNING, "Beam still broken after " +
                        format_fixed(clear_timeout_.count() / 1000.0, 1) + " s");
        }
    } catch (const std::exception& e) {
        const std::string message = std::string("Sensor read failed during cooldown: ") + e.what();
        Logger::log(Logger::WARNING, message);
        status_.setError(message);
    }
    sleep_for(cooldown_);
}

}  // namespace awss
