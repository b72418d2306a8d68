// capture.cpp
#include "capture.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <sstream>

namespace awss {

FrameCapture::FrameCapture(const YAML::Node& config) {
    backend_ = setting<std::string>(config, "camera", "backend", "v4l2");
    pipeline_ = setting<std::string>(config, "camera", "pipeline", "");
    device_ = setting<int>(config, "camera", "device", 0);
    width_ = setting<int>(config, "camera", "width", 1920);
    height_ = setting<int>(config, "camera", "height", 1080);
    fps_ = setting<int>(config, "camera", "fps", 30);
}

FrameCapture::~FrameCapture() {
    stop();
}

bool FrameCapture::start() {
    if (cap_.isOpened()) return true;

    if (backend_ == "gstreamer") {
        return initializeGStreamer();
    } else if (backend_ == "v4l2") {
        return initializeV4L2();
    } else {
        Logger::log(Logger::ERROR, "Unknown camera backend: " + backend_);
        return false;
    }
}

bool FrameCapture::initializeGStreamer() {
    if (pipeline_.empty()) {
        // Still-capture pipeline for the Pi camera module
        std::stringstream ss;
        ss << "libcamerasrc "
           << "! video/x-raw,width=" << width_
           << ",height=" << height_
           << ",framerate=" << fps_ << "/1 "
           << "! videoconvert "
           << "! video/x-raw,format=BGR "
           << "! appsink drop=true max-buffers=1";
        pipeline_ = ss.str();
    }

    Logger::log(Logger::INFO, "GStreamer pipeline: " + pipeline_);

    cap_.open(pipeline_, cv::CAP_GSTREAMER);

    if (!cap_.isOpened()) {
        Logger::log(Logger::ERROR, "Failed to open GStreamer pipeline");
        return false;
    }

    return true;
}

bool FrameCapture::initializeV4L2() {
    cap_.open(device_, cv::CAP_V4L2);

    if (!cap_.isOpened()) {
        Logger::log(Logger::ERROR, "Failed to open camera device " + std::to_string(device_));
        return false;
    }

    cap_.set(cv::CAP_PROP_FRAME_WIDTH, width_);
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, height_);
    cap_.set(cv::CAP_PROP_FPS, fps_);

    configureCameraSettings();
    return true;
}

void FrameCapture::configureCameraSettings() {
    // Only the newest frame matters, anything queued is stale by the time
    // the settle delay has passed
    cap_.set(cv::CAP_PROP_BUFFERSIZE, 1);
}

bool FrameCapture::capture(Frame& frame) {
    if (!cap_.isOpened()) {
        return false;
    }
    // Drop whatever the driver buffered while we were waiting for a trigger
    cap_.grab();
    cv::Mat image;
    if (!cap_.read(image) || image.empty()) {
        return false;
    }
    frame.image = image;
    frame.captured_at = std::chrono::system_clock::now();
    return true;
}

void FrameCapture::stop() {
    if (cap_.isOpened()) {
        cap_.release();
    }
}

// ======= Simulated camera =======

SimulatedFrameSource::SimulatedFrameSource(int width, int height, std::vector<cv::Scalar> bgr_colors)
    : width_(width), height_(height), colors_(std::move(bgr_colors)) {}

SimulatedFrameSource::SimulatedFrameSource(const YAML::Node& config) {
    width_ = setting<int>(config, "simulation", "width", 640);
    height_ = setting<int>(config, "simulation", "height", 480);

    const YAML::Node sim = config["simulation"];
    if (sim && sim.IsMap() && sim["colors"]) {
        for (const auto& c : sim["colors"]) {
            auto bgr = c.as<std::vector<int>>();
            if (bgr.size() >= 3) {
                colors_.push_back(cv::Scalar(bgr[0], bgr[1], bgr[2]));
            }
        }
    }

    std::string image_path = setting<std::string>(config, "simulation", "image", "");
    if (!image_path.empty()) {
        image_ = cv::imread(image_path, cv::IMREAD_COLOR);
        if (image_.empty()) {
            Logger::log(Logger::WARNING, "Could not read simulation image: " + image_path);
        }
    }

    if (colors_.empty()) {
        // blue, green and black bags as the Pi camera delivers them
        colors_ = {cv::Scalar(220, 220, 20), cv::Scalar(20, 200, 40), cv::Scalar(30, 30, 30)};
    }
}

bool SimulatedFrameSource::start() {
    started_ = true;
    start_count_++;
    return true;
}

void SimulatedFrameSource::stop() {
    started_ = false;
}

bool SimulatedFrameSource::capture(Frame& frame) {
    int pending = fail_captures_.load();
    while (pending > 0) {
        if (fail_captures_.compare_exchange_weak(pending, pending - 1)) {
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!image_.empty()) {
        frame.image = image_.clone();
    } else {
        cv::Scalar color = colors_.empty() ? cv::Scalar(0, 0, 0) : colors_[next_color_ % colors_.size()];
        next_color_++;
        frame.image = cv::Mat(height_, width_, CV_8UC3, color);
    }
    frame.captured_at = std::chrono::system_clock::now();
    return true;
}

void SimulatedFrameSource::setColors(std::vector<cv::Scalar> bgr_colors) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_ = std::move(bgr_colors);
    next_color_ = 0;
}

}  // namespace awss
