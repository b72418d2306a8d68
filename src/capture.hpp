// capture.hpp
#pragma once

#include <opencv2/opencv.hpp>
#include <yaml-cpp/yaml.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace awss {

struct Frame {
    cv::Mat image;  // 8-bit, 3 channels, BGR
    std::chrono::system_clock::time_point captured_at;
};

// Single-consumer still camera.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool capture(Frame& frame) = 0;
};

class FrameCapture : public FrameSource {
public:
    explicit FrameCapture(const YAML::Node& config);
    ~FrameCapture() override;

    bool start() override;
    void stop() override;
    bool capture(Frame& frame) override;

private:
    std::string backend_;
    std::string pipeline_;
    int device_;
    int width_;
    int height_;
    int fps_;

    cv::VideoCapture cap_;

    bool initializeGStreamer();
    bool initializeV4L2();
    void configureCameraSettings();
};

// Synthetic frames: cycles through solid colours, or repeats a still image.
class SimulatedFrameSource : public FrameSource {
public:
    SimulatedFrameSource(int width, int height, std::vector<cv::Scalar> bgr_colors);
    explicit SimulatedFrameSource(const YAML::Node& config);

    bool start() override;
    void stop() override;
    bool capture(Frame& frame) override;

    void setColors(std::vector<cv::Scalar> bgr_colors);
    void setImage(const cv::Mat& bgr) { std::lock_guard<std::mutex> lock(mutex_); image_ = bgr.clone(); }
    void failNextCaptures(int n) { fail_captures_ = n; }

    bool started() const { return started_; }
    int startCount() const { return start_count_; }

private:
    std::mutex mutex_;
    int width_;
    int height_;
    std::vector<cv::Scalar> colors_;
    cv::Mat image_;
    size_t next_color_{0};
    std::atomic<bool> started_{false};
    std::atomic<int> start_count_{0};
    std::atomic<int> fail_captures_{0};
};

}  // namespace awss
