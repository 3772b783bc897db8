#pragma once

#include "FrameSource.h"
#include "LatestFrameExchange.h"
#include <opencv2/videoio.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

// Frame source backed by a cv::VideoCapture drained on its own thread.
// `source` is a camera index ("0", "1") or anything VideoCapture opens by
// name: a file path, a stream URL or a GStreamer pipeline.
class CaptureFrameSource : public FrameSource {
public:
    explicit CaptureFrameSource(std::string source);
    ~CaptureFrameSource() override;

    CaptureFrameSource(const CaptureFrameSource&) = delete;
    CaptureFrameSource& operator=(const CaptureFrameSource&) = delete;

    // Throws std::runtime_error if the device cannot be opened.
    void start();
    void stop();

    bool latest(cv::Mat& out) override;
    std::string describe() const override { return source_; }

private:
    void captureLoop();

    std::string source_;
    bool live_{false};
    std::unique_ptr<cv::VideoCapture> cap_;
    LatestFrameExchange exchange_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};
