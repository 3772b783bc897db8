#include "CaptureFrameSource.h"
#include "CameraTuner.h"
#include "Config.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

CaptureFrameSource::CaptureFrameSource(std::string source)
    : source_(std::move(source)) {}

CaptureFrameSource::~CaptureFrameSource() {
    stop();
}

void CaptureFrameSource::start() {
    if (running_) return;

    camtuner::Settings settings;
    settings.width = config::CAPTURE_WIDTH;
    settings.height = config::CAPTURE_HEIGHT;
    settings.fps = config::CAPTURE_FPS;
    settings.warmupFrames = config::CAM_WARMUP_FRAMES;
#ifdef _WIN32
    settings.backendOrder = {cv::CAP_DSHOW, cv::CAP_MSMF};
#else
    settings.backendOrder = {cv::CAP_V4L2, cv::CAP_ANY};
#endif

    auto opened = camtuner::openSource(source_, settings);
    if (!opened.ok || !opened.cap.isOpened()) {
        throw std::runtime_error("Unable to open video source " + source_);
    }

    live_ = opened.cap.get(cv::CAP_PROP_FRAME_COUNT) <= 0;
    if (live_) {
        if (config::CAM_FORCE_MJPEG) {
            opened.cap.set(cv::CAP_PROP_FOURCC, cv::VideoWriter::fourcc('M','J','P','G'));
        }
        opened.cap.set(cv::CAP_PROP_BUFFERSIZE, 1);
    }

    cap_ = std::make_unique<cv::VideoCapture>(std::move(opened.cap));
    exchange_.reset();
    running_ = true;
    thread_ = std::thread(&CaptureFrameSource::captureLoop, this);

    std::cout << "[Camera " << source_ << "] Started ("
              << cap_->get(cv::CAP_PROP_FRAME_WIDTH) << "x" << cap_->get(cv::CAP_PROP_FRAME_HEIGHT)
              << " @" << cap_->get(cv::CAP_PROP_FPS) << "fps)" << std::endl;
    for (auto& line : opened.log) {
        std::cout << "  prop " << line << std::endl;
    }
}

void CaptureFrameSource::stop() {
    if (!running_) return;
    running_ = false;
    exchange_.shutdown();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (cap_) {
        cap_->release();
        cap_.reset();
    }
    std::cout << "[Camera " << source_ << "] Stopped" << std::endl;
}

bool CaptureFrameSource::latest(cv::Mat& out) {
    return exchange_.acquire(out);
}

void CaptureFrameSource::captureLoop() {
    // Files decode as fast as the disk allows; pace them at their nominal rate.
    double fps = cap_->get(cv::CAP_PROP_FPS);
    if (fps <= 0) fps = config::CAPTURE_FPS;
    const auto filePeriod = std::chrono::duration<double>(1.0 / fps);

    while (running_ && cap_ && cap_->isOpened()) {
        auto start = std::chrono::steady_clock::now();
        cv::Mat frame;
        if (!cap_->read(frame) || frame.empty()) {
            if (!live_) {
                std::cout << "[Camera " << source_ << "] End of stream" << std::endl;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            continue;
        }

        exchange_.publish(frame);

        if (!live_) {
            std::this_thread::sleep_until(start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(filePeriod));
        }
    }
}
