#include "FrameProcessingLoop.h"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

FrameProcessingLoop::FrameProcessingLoop(VisionRuntime& runtime, const CanvasLayout& layout, cv::Size workSize)
    : layout_(layout)
    , workSize_(workSize)
    , board_(runtime, layout)
    , strokes_(board_)
    , calibrator_(runtime, layout)
{
    pending_ = active_;
    std::lock_guard<std::mutex> lock(tickMutex_);
    if (!runtime.ready()) {
        capabilityError_ = "ArUco module not available: " + runtime.error();
        std::cerr << "[Loop] Calibration disabled for this session: " << capabilityError_ << std::endl;
    }
    publishLocked();
}

FrameProcessingLoop::~FrameProcessingLoop() {
    std::lock_guard<std::mutex> lock(tickMutex_);
    slots_.clear();
}

void FrameProcessingLoop::attach(int id, std::shared_ptr<FrameSource> source, const cv::Scalar& color) {
    if (!source) {
        throw std::invalid_argument("channel " + std::to_string(id) + " needs a frame source");
    }
    std::lock_guard<std::mutex> lock(tickMutex_);
    if (slots_.count(id)) {
        throw std::invalid_argument("channel " + std::to_string(id) + " is already attached");
    }

    ChannelConfig cfg;
    cfg.id = id;
    cfg.color = color;
    cfg.workSize = workSize_;

    Slot slot;
    slot.channel = std::make_unique<CameraChannel>(cfg, layout_, active_);
    slot.source = std::move(source);
    std::cout << "[Loop] Channel " << id << " reading from " << slot.source->describe() << std::endl;
    slots_.emplace(id, std::move(slot));
    strokes_.addChannel(id, color);
    publishLocked();
}

void FrameProcessingLoop::detach(int id) {
    std::lock_guard<std::mutex> lock(tickMutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return;

    it->second.channel->release();
    slots_.erase(it);
    strokes_.removeChannel(id);
    {
        std::lock_guard<std::mutex> pub(publishMutex_);
        previews_.erase(id);
    }
    publishLocked();
}

void FrameProcessingLoop::syncSettingsLocked() {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    if (!settingsDirty_) return;
    active_ = pending_;
    settingsDirty_ = false;
    for (auto& kv : slots_) {
        kv.second.channel->applySettings(active_);
    }
}

int FrameProcessingLoop::tick() {
    std::lock_guard<std::mutex> lock(tickMutex_);
    syncSettingsLocked();

    int processed = 0;
    for (auto& kv : slots_) {
        CameraChannel& channel = *kv.second.channel;
        if (!kv.second.source->latest(frame_)) {
            continue;
        }

        FiducialCalibrator* calibrator = capabilityError_.empty() ? &calibrator_ : nullptr;
        ChannelTick result = channel.process(frame_, calibrator, strokes_, active_);
        if (!result.frameProcessed) continue;
        ++processed;

        if (!result.capabilityError.empty() && capabilityError_.empty()) {
            capabilityError_ = result.capabilityError;
            std::cerr << "[Loop] Calibration disabled for this session: " << capabilityError_ << std::endl;
        }
        if (result.calibration && result.manualAttempt) {
            manualFailure_ = *result.calibration != CalibrationOutcome::Calibrated;
        } else if (result.calibration == CalibrationOutcome::Calibrated) {
            manualFailure_ = false;
        }
    }

    ++ticks_;
    framesProcessed_ += static_cast<uint64_t>(processed);
    publishLocked();
    return processed;
}

void FrameProcessingLoop::run(const std::atomic<bool>& stop) {
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(1.0 / std::max(1, config::DISPLAY_RATE_HZ)));

    auto next = clock::now();
    auto lastLog = next;
    uint64_t framesAtLog = framesProcessed_.load();

    std::cout << "[Loop] Running at " << config::DISPLAY_RATE_HZ << " Hz" << std::endl;
    while (!stop.load()) {
        tick();

        auto now = clock::now();
        const double elapsed = std::chrono::duration<double>(now - lastLog).count();
        if (elapsed >= config::FPS_LOG_INTERVAL_S) {
            const uint64_t frames = framesProcessed_.load();
            fps_ = static_cast<double>(frames - framesAtLog) / elapsed;
            framesAtLog = frames;
            lastLog = now;

            LoopStatus s = status();
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1) << "[Perf] " << s.fps << " fps";
            for (const auto& ch : s.channels) {
                oss << " | ch" << ch.id << " "
                    << (ch.state == CalibrationState::Calibrated ? "cal" : "uncal") << " "
                    << (ch.tracking ? "tracking" : "lost");
            }
            std::cout << oss.str() << std::endl;
        }

        next += period;
        if (next < now) next = now;
        std::this_thread::sleep_until(next);
    }
    std::cout << "[Loop] Stopped after " << status().ticks << " ticks" << std::endl;
}

void FrameProcessingLoop::clear() {
    std::lock_guard<std::mutex> lock(tickMutex_);
    strokes_.clear();
    std::cout << "[Loop] Canvas cleared" << std::endl;
    publishLocked();
}

bool FrameProcessingLoop::reset(int id) {
    std::lock_guard<std::mutex> lock(tickMutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return false;
    it->second.channel->reset();
    strokes_.breakStroke(id);
    manualFailure_ = false;
    publishLocked();
    return true;
}

bool FrameProcessingLoop::calibrate(int id) {
    std::lock_guard<std::mutex> lock(tickMutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return false;
    it->second.channel->requestCalibration();
    return true;
}

PipelineSettings FrameProcessingLoop::settings() const {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    return pending_;
}

void FrameProcessingLoop::applySettings(const PipelineSettings& settings) {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    pending_ = settings;
    pending_.sanitize();
    settingsDirty_ = true;
}

void FrameProcessingLoop::adjustMinArea(int steps) {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    pending_.adjustMinArea(steps);
    settingsDirty_ = true;
    std::cout << "[Loop] Minimum pointer area " << pending_.tracker.minArea << " px^2" << std::endl;
}

void FrameProcessingLoop::setDrawingEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    pending_.drawingEnabled = enabled;
    settingsDirty_ = true;
}

std::string FrameProcessingLoop::statusMessageLocked(bool calibrated) const {
    if (!capabilityError_.empty()) {
        return "ERROR: ArUco module not available";
    }
    if (manualFailure_) {
        return "Fiducials not detected. All 4 markers must be visible.";
    }
    if (calibrated) {
        return active_.drawingEnabled
            ? "Calibrated! Drawing enabled. Use green objects to draw."
            : "Calibrated! Drawing paused.";
    }
    return "Point both cameras at the whiteboard to calibrate...";
}

void FrameProcessingLoop::publishLocked() {
    LoopStatus s;
    s.calibrated = !slots_.empty();
    for (const auto& kv : slots_) {
        ChannelStatus cs = kv.second.channel->status();
        cs.segments = strokes_.segmentCount(kv.first);
        s.calibrated = s.calibrated && cs.state == CalibrationState::Calibrated;
        s.channels.push_back(std::move(cs));
    }
    s.capabilityError = capabilityError_;
    s.message = statusMessageLocked(s.calibrated);
    s.settings = active_;
    s.ticks = ticks_;
    s.fps = fps_.load();

    // Cursor rings go on a copy; the persistent raster only ever holds strokes.
    cv::Mat canvas = board_.snapshot();
    const cv::Scalar cursor = active_.drawingEnabled ? cv::Scalar(0, 0, 255) : cv::Scalar(0, 165, 255);
    for (const auto& cs : s.channels) {
        if (!cs.canvasPoint) continue;
        cv::circle(canvas, *cs.canvasPoint, config::CURSOR_RADIUS_PX, cursor, 2, cv::LINE_AA);
        cv::circle(canvas, *cs.canvasPoint, 3, cursor, cv::FILLED, cv::LINE_AA);
    }

    std::map<int, cv::Mat> previews;
    for (const auto& kv : slots_) {
        cv::Mat view = kv.second.channel->renderPreview(active_.drawingEnabled);
        if (!view.empty()) previews.emplace(kv.first, std::move(view));
    }

    std::lock_guard<std::mutex> lock(publishMutex_);
    published_ = std::move(s);
    canvasFrame_ = canvas;
    for (auto& kv : previews) {
        previews_[kv.first] = kv.second;
    }
}

LoopStatus FrameProcessingLoop::status() const {
    std::lock_guard<std::mutex> lock(publishMutex_);
    return published_;
}

bool FrameProcessingLoop::calibrated() const {
    std::lock_guard<std::mutex> lock(publishMutex_);
    return published_.calibrated;
}

cv::Mat FrameProcessingLoop::canvasFrame() const {
    std::lock_guard<std::mutex> lock(publishMutex_);
    return canvasFrame_.clone();
}

cv::Mat FrameProcessingLoop::preview(int id) const {
    std::lock_guard<std::mutex> lock(publishMutex_);
    auto it = previews_.find(id);
    if (it == previews_.end()) return {};
    return it->second.clone();
}

cv::Mat FrameProcessingLoop::snapshot() const {
    std::lock_guard<std::mutex> lock(tickMutex_);
    return board_.snapshot();
}

bool FrameProcessingLoop::exportSnapshot(const std::string& path) const {
    std::lock_guard<std::mutex> lock(tickMutex_);
    return board_.exportSnapshot(path);
}

std::vector<uchar> FrameProcessingLoop::encodeSnapshot(const std::string& ext) const {
    std::lock_guard<std::mutex> lock(tickMutex_);
    return board_.encode(ext);
}
