#include "CameraChannel.h"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

CameraChannel::CameraChannel(const ChannelConfig& cfg, const CanvasLayout& layout, const PipelineSettings& settings)
    : cfg_(cfg)
    , tracker_(settings.tracker)
    , projection_(layout, config::SMOOTHING_WINDOW, settings.lostFrameTolerance)
{
    if (cfg_.workSize.width <= 0 || cfg_.workSize.height <= 0) {
        throw std::invalid_argument("channel working size must be positive");
    }
    work_.create(cfg_.workSize, CV_8UC3);
    std::cout << "[Channel " << cfg_.id << "] Attached (working frame "
              << cfg_.workSize.width << "x" << cfg_.workSize.height << ")" << std::endl;
}

CameraChannel::~CameraChannel() {
    release();
    std::cout << "[Channel " << cfg_.id << "] Detached" << std::endl;
}

void CameraChannel::release() {
    homography_.reset();
    projection_.reset();
    tracker_.release();
    work_.release();
    gray_.release();
    lastSample_.reset();
    lastProjection_ = Projection{};
}

void CameraChannel::applySettings(const PipelineSettings& settings) {
    tracker_.setParams(settings.tracker);
    projection_.setLostFrameTolerance(settings.lostFrameTolerance);
}

bool CameraChannel::calibrationDue(const PipelineSettings& settings) const {
    if (calibrationRequested_) return true;
    if (state_ == CalibrationState::Calibrated) return false;
    const uint64_t cadence = static_cast<uint64_t>(std::max(1, settings.calibrationCadence));
    return cadenceFrames_ % cadence == 0;
}

void CameraChannel::adoptHomography(const Homography& h) {
    // Drop the old matrix before taking the new one; never a partial update.
    homography_.reset();
    homography_.emplace(h);
    state_ = CalibrationState::Calibrated;
}

ChannelTick CameraChannel::process(const cv::Mat& frame, FiducialCalibrator* calibrator,
                                   StrokeAccumulator& strokes, const PipelineSettings& settings) {
    ChannelTick tick;
    if (frame.empty()) {
        return tick;
    }

    // 1) Latest frame into the fixed-size working buffer
    cv::Mat bgr = frame;
    cv::Mat converted;
    if (frame.channels() == 1) {
        cv::cvtColor(frame, converted, cv::COLOR_GRAY2BGR);
        bgr = converted;
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, converted, cv::COLOR_BGRA2BGR);
        bgr = converted;
    }
    if (bgr.size() != cfg_.workSize) {
        cv::resize(bgr, work_, cfg_.workSize, 0, 0, cv::INTER_AREA);
    } else {
        bgr.copyTo(work_);
    }
    tick.frameProcessed = true;

    // 2) Throttled calibration while uncalibrated
    if (calibrator && calibrationDue(settings)) {
        const bool manual = calibrationRequested_;
        calibrationRequested_ = false;
        cv::cvtColor(work_, gray_, cv::COLOR_BGR2GRAY);
        try {
            CalibrationResult result = calibrator->calibrate(gray_);
            lastSeenIds_ = result.seenIds;
            detectionAttempted_ = true;
            tick.calibration = result.outcome;
            tick.manualAttempt = manual;
            if (result.outcome == CalibrationOutcome::Calibrated && result.homography) {
                adoptHomography(*result.homography);
                strokes.breakStroke(cfg_.id);
                std::cout << "[Channel " << cfg_.id << "] Perspective transform calibrated" << std::endl;
            } else if (manual) {
                std::cout << "[Channel " << cfg_.id << "] Fiducials not detected, ensure all 4 are visible" << std::endl;
            }
        } catch (const CapabilityUnavailableError& ex) {
            tick.calibration = CalibrationOutcome::CapabilityUnavailable;
            tick.capabilityError = ex.what();
        }
    }
    ++frames_;
    ++cadenceFrames_;

    // 3) Tracking runs regardless of calibration state
    lastSample_ = tracker_.locate(work_);
    std::optional<cv::Point2f> raw;
    if (lastSample_) raw = lastSample_->center;

    lastProjection_ = projection_.update(raw, homography());

    // 4) Drawing is a no-op without a projected point
    if (settings.drawingEnabled && lastProjection_.canvas) {
        tick.drew = strokes.extend(cfg_.id, lastProjection_.canvas);
    } else {
        strokes.breakStroke(cfg_.id);
    }
    return tick;
}

void CameraChannel::reset() {
    homography_.reset();
    state_ = CalibrationState::Uncalibrated;
    calibrationRequested_ = false;
    projection_.reset();
    lastProjection_ = Projection{};
    lastSeenIds_.clear();
    detectionAttempted_ = false;
    cadenceFrames_ = 0;
    std::cout << "[Channel " << cfg_.id << "] Calibration reset" << std::endl;
}

ChannelStatus CameraChannel::status() const {
    ChannelStatus s;
    s.id = cfg_.id;
    s.state = state_;
    s.tracking = lastProjection_.smoothed.has_value();
    s.pointer = lastProjection_.smoothed;
    s.canvasPoint = lastProjection_.canvas;
    s.lastSeenIds = lastSeenIds_;
    s.frames = frames_;
    s.color = cfg_.color;
    return s;
}

cv::Mat CameraChannel::renderPreview(bool drawingEnabled) const {
    if (work_.empty()) return {};
    cv::Mat vis = work_.clone();

    if (detectionAttempted_) {
        if (!lastSeenIds_.empty()) {
            std::ostringstream ids;
            ids << "Detected IDs: ";
            for (size_t i = 0; i < lastSeenIds_.size(); ++i) {
                if (i > 0) ids << ", ";
                ids << lastSeenIds_[i];
            }
            cv::putText(vis, ids.str(), {30, 80}, cv::FONT_HERSHEY_SIMPLEX, 0.6,
                        cv::Scalar(0, 255, 0), 2, cv::LINE_AA);
        } else {
            cv::putText(vis, "No markers detected", {30, 80}, cv::FONT_HERSHEY_SIMPLEX, 0.6,
                        cv::Scalar(0, 0, 255), 2, cv::LINE_AA);
        }
    }

    const bool cal = calibrated();
    cv::putText(vis, cal ? "CALIBRATED" : "NOT CALIBRATED", {30, 120}, cv::FONT_HERSHEY_SIMPLEX, 0.75,
                cal ? cv::Scalar(0, 255, 0) : cv::Scalar(0, 0, 255), 2, cv::LINE_AA);
    cv::putText(vis, drawingEnabled ? "DRAWING: ON" : "DRAWING: OFF", {30, 160}, cv::FONT_HERSHEY_SIMPLEX, 0.75,
                drawingEnabled ? cv::Scalar(0, 255, 255) : cv::Scalar(128, 128, 128), 2, cv::LINE_AA);

    if (lastProjection_.smoothed) {
        const cv::Point p(cvRound(lastProjection_.smoothed->x), cvRound(lastProjection_.smoothed->y));
        cv::circle(vis, p, 10, cv::Scalar(0, 255, 0), 2, cv::LINE_AA);
        cv::circle(vis, p, 3, cv::Scalar(0, 255, 0), cv::FILLED, cv::LINE_AA);

        std::ostringstream pos;
        pos << std::fixed << std::setprecision(0)
            << "Pos: (" << lastProjection_.smoothed->x << ", " << lastProjection_.smoothed->y << ")";
        cv::putText(vis, pos.str(), {30, 200}, cv::FONT_HERSHEY_SIMPLEX, 0.6,
                    cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
    }
    return vis;
}
