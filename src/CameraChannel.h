#pragma once

#include "CanvasLayout.h"
#include "FiducialCalibrator.h"
#include "Homography.h"
#include "PipelineSettings.h"
#include "PointerTracker.h"
#include "ProjectionEngine.h"
#include "StrokeAccumulator.h"
#include <opencv2/core.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class CalibrationState { Uncalibrated, Calibrated };

struct ChannelConfig {
    int id{1};
    cv::Scalar color{255, 0, 0};   // BGR
    cv::Size workSize{config::WORK_W, config::WORK_H};
};

struct ChannelStatus {
    int id{0};
    CalibrationState state{CalibrationState::Uncalibrated};
    bool tracking{false};
    std::optional<cv::Point2d> pointer;      // smoothed, camera space
    std::optional<cv::Point> canvasPoint;    // projected, canvas space
    std::vector<int> lastSeenIds;
    size_t segments{0};
    uint64_t frames{0};
    cv::Scalar color;
};

// What one tick did on one channel.
struct ChannelTick {
    bool frameProcessed{false};
    std::optional<CalibrationOutcome> calibration;
    bool manualAttempt{false};
    std::string capabilityError;
    bool drew{false};
};

// Per-camera pipeline: calibration lifecycle, pointer tracking, smoothing,
// projection and stroke continuity. Owns every buffer it touches.
class CameraChannel {
public:
    CameraChannel(const ChannelConfig& cfg, const CanvasLayout& layout, const PipelineSettings& settings);
    ~CameraChannel();

    CameraChannel(const CameraChannel&) = delete;
    CameraChannel& operator=(const CameraChannel&) = delete;

    // `calibrator` is null once marker support is known to be unavailable.
    ChannelTick process(const cv::Mat& frame, FiducialCalibrator* calibrator,
                        StrokeAccumulator& strokes, const PipelineSettings& settings);

    // Back to Uncalibrated; the homography and smoothing history are dropped.
    void reset();
    // Attempt calibration on the next processed frame, even if calibrated.
    void requestCalibration() { calibrationRequested_ = true; }

    void applySettings(const PipelineSettings& settings);

    // Annotated copy of the working frame for the camera preview.
    cv::Mat renderPreview(bool drawingEnabled) const;

    ChannelStatus status() const;
    int id() const { return cfg_.id; }
    CalibrationState state() const { return state_; }
    bool calibrated() const { return state_ == CalibrationState::Calibrated; }
    const Homography* homography() const { return homography_ ? &*homography_ : nullptr; }

    void release();

private:
    bool calibrationDue(const PipelineSettings& settings) const;
    void adoptHomography(const Homography& h);

    ChannelConfig cfg_;
    PointerTracker tracker_;
    ProjectionEngine projection_;
    std::optional<Homography> homography_;
    CalibrationState state_{CalibrationState::Uncalibrated};
    bool calibrationRequested_{false};

    cv::Mat work_;
    cv::Mat gray_;

    uint64_t frames_{0};
    // Frames since the last reset; drives the calibration cadence.
    uint64_t cadenceFrames_{0};
    std::optional<PointerSample> lastSample_;
    Projection lastProjection_;
    std::vector<int> lastSeenIds_;
    bool detectionAttempted_{false};
};
