#pragma once

#include "CanvasLayout.h"
#include "Detector.h"
#include "Homography.h"
#include "VisionRuntime.h"
#include <opencv2/core.hpp>
#include <array>
#include <optional>
#include <vector>

enum class CalibrationOutcome {
    Calibrated,
    MarkerSetIncomplete,
    CapabilityUnavailable
};

const char* toString(CalibrationOutcome outcome);

struct CalibrationResult {
    CalibrationOutcome outcome{CalibrationOutcome::MarkerSetIncomplete};
    std::optional<Homography> homography;
    std::vector<int> seenIds;   // every id returned by the detector this attempt
};

class FiducialCalibrator {
public:
    FiducialCalibrator(VisionRuntime& runtime, const CanvasLayout& layout);

    // Runs marker detection on a grayscale frame. Throws
    // CapabilityUnavailableError when the runtime has no marker support.
    CalibrationResult calibrate(const cv::Mat& gray);

    // Same solve, starting from detections that are already available.
    CalibrationResult calibrateFromDetections(const std::vector<Detection>& detections) const;

    // Camera-space centers of markers 0..3, or nullopt unless each id appears
    // exactly once with a four-corner quad.
    static std::optional<std::array<cv::Point2f, config::MARKER_COUNT>>
    markerCentroids(const std::vector<Detection>& detections);

private:
    VisionRuntime& runtime_;
    CanvasLayout layout_;
};
