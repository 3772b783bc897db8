#include "FiducialCalibrator.h"

const char* toString(CalibrationOutcome outcome) {
    switch (outcome) {
    case CalibrationOutcome::Calibrated:            return "calibrated";
    case CalibrationOutcome::MarkerSetIncomplete:   return "marker-set-incomplete";
    case CalibrationOutcome::CapabilityUnavailable: return "capability-unavailable";
    }
    return "unknown";
}

FiducialCalibrator::FiducialCalibrator(VisionRuntime& runtime, const CanvasLayout& layout)
    : runtime_(runtime), layout_(layout) {}

std::optional<std::array<cv::Point2f, config::MARKER_COUNT>>
FiducialCalibrator::markerCentroids(const std::vector<Detection>& detections) {
    std::array<cv::Point2f, config::MARKER_COUNT> centers;
    std::array<int, config::MARKER_COUNT> hits{};

    for (const auto& det : detections) {
        if (det.id < 0 || det.id >= config::MARKER_COUNT) continue;
        if (det.corners.size() != 4) return std::nullopt;
        if (++hits[det.id] > 1) return std::nullopt;

        cv::Point2f sum(0.f, 0.f);
        for (const auto& c : det.corners) sum += c;
        centers[det.id] = sum * 0.25f;
    }

    for (int h : hits) {
        if (h != 1) return std::nullopt;
    }
    return centers;
}

CalibrationResult FiducialCalibrator::calibrate(const cv::Mat& gray) {
    Detector& detector = runtime_.detector();

    std::vector<Detection> detections;
    try {
        detections = detector.detect(gray);
    } catch (const cv::Exception&) {
        return {};
    }
    return calibrateFromDetections(detections);
}

CalibrationResult FiducialCalibrator::calibrateFromDetections(const std::vector<Detection>& detections) const {
    CalibrationResult result;
    result.seenIds.reserve(detections.size());
    for (const auto& det : detections) result.seenIds.push_back(det.id);

    auto centers = markerCentroids(detections);
    if (!centers) {
        return result;
    }

    const auto anchors = layout_.anchors();
    std::vector<cv::Point2f> src(centers->begin(), centers->end());
    std::vector<cv::Point2f> dst(anchors.begin(), anchors.end());

    result.homography = Homography::fromCorrespondences(src, dst);
    if (result.homography) {
        result.outcome = CalibrationOutcome::Calibrated;
    }
    return result;
}
