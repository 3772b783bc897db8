#pragma once

#include "Config.h"
#include <opencv2/core.hpp>
#include <optional>
#include <vector>

struct TrackerParams {
    cv::Scalar hsvLower{config::POINTER_H_MIN, config::POINTER_S_MIN, config::POINTER_V_MIN};
    cv::Scalar hsvUpper{config::POINTER_H_MAX, config::POINTER_S_MAX, config::POINTER_V_MAX};
    double minArea{config::POINTER_MIN_AREA};
    int kernelSize{config::MORPH_KERNEL};
    bool erode{config::POINTER_ERODE};
};

struct PointerSample {
    cv::Point2f center;   // bounding-box center, camera pixels
    double area{0.0};
    cv::Rect box;
};

// Finds the single colored pointer in a BGR frame. Owns its HSV and mask
// buffers so they are allocated once per channel and released with it.
class PointerTracker {
public:
    explicit PointerTracker(const TrackerParams& params = TrackerParams());

    std::optional<PointerSample> locate(const cv::Mat& bgr);

    void setParams(const TrackerParams& params);

    // Last binary mask, for diagnostics.
    const cv::Mat& mask() const { return mask_; }

    void release();

private:
    TrackerParams params_;
    cv::Mat kernel_;
    cv::Mat hsv_;
    cv::Mat mask_;
    std::vector<std::vector<cv::Point>> contours_;
};
