#pragma once

#include "CanvasLayout.h"
#include "VisionRuntime.h"
#include <opencv2/core.hpp>
#include <array>

// Paints fiducials 0..3 at their fixed anchors, using the same dictionary the
// calibrator detects against.
class CalibrationMarkerRenderer {
public:
    CalibrationMarkerRenderer(VisionRuntime& runtime, const CanvasLayout& layout);

    // Returns false (canvas left without markers) when marker support is missing.
    bool render(cv::Mat& canvas);

private:
    VisionRuntime& runtime_;
    CanvasLayout layout_;
    std::array<cv::Mat, config::MARKER_COUNT> markers_;   // BGR, built on first use
    bool warned_{false};
};
