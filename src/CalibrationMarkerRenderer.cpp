#include "CalibrationMarkerRenderer.h"

#include <opencv2/imgproc.hpp>
#include <iostream>

CalibrationMarkerRenderer::CalibrationMarkerRenderer(VisionRuntime& runtime, const CanvasLayout& layout)
    : runtime_(runtime), layout_(layout) {}

bool CalibrationMarkerRenderer::render(cv::Mat& canvas) {
    if (canvas.empty() || layout_.markerSize() <= 0) {
        return false;
    }

    try {
        for (int id = 0; id < config::MARKER_COUNT; ++id) {
            if (markers_[id].empty()) {
                cv::Mat gray = runtime_.renderMarker(id, layout_.markerSize(),
                                                     config::MARKER_BORDER_BITS);
                cv::cvtColor(gray, markers_[id], cv::COLOR_GRAY2BGR);
            }
            markers_[id].copyTo(canvas(layout_.markerRect(id)));
        }
    } catch (const CapabilityUnavailableError& ex) {
        if (!warned_) {
            std::cerr << "[MarkerRenderer] Failed to draw ArUco markers: " << ex.what() << std::endl;
            warned_ = true;
        }
        return false;
    }
    return true;
}
