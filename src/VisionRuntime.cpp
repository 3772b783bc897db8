#include "VisionRuntime.h"

#include <opencv2/core.hpp>
#include <iostream>
#include <utility>

VisionRuntime::VisionRuntime(DetectorFactory factory)
    : factory_(std::move(factory)) {}

VisionRuntime& VisionRuntime::instance() {
    static VisionRuntime runtime([] { return std::make_unique<Detector>(); });
    return runtime;
}

void VisionRuntime::initialize() {
    std::call_once(initOnce_, [this] {
        try {
            detector_ = factory_ ? factory_() : nullptr;
            if (!detector_) {
                error_ = "no marker detector available";
            }
        } catch (const cv::Exception& ex) {
            error_ = ex.what();
        } catch (const std::exception& ex) {
            error_ = ex.what();
        }

        if (detector_) {
            std::cout << "[VisionRuntime] Ready (OpenCV " << CV_VERSION << ")" << std::endl;
        } else {
            std::cerr << "[VisionRuntime] ArUco support unavailable: " << error_ << std::endl;
        }
    });
}

bool VisionRuntime::ready() {
    initialize();
    return detector_ != nullptr;
}

std::string VisionRuntime::error() {
    initialize();
    return error_;
}

Detector& VisionRuntime::detector() {
    initialize();
    if (!detector_) {
        throw CapabilityUnavailableError("ArUco module not available: " + error_);
    }
    return *detector_;
}

cv::Mat VisionRuntime::renderMarker(int id, int sidePixels, int borderBits) {
    return detector().renderMarker(id, sidePixels, borderBits);
}
