#pragma once

#include "Detector.h"
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

// Marker support could not be brought up. Terminal for calibration in this
// session; tracking is unaffected.
class CapabilityUnavailableError : public std::runtime_error {
public:
    explicit CapabilityUnavailableError(const std::string& what)
        : std::runtime_error(what) {}
};

// Process-wide image-processing capability. Initialized lazily on first use,
// then cached and shared by every channel.
class VisionRuntime {
public:
    using DetectorFactory = std::function<std::unique_ptr<Detector>()>;

    explicit VisionRuntime(DetectorFactory factory);

    static VisionRuntime& instance();

    // Triggers initialization if it has not happened yet.
    bool ready();
    std::string error();

    // Throws CapabilityUnavailableError when marker support is missing.
    Detector& detector();

    // Marker `id` of the runtime dictionary as a square grayscale image.
    cv::Mat renderMarker(int id, int sidePixels, int borderBits = 1);

private:
    void initialize();

    DetectorFactory factory_;
    std::once_flag initOnce_;
    std::unique_ptr<Detector> detector_;
    std::string error_;
};
