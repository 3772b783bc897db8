#pragma once

#include "CalibrationMarkerRenderer.h"
#include "CanvasLayout.h"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// The one shared raster every channel draws into. Persists until reset().
class Whiteboard {
public:
    Whiteboard(VisionRuntime& runtime, const CanvasLayout& layout,
               const cv::Scalar& background = cv::Scalar(config::BACKGROUND_B,
                                                         config::BACKGROUND_G,
                                                         config::BACKGROUND_R));

    // Background fill plus freshly rendered fiducials.
    void reset();

    cv::Mat& raster() { return raster_; }
    const cv::Mat& raster() const { return raster_; }
    const CanvasLayout& layout() const { return layout_; }
    bool hasMarkers() const { return hasMarkers_; }

    cv::Mat snapshot() const { return raster_.clone(); }
    bool exportSnapshot(const std::string& path) const;
    // Encoded image bytes, `ext` as accepted by cv::imencode (".png", ".jpg").
    std::vector<uchar> encode(const std::string& ext = ".png") const;

private:
    CanvasLayout layout_;
    cv::Scalar background_;
    CalibrationMarkerRenderer markers_;
    cv::Mat raster_;
    bool hasMarkers_{false};
};
