#include "Whiteboard.h"

#include <opencv2/imgcodecs.hpp>
#include <iostream>

Whiteboard::Whiteboard(VisionRuntime& runtime, const CanvasLayout& layout, const cv::Scalar& background)
    : layout_(layout)
    , background_(background)
    , markers_(runtime, layout)
    , raster_(layout.size(), CV_8UC3)
{
    reset();
}

void Whiteboard::reset() {
    raster_.setTo(background_);
    hasMarkers_ = markers_.render(raster_);
}

bool Whiteboard::exportSnapshot(const std::string& path) const {
    try {
        if (!cv::imwrite(path, raster_)) {
            std::cerr << "[Whiteboard] Failed to write snapshot: " << path << std::endl;
            return false;
        }
    } catch (const cv::Exception& ex) {
        std::cerr << "[Whiteboard] Failed to write snapshot " << path << ": " << ex.what() << std::endl;
        return false;
    }
    std::cout << "[Whiteboard] Snapshot saved to " << path << std::endl;
    return true;
}

std::vector<uchar> Whiteboard::encode(const std::string& ext) const {
    std::vector<uchar> buf;
    if (!cv::imencode(ext, raster_, buf)) {
        buf.clear();
    }
    return buf;
}
