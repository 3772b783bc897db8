#pragma once

#include "Config.h"
#include <opencv2/core.hpp>
#include <array>

// Fixed geometry of the shared canvas. Marker ids run clockwise from the
// top-left corner: 0=TL, 1=TR, 2=BR, 3=BL.
class CanvasLayout {
public:
    CanvasLayout() = default;
    CanvasLayout(cv::Size size, int markerSize, int margin);

    cv::Size size() const { return size_; }
    int width() const { return size_.width; }
    int height() const { return size_.height; }
    int markerSize() const { return markerSize_; }
    int margin() const { return margin_; }

    // Pixel rectangle the marker image occupies.
    cv::Rect markerRect(int id) const;

    // Canvas-space center of a marker; the homography target for that id.
    cv::Point2f anchorCenter(int id) const;
    std::array<cv::Point2f, config::MARKER_COUNT> anchors() const;

    bool contains(const cv::Point& p) const;
    cv::Point clamp(const cv::Point2d& p) const;

private:
    cv::Size size_{config::CANVAS_W, config::CANVAS_H};
    int markerSize_{config::MARKER_SIZE_PX};
    int margin_{config::MARKER_MARGIN_PX};
};
