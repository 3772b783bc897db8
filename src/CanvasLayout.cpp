#include "CanvasLayout.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

CanvasLayout::CanvasLayout(cv::Size size, int markerSize, int margin)
    : size_(size), markerSize_(markerSize), margin_(margin)
{
    if (size_.width <= 0 || size_.height <= 0) {
        throw std::invalid_argument("canvas size must be positive");
    }
    if (markerSize_ < 0 || margin_ < 0 ||
        2 * (margin_ + markerSize_) > std::min(size_.width, size_.height)) {
        throw std::invalid_argument("marker geometry does not fit the canvas");
    }
}

cv::Rect CanvasLayout::markerRect(int id) const {
    const int left = margin_;
    const int top = margin_;
    const int right = size_.width - margin_ - markerSize_;
    const int bottom = size_.height - margin_ - markerSize_;
    switch (id) {
    case 0: return {left, top, markerSize_, markerSize_};
    case 1: return {right, top, markerSize_, markerSize_};
    case 2: return {right, bottom, markerSize_, markerSize_};
    case 3: return {left, bottom, markerSize_, markerSize_};
    default:
        throw std::out_of_range("marker id must be 0..3");
    }
}

cv::Point2f CanvasLayout::anchorCenter(int id) const {
    const int offset = markerSize_ / 2;
    const int nearX = margin_ + offset;
    const int nearY = margin_ + offset;
    const int farX = size_.width - margin_ - offset;
    const int farY = size_.height - margin_ - offset;
    switch (id) {
    case 0: return {static_cast<float>(nearX), static_cast<float>(nearY)};
    case 1: return {static_cast<float>(farX), static_cast<float>(nearY)};
    case 2: return {static_cast<float>(farX), static_cast<float>(farY)};
    case 3: return {static_cast<float>(nearX), static_cast<float>(farY)};
    default:
        throw std::out_of_range("marker id must be 0..3");
    }
}

std::array<cv::Point2f, config::MARKER_COUNT> CanvasLayout::anchors() const {
    std::array<cv::Point2f, config::MARKER_COUNT> out;
    for (int id = 0; id < config::MARKER_COUNT; ++id) {
        out[id] = anchorCenter(id);
    }
    return out;
}

bool CanvasLayout::contains(const cv::Point& p) const {
    return p.x >= 0 && p.y >= 0 && p.x < size_.width && p.y < size_.height;
}

cv::Point CanvasLayout::clamp(const cv::Point2d& p) const {
    // Clamp in floating point first; a near-singular homography can push
    // coordinates far outside the int range.
    const double x = std::clamp(std::round(p.x), 0.0, static_cast<double>(size_.width - 1));
    const double y = std::clamp(std::round(p.y), 0.0, static_cast<double>(size_.height - 1));
    return {static_cast<int>(x), static_cast<int>(y)};
}
