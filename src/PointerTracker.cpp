#include "PointerTracker.h"

#include <opencv2/imgproc.hpp>
#include <algorithm>

PointerTracker::PointerTracker(const TrackerParams& params) {
    setParams(params);
}

void PointerTracker::setParams(const TrackerParams& params) {
    params_ = params;
    params_.kernelSize = std::max(1, params_.kernelSize);
    params_.minArea = std::max(0.0, params_.minArea);
    kernel_ = cv::Mat::ones(params_.kernelSize, params_.kernelSize, CV_8U);
}

std::optional<PointerSample> PointerTracker::locate(const cv::Mat& bgr) {
    if (bgr.empty() || bgr.channels() != 3) {
        return std::nullopt;
    }

    cv::cvtColor(bgr, hsv_, cv::COLOR_BGR2HSV);
    cv::inRange(hsv_, params_.hsvLower, params_.hsvUpper, mask_);

    // Opening drops speckle, closing fills holes in the blob.
    cv::morphologyEx(mask_, mask_, cv::MORPH_OPEN, kernel_);
    cv::morphologyEx(mask_, mask_, cv::MORPH_CLOSE, kernel_);
    if (params_.erode) {
        cv::erode(mask_, mask_, kernel_);
    }

    contours_.clear();
    cv::findContours(mask_, contours_, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    if (contours_.empty()) {
        return std::nullopt;
    }

    int largestIdx = -1;
    double largestArea = 0.0;
    for (int i = 0; i < static_cast<int>(contours_.size()); ++i) {
        const double area = cv::contourArea(contours_[i]);
        if (area > largestArea) {
            largestArea = area;
            largestIdx = i;
        }
    }

    if (largestIdx < 0 || largestArea < params_.minArea) {
        return std::nullopt;
    }

    PointerSample sample;
    sample.box = cv::boundingRect(contours_[largestIdx]);
    sample.area = largestArea;
    sample.center = cv::Point2f(static_cast<float>(sample.box.x + sample.box.width / 2),
                                static_cast<float>(sample.box.y + sample.box.height / 2));
    return sample;
}

void PointerTracker::release() {
    hsv_.release();
    mask_.release();
    contours_.clear();
    contours_.shrink_to_fit();
}
