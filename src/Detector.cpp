#include "Detector.h"
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <iostream>

Detector::Detector(int dictionaryId)
    : dictionaryId_(dictionaryId)
    , dictionary_(cv::aruco::getPredefinedDictionary(dictionaryId))
{
    if (dictionary_.bytesList.empty()) {
        throw std::runtime_error("ArUco dictionary " + std::to_string(dictionaryId) + " is empty");
    }

    cv::aruco::DetectorParameters params;
    params.cornerRefinementMethod = cv::aruco::CORNER_REFINE_SUBPIX;
    detector_ = cv::aruco::ArucoDetector(dictionary_, params);

    std::cout << "[Detector] Initialized with ArUco dictionary " << dictionaryId_
              << " (" << dictionary_.bytesList.rows << " symbols)" << std::endl;
}

Detector::~Detector() = default;

std::vector<Detection> Detector::detect(const cv::Mat& img_in) {
    std::vector<Detection> out;
    if (img_in.empty()) return out;

    cv::Mat gray;
    if (img_in.type() == CV_8UC1) {
        gray = img_in;
    } else {
        cv::cvtColor(img_in, grayBuf_, cv::COLOR_BGR2GRAY);
        gray = grayBuf_;
    }

    std::vector<std::vector<cv::Point2f>> corners;
    std::vector<int> ids;
    detector_.detectMarkers(gray, corners, ids);

    out.reserve(ids.size());
    for (size_t i = 0; i < ids.size() && i < corners.size(); ++i) {
        Detection d;
        d.id = ids[i];
        d.corners = std::move(corners[i]);
        out.emplace_back(std::move(d));
    }
    return out;
}

cv::Mat Detector::renderMarker(int id, int sidePixels, int borderBits) const {
    cv::Mat marker;
    cv::aruco::generateImageMarker(dictionary_, id, sidePixels, marker, borderBits);
    return marker;
}
