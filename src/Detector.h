#pragma once
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

struct Detection {
    int id{};
    std::vector<cv::Point2f> corners;  // p0..p3, clockwise from the marker's top-left
};

class Detector {
public:
    explicit Detector(int dictionaryId = cv::aruco::DICT_4X4_50);
    ~Detector();

    // Accepts CV_8UC1 or BGR; BGR input is converted to grayscale first.
    std::vector<Detection> detect(const cv::Mat& img);

    // Marker bitmap for `id` from the same dictionary used for detection.
    cv::Mat renderMarker(int id, int sidePixels, int borderBits = 1) const;

private:
    int dictionaryId_;
    cv::aruco::Dictionary dictionary_;
    cv::aruco::ArucoDetector detector_;
    cv::Mat grayBuf_;

    Detector(const Detector&) = delete;
    Detector& operator=(const Detector&) = delete;
};
