#pragma once
#include <opencv2/videoio.hpp>
#include <string>
#include <vector>
#include <utility>

namespace camtuner {

struct OpenResult {
    cv::VideoCapture cap;
    std::vector<std::string> log;
    bool ok = false;
};

struct Settings {
    int index = 0;
    int width = 1280;
    int height = 720;
    double fps = 30.0;
    bool useAutoExposure = true;
    std::vector<int> backendOrder = { cv::CAP_V4L2, cv::CAP_ANY };
    int warmupFrames = 12;
};

std::vector<std::pair<int,double>> readAllKnownProps(cv::VideoCapture& cap);

// Opens a camera by index, trying each backend in turn, and returns the
// first one that delivers a sane frame.
OpenResult openAndTune(const Settings& s);

// Opens a numeric source as a tuned camera, anything else (file, URL,
// GStreamer pipeline) straight through cv::VideoCapture.
OpenResult openSource(const std::string& source, const Settings& s);

} // namespace camtuner
