#pragma once

#include <opencv2/core.hpp>
#include <string>

// Pull-based access to a channel's most recently decoded frame.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Never blocks. Copies the newest frame into `out` and returns true, or
    // returns false when nothing new has been decoded since the last call.
    virtual bool latest(cv::Mat& out) = 0;

    virtual std::string describe() const = 0;
};
