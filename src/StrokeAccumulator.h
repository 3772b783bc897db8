#pragma once

#include "Whiteboard.h"
#include <opencv2/core.hpp>
#include <map>
#include <optional>

// Turns each channel's sequence of canvas points into connected line
// segments on the shared whiteboard.
class StrokeAccumulator {
public:
    explicit StrokeAccumulator(Whiteboard& board, int strokeWidth = config::STROKE_WIDTH_PX);

    void addChannel(int channel, const cv::Scalar& color);
    void removeChannel(int channel);

    // Feeds one frame's point. Returns true when a segment was drawn.
    // An empty point breaks the stroke.
    bool extend(int channel, const std::optional<cv::Point>& point);
    void breakStroke(int channel);

    // Wipes the board, redraws the fiducials and breaks every stroke.
    void clear();

    std::optional<cv::Point> lastPoint(int channel) const;
    size_t segmentCount(int channel) const;
    std::optional<cv::Scalar> color(int channel) const;

private:
    struct Pen {
        cv::Scalar color;
        std::optional<cv::Point> last;
        size_t segments{0};
    };

    Whiteboard& board_;
    int strokeWidth_;
    std::map<int, Pen> pens_;
};
