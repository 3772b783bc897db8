#include "StrokeAccumulator.h"

#include <opencv2/imgproc.hpp>
#include <algorithm>

StrokeAccumulator::StrokeAccumulator(Whiteboard& board, int strokeWidth)
    : board_(board), strokeWidth_(std::max(1, strokeWidth)) {}

void StrokeAccumulator::addChannel(int channel, const cv::Scalar& color) {
    Pen pen;
    pen.color = color;
    pens_[channel] = pen;
}

void StrokeAccumulator::removeChannel(int channel) {
    pens_.erase(channel);
}

bool StrokeAccumulator::extend(int channel, const std::optional<cv::Point>& point) {
    auto it = pens_.find(channel);
    if (it == pens_.end()) {
        return false;
    }
    Pen& pen = it->second;

    if (!point) {
        pen.last.reset();
        return false;
    }

    bool drew = false;
    if (pen.last) {
        // Thick cv::line segments are drawn with round ends, which also gives
        // round joins between consecutive segments.
        cv::line(board_.raster(), *pen.last, *point, pen.color, strokeWidth_, cv::LINE_AA);
        ++pen.segments;
        drew = true;
    }
    pen.last = *point;
    return drew;
}

void StrokeAccumulator::breakStroke(int channel) {
    auto it = pens_.find(channel);
    if (it != pens_.end()) {
        it->second.last.reset();
    }
}

void StrokeAccumulator::clear() {
    board_.reset();
    for (auto& kv : pens_) {
        kv.second.last.reset();
    }
}

std::optional<cv::Point> StrokeAccumulator::lastPoint(int channel) const {
    auto it = pens_.find(channel);
    if (it == pens_.end()) return std::nullopt;
    return it->second.last;
}

size_t StrokeAccumulator::segmentCount(int channel) const {
    auto it = pens_.find(channel);
    return it == pens_.end() ? 0 : it->second.segments;
}

std::optional<cv::Scalar> StrokeAccumulator::color(int channel) const {
    auto it = pens_.find(channel);
    if (it == pens_.end()) return std::nullopt;
    return it->second.color;
}
