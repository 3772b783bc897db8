#pragma once

#include "CanvasLayout.h"
#include "Config.h"
#include "Homography.h"
#include <Eigen/Dense>
#include <opencv2/core.hpp>
#include <deque>
#include <optional>

// Bounded FIFO of raw pointer centers; the smoothed value is their mean.
class PositionHistory {
public:
    explicit PositionHistory(int window = config::SMOOTHING_WINDOW);

    void push(const Eigen::Vector2d& val);
    std::optional<Eigen::Vector2d> mean() const;
    void clear();

    int size() const { return static_cast<int>(q_.size()); }

private:
    int window_;
    std::deque<Eigen::Vector2d> q_;
};

struct Projection {
    std::optional<cv::Point2d> smoothed;   // camera space
    std::optional<cv::Point> canvas;       // clamped to the canvas bounds
};

class ProjectionEngine {
public:
    ProjectionEngine(const CanvasLayout& layout,
                     int window = config::SMOOTHING_WINDOW,
                     int lostFrameTolerance = config::LOST_FRAME_TOLERANCE);

    // One frame's worth of input. `raw` empty means the pointer was not seen;
    // `homography` null means the channel is uncalibrated.
    Projection update(const std::optional<cv::Point2f>& raw, const Homography* homography);

    void reset();
    void setLostFrameTolerance(int frames);

    const PositionHistory& history() const { return history_; }

private:
    CanvasLayout layout_;
    PositionHistory history_;
    int lostFrameTolerance_;
    int missedFrames_{0};
};
