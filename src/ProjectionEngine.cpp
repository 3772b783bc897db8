#include "ProjectionEngine.h"

#include <algorithm>

// ============ PositionHistory ============
PositionHistory::PositionHistory(int window)
    : window_(std::max(1, window)) {}

void PositionHistory::push(const Eigen::Vector2d& val) {
    q_.push_back(val);
    if (q_.size() > static_cast<size_t>(window_)) {
        q_.pop_front();
    }
}

std::optional<Eigen::Vector2d> PositionHistory::mean() const {
    if (q_.empty()) {
        return std::nullopt;
    }

    Eigen::Vector2d sum = Eigen::Vector2d::Zero();
    for (const auto& v : q_) {
        sum += v;
    }
    return Eigen::Vector2d(sum / static_cast<double>(q_.size()));
}

void PositionHistory::clear() {
    q_.clear();
}

// ============ ProjectionEngine ============
ProjectionEngine::ProjectionEngine(const CanvasLayout& layout, int window, int lostFrameTolerance)
    : layout_(layout)
    , history_(window)
    , lostFrameTolerance_(std::max(0, lostFrameTolerance)) {}

Projection ProjectionEngine::update(const std::optional<cv::Point2f>& raw, const Homography* homography) {
    Projection out;

    if (!raw) {
        ++missedFrames_;
        if (missedFrames_ > lostFrameTolerance_) {
            history_.clear();
        }
        return out;
    }

    missedFrames_ = 0;
    history_.push(Eigen::Vector2d(raw->x, raw->y));

    const auto avg = history_.mean();
    if (!avg) {
        return out;
    }
    out.smoothed = cv::Point2d((*avg)(0), (*avg)(1));

    if (!homography) {
        return out;
    }

    const auto mapped = homography->map(*out.smoothed);
    if (mapped) {
        out.canvas = layout_.clamp(*mapped);
    }
    return out;
}

void ProjectionEngine::reset() {
    history_.clear();
    missedFrames_ = 0;
}

void ProjectionEngine::setLostFrameTolerance(int frames) {
    lostFrameTolerance_ = std::max(0, frames);
}
