#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

// Single-slot mailbox between a capture thread and its consumer. Publishing
// overwrites whatever was not yet consumed, so the reader only ever sees the
// newest frame.
class LatestFrameExchange {
public:
    void publish(const cv::Mat& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        frame.copyTo(buffer_);
        hasFrame_ = true;
        ++published_;
        cond_.notify_one();
    }

    // Zero `wait` polls without blocking.
    bool acquire(cv::Mat& out, std::chrono::milliseconds wait = std::chrono::milliseconds(0)) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (wait.count() > 0) {
            cond_.wait_for(lock, wait, [&] { return !alive_ || hasFrame_; });
        }
        if (!hasFrame_) {
            return false;
        }
        buffer_.copyTo(out);
        hasFrame_ = false;
        return true;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            alive_ = false;
        }
        cond_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        hasFrame_ = false;
        alive_ = true;
        buffer_.release();
    }

    // Frames published since construction, consumed or not.
    uint64_t published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

private:
    cv::Mat buffer_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool hasFrame_{false};
    bool alive_{true};
    uint64_t published_{0};
};
