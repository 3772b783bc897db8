#pragma once

#include "CameraChannel.h"
#include "CanvasLayout.h"
#include "FiducialCalibrator.h"
#include "FrameSource.h"
#include "PipelineSettings.h"
#include "StrokeAccumulator.h"
#include "VisionRuntime.h"
#include "Whiteboard.h"

#include <opencv2/core.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct LoopStatus {
    std::vector<ChannelStatus> channels;
    bool calibrated{false};          // every attached channel calibrated
    std::string capabilityError;     // empty while marker support is fine
    std::string message;             // one-line human-readable summary
    PipelineSettings settings;
    uint64_t ticks{0};
    double fps{0.0};
};

// Drives every attached channel once per display tick against the one shared
// whiteboard. Channels are processed one after another inside a tick, so two
// strokes never interleave on the raster.
//
// UI operations (clear, reset, calibrate, attach, detach) wait for the
// current tick to finish and never run in the middle of one. Readers get
// copies published at the end of each tick.
class FrameProcessingLoop {
public:
    explicit FrameProcessingLoop(VisionRuntime& runtime,
                                 const CanvasLayout& layout = CanvasLayout(),
                                 cv::Size workSize = cv::Size(config::WORK_W, config::WORK_H));
    ~FrameProcessingLoop();

    FrameProcessingLoop(const FrameProcessingLoop&) = delete;
    FrameProcessingLoop& operator=(const FrameProcessingLoop&) = delete;

    void attach(int id, std::shared_ptr<FrameSource> source, const cv::Scalar& color);
    // Stops scheduling the channel and releases its buffers before returning.
    void detach(int id);

    // One pass over all channels. Returns how many had a fresh frame.
    int tick();
    // Ticks at config::DISPLAY_RATE_HZ until `stop` becomes true.
    void run(const std::atomic<bool>& stop);

    // Wipe the canvas, redraw the fiducials and break every stroke.
    void clear();
    // Invalidate one channel's calibration. False for an unknown channel.
    bool reset(int id);
    // Force a calibration attempt on the channel's next frame.
    bool calibrate(int id);

    PipelineSettings settings() const;
    // Takes effect at the start of the next tick.
    void applySettings(const PipelineSettings& settings);
    void adjustMinArea(int steps);
    void setDrawingEnabled(bool enabled);

    LoopStatus status() const;
    bool calibrated() const;

    // Canvas with cursor rings, for presentation only.
    cv::Mat canvasFrame() const;
    // Annotated camera view for one channel; empty until it has seen a frame.
    cv::Mat preview(int id) const;
    // Persistent raster without overlays.
    cv::Mat snapshot() const;
    bool exportSnapshot(const std::string& path) const;
    std::vector<uchar> encodeSnapshot(const std::string& ext = ".png") const;

    const CanvasLayout& layout() const { return layout_; }

private:
    struct Slot {
        std::unique_ptr<CameraChannel> channel;
        std::shared_ptr<FrameSource> source;
    };

    void syncSettingsLocked();
    void publishLocked();
    std::string statusMessageLocked(bool calibrated) const;

    CanvasLayout layout_;
    cv::Size workSize_;

    // Guarded by tickMutex_
    mutable std::mutex tickMutex_;
    Whiteboard board_;
    StrokeAccumulator strokes_;
    FiducialCalibrator calibrator_;
    std::map<int, Slot> slots_;
    PipelineSettings active_;
    std::string capabilityError_;
    bool manualFailure_{false};
    uint64_t ticks_{0};
    cv::Mat frame_;

    mutable std::mutex settingsMutex_;
    PipelineSettings pending_;
    bool settingsDirty_{false};

    // Published snapshots, guarded by publishMutex_
    mutable std::mutex publishMutex_;
    LoopStatus published_;
    cv::Mat canvasFrame_;
    std::map<int, cv::Mat> previews_;

    std::atomic<uint64_t> framesProcessed_{0};
    std::atomic<double> fps_{0.0};
};
