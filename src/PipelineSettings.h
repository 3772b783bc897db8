#pragma once

#include "Config.h"
#include "PointerTracker.h"
#include <algorithm>

// Runtime-tunable knobs. The loop copies these at the start of a tick, so a
// change never lands halfway through one.
struct PipelineSettings {
    TrackerParams tracker;
    int calibrationCadence{config::CALIBRATION_CADENCE};
    int lostFrameTolerance{config::LOST_FRAME_TOLERANCE};
    bool drawingEnabled{true};

    // Sensitivity steps: +1 makes the tracker less sensitive.
    void adjustMinArea(int steps) {
        tracker.minArea = std::max(config::POINTER_MIN_AREA_FLOOR,
                                   tracker.minArea + steps * config::POINTER_MIN_AREA_STEP);
    }

    void sanitize() {
        calibrationCadence = std::max(1, calibrationCadence);
        lostFrameTolerance = std::max(0, lostFrameTolerance);
        tracker.minArea = std::max(config::POINTER_MIN_AREA_FLOOR, tracker.minArea);
        tracker.kernelSize = std::clamp(tracker.kernelSize, 1, 31);
    }
};
