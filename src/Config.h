#pragma once

#ifdef config
#undef config
#endif

#include <cstdint>

namespace config {

// Shared canvas
inline constexpr int CANVAS_W = 1920;
inline constexpr int CANVAS_H = 1080;
inline constexpr int MARKER_SIZE_PX = 200;
inline constexpr int MARKER_MARGIN_PX = 40;
inline constexpr int MARKER_BORDER_BITS = 1;
inline constexpr int MARKER_COUNT = 4;

// Canvas colors are BGR
inline constexpr int BACKGROUND_B = 255;
inline constexpr int BACKGROUND_G = 255;
inline constexpr int BACKGROUND_R = 255;

// Strokes
inline constexpr int STROKE_WIDTH_PX = 5;
inline constexpr int CURSOR_RADIUS_PX = 8;

// Camera settings
inline constexpr int CAM1_IDX = 0;
inline constexpr int CAM2_IDX = 1;
inline constexpr int CAPTURE_FPS = 30;
inline constexpr int CAPTURE_WIDTH = 1280;
inline constexpr int CAPTURE_HEIGHT = 720;
inline constexpr int CAM_WARMUP_FRAMES = 12;
inline constexpr bool CAM_FORCE_MJPEG = true;

// Per-channel working buffer (every frame is resized to this)
inline constexpr int WORK_W = 1280;
inline constexpr int WORK_H = 720;

// Display tick
inline constexpr int DISPLAY_RATE_HZ = 60;
inline constexpr double FPS_LOG_INTERVAL_S = 2.0;

// Calibration: attempt on every Nth tick while uncalibrated
inline constexpr int CALIBRATION_CADENCE = 3;

// Pointer segmentation (OpenCV HSV: H 0..179)
inline constexpr int POINTER_H_MIN = 40;
inline constexpr int POINTER_S_MIN = 40;
inline constexpr int POINTER_V_MIN = 0;
inline constexpr int POINTER_H_MAX = 80;
inline constexpr int POINTER_S_MAX = 255;
inline constexpr int POINTER_V_MAX = 255;
inline constexpr int MORPH_KERNEL = 7;
inline constexpr bool POINTER_ERODE = true;
inline constexpr double POINTER_MIN_AREA = 150.0;
inline constexpr double POINTER_MIN_AREA_FLOOR = 100.0;
inline constexpr double POINTER_MIN_AREA_STEP = 50.0;

// Smoothing
inline constexpr int SMOOTHING_WINDOW = 5;
inline constexpr int LOST_FRAME_TOLERANCE = 0;

// Web UI / dashboard
inline constexpr const char* WEB_BIND_ADDRESS = "0.0.0.0";
inline constexpr int WEB_PORT = 5805;
inline constexpr const char* WEB_DASHBOARD_TITLE = "Whiteboard Vision";
inline constexpr int MJPEG_STREAM_FPS = 24;
inline constexpr double STREAM_FAST_SCALE = 0.5;
inline constexpr int JPEG_QUALITY = 80;

} // namespace config
