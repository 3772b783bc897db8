#include <gtest/gtest.h>
#include "FiducialCalibrator.h"
#include "ProjectionEngine.h"
#include "Whiteboard.h"

#include <opencv2/imgproc.hpp>
#include <memory>
#include <stdexcept>

namespace {

Detection squareMarker(int id, cv::Point2f center, float half = 30.0f) {
    Detection d;
    d.id = id;
    d.corners = {center + cv::Point2f(-half, -half), center + cv::Point2f(half, -half),
                 center + cv::Point2f(half, half), center + cv::Point2f(-half, half)};
    return d;
}

std::vector<Detection> markersAt(const CanvasLayout& layout) {
    std::vector<Detection> dets;
    for (int id = 0; id < config::MARKER_COUNT; ++id) {
        dets.push_back(squareMarker(id, layout.anchorCenter(id)));
    }
    return dets;
}

std::unique_ptr<Detector> noDetector() {
    throw std::runtime_error("objdetect module missing");
}

} // namespace

TEST(FiducialCalibratorTest, CentroidsOfAllFourMarkers) {
    std::vector<Detection> dets = {squareMarker(2, {300, 400}), squareMarker(0, {10, 20}),
                                   squareMarker(3, {15, 410}), squareMarker(1, {290, 25})};
    auto centers = FiducialCalibrator::markerCentroids(dets);
    ASSERT_TRUE(centers.has_value());
    EXPECT_FLOAT_EQ((*centers)[0].x, 10.0f);
    EXPECT_FLOAT_EQ((*centers)[0].y, 20.0f);
    EXPECT_FLOAT_EQ((*centers)[2].x, 300.0f);
    EXPECT_FLOAT_EQ((*centers)[2].y, 400.0f);
}

TEST(FiducialCalibratorTest, MissingMarkerFails) {
    CanvasLayout layout;
    auto dets = markersAt(layout);
    dets.pop_back();
    EXPECT_FALSE(FiducialCalibrator::markerCentroids(dets).has_value());
}

TEST(FiducialCalibratorTest, DuplicateMarkerFails) {
    CanvasLayout layout;
    auto dets = markersAt(layout);
    dets.push_back(squareMarker(1, {500, 500}));
    EXPECT_FALSE(FiducialCalibrator::markerCentroids(dets).has_value());
}

TEST(FiducialCalibratorTest, UnrelatedIdsAreIgnored) {
    CanvasLayout layout;
    auto dets = markersAt(layout);
    dets.push_back(squareMarker(7, {500, 500}));
    EXPECT_TRUE(FiducialCalibrator::markerCentroids(dets).has_value());
}

TEST(FiducialCalibratorTest, IdentityWhenCameraSeesCanvasHeadOn) {
    CanvasLayout layout(cv::Size(1920, 1080), 80, 0);
    FiducialCalibrator calibrator(VisionRuntime::instance(), layout);

    auto dets = markersAt(layout);
    dets.push_back(squareMarker(9, {700, 700}));
    CalibrationResult result = calibrator.calibrateFromDetections(dets);

    ASSERT_EQ(result.outcome, CalibrationOutcome::Calibrated);
    ASSERT_TRUE(result.homography.has_value());
    EXPECT_EQ(result.seenIds.size(), 5u);

    auto p = result.homography->map({500, 500});
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, 500.0, 1e-3);
    EXPECT_NEAR(p->y, 500.0, 1e-3);
}

TEST(FiducialCalibratorTest, ThreeMarkersLeaveChannelUncalibrated) {
    CanvasLayout layout;
    FiducialCalibrator calibrator(VisionRuntime::instance(), layout);

    auto dets = markersAt(layout);
    dets.erase(dets.begin() + 1);
    CalibrationResult result = calibrator.calibrateFromDetections(dets);

    EXPECT_EQ(result.outcome, CalibrationOutcome::MarkerSetIncomplete);
    EXPECT_FALSE(result.homography.has_value());
    EXPECT_EQ(result.seenIds, (std::vector<int>{0, 2, 3}));
}

TEST(FiducialCalibratorTest, DetectsMarkersRenderedOnWhiteboard) {
    VisionRuntime& runtime = VisionRuntime::instance();
    ASSERT_TRUE(runtime.ready()) << runtime.error();

    CanvasLayout layout;
    Whiteboard board(runtime, layout);
    ASSERT_TRUE(board.hasMarkers());

    cv::Mat gray;
    cv::cvtColor(board.raster(), gray, cv::COLOR_BGR2GRAY);

    FiducialCalibrator calibrator(runtime, layout);
    CalibrationResult result = calibrator.calibrate(gray);
    ASSERT_EQ(result.outcome, CalibrationOutcome::Calibrated);

    auto p = result.homography->map({960, 540});
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, 960.0, 2.0);
    EXPECT_NEAR(p->y, 540.0, 2.0);
}

TEST(FiducialCalibratorTest, BlankFrameIsIncomplete) {
    FiducialCalibrator calibrator(VisionRuntime::instance(), CanvasLayout());
    cv::Mat gray(720, 1280, CV_8UC1, cv::Scalar(255));
    CalibrationResult result = calibrator.calibrate(gray);
    EXPECT_EQ(result.outcome, CalibrationOutcome::MarkerSetIncomplete);
    EXPECT_TRUE(result.seenIds.empty());
}

TEST(FiducialCalibratorTest, MissingCapabilityThrows) {
    VisionRuntime broken(noDetector);
    EXPECT_FALSE(broken.ready());
    EXPECT_NE(broken.error().find("objdetect module missing"), std::string::npos);

    FiducialCalibrator calibrator(broken, CanvasLayout());
    cv::Mat gray(720, 1280, CV_8UC1, cv::Scalar(255));
    EXPECT_THROW(calibrator.calibrate(gray), CapabilityUnavailableError);
}

TEST(FiducialCalibratorTest, OutcomeNames) {
    EXPECT_STREQ(toString(CalibrationOutcome::Calibrated), "calibrated");
    EXPECT_STREQ(toString(CalibrationOutcome::MarkerSetIncomplete), "marker-set-incomplete");
    EXPECT_STREQ(toString(CalibrationOutcome::CapabilityUnavailable), "capability-unavailable");
}

TEST(FiducialCalibratorTest, PointerProjectsThroughCalibratedHomography) {
    CanvasLayout layout(cv::Size(1920, 1080), 80, 0);
    FiducialCalibrator calibrator(VisionRuntime::instance(), layout);

    std::vector<Detection> dets = {squareMarker(0, {40, 40}), squareMarker(1, {1880, 40}),
                                   squareMarker(2, {1880, 1040}), squareMarker(3, {40, 1040})};
    CalibrationResult result = calibrator.calibrateFromDetections(dets);
    ASSERT_TRUE(result.homography.has_value());

    ProjectionEngine engine(layout);
    Projection out = engine.update(cv::Point2f(500, 500), &*result.homography);
    ASSERT_TRUE(out.canvas.has_value());
    EXPECT_EQ(*out.canvas, cv::Point(500, 500));
}
