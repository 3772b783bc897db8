#include <gtest/gtest.h>
#include "PointerTracker.h"

#include <opencv2/imgproc.hpp>

class PointerTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame = cv::Mat(480, 640, CV_8UC3, cv::Scalar(255, 255, 255));
    }

    void drawGreen(const cv::Rect& r) {
        cv::rectangle(frame, r, cv::Scalar(0, 255, 0), cv::FILLED);
    }

    cv::Mat frame;
    const cv::Scalar green{0, 255, 0};
};

TEST_F(PointerTrackerTest, NothingOnBlankFrame) {
    PointerTracker tracker;
    EXPECT_FALSE(tracker.locate(frame).has_value());
}

TEST_F(PointerTrackerTest, FindsGreenBlobCenter) {
    drawGreen(cv::Rect(100, 200, 100, 60));
    PointerTracker tracker;

    auto sample = tracker.locate(frame);
    ASSERT_TRUE(sample.has_value());
    EXPECT_NEAR(sample->center.x, 150.0f, 1.0f);
    EXPECT_NEAR(sample->center.y, 230.0f, 1.0f);
    EXPECT_GT(sample->area, 150.0);
}

TEST_F(PointerTrackerTest, CenterIsBoundingBoxCenterWithoutErosion) {
    drawGreen(cv::Rect(100, 200, 101, 61));
    TrackerParams params;
    params.erode = false;
    PointerTracker tracker(params);

    auto sample = tracker.locate(frame);
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->box, cv::Rect(100, 200, 101, 61));
    EXPECT_FLOAT_EQ(sample->center.x, 150.0f);
    EXPECT_FLOAT_EQ(sample->center.y, 230.0f);
}

TEST_F(PointerTrackerTest, PicksLargestBlob) {
    drawGreen(cv::Rect(20, 20, 40, 40));
    drawGreen(cv::Rect(400, 300, 120, 100));
    PointerTracker tracker;

    auto sample = tracker.locate(frame);
    ASSERT_TRUE(sample.has_value());
    EXPECT_NEAR(sample->center.x, 460.0f, 1.0f);
    EXPECT_NEAR(sample->center.y, 350.0f, 1.0f);
}

TEST_F(PointerTrackerTest, IgnoresBlobBelowMinimumArea) {
    drawGreen(cv::Rect(300, 300, 10, 10));
    PointerTracker tracker;
    EXPECT_FALSE(tracker.locate(frame).has_value());
}

TEST_F(PointerTrackerTest, RaisingMinimumAreaRejectsBlob) {
    drawGreen(cv::Rect(100, 100, 40, 40));
    PointerTracker tracker;
    ASSERT_TRUE(tracker.locate(frame).has_value());

    TrackerParams strict;
    strict.minArea = 5000;
    tracker.setParams(strict);
    EXPECT_FALSE(tracker.locate(frame).has_value());
}

TEST_F(PointerTrackerTest, IgnoresOtherColors) {
    cv::rectangle(frame, cv::Rect(100, 100, 80, 80), cv::Scalar(0, 0, 255), cv::FILLED);
    cv::rectangle(frame, cv::Rect(300, 100, 80, 80), cv::Scalar(255, 0, 0), cv::FILLED);
    cv::rectangle(frame, cv::Rect(100, 300, 80, 80), cv::Scalar(0, 0, 0), cv::FILLED);
    PointerTracker tracker;
    EXPECT_FALSE(tracker.locate(frame).has_value());
}

TEST_F(PointerTrackerTest, RejectsNonColorInput) {
    PointerTracker tracker;
    EXPECT_FALSE(tracker.locate(cv::Mat()).has_value());
    EXPECT_FALSE(tracker.locate(cv::Mat(100, 100, CV_8UC1, cv::Scalar(0))).has_value());
}

TEST_F(PointerTrackerTest, ReleaseDropsBuffers) {
    drawGreen(cv::Rect(100, 200, 100, 60));
    PointerTracker tracker;
    ASSERT_TRUE(tracker.locate(frame).has_value());
    EXPECT_FALSE(tracker.mask().empty());

    tracker.release();
    EXPECT_TRUE(tracker.mask().empty());
    EXPECT_TRUE(tracker.locate(frame).has_value());
}
