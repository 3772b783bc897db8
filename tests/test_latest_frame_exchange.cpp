#include <gtest/gtest.h>
#include "LatestFrameExchange.h"

#include <chrono>
#include <thread>

TEST(LatestFrameExchangeTest, EmptyUntilPublished) {
    LatestFrameExchange exchange;
    cv::Mat out;
    EXPECT_FALSE(exchange.acquire(out));
}

TEST(LatestFrameExchangeTest, OnlyNewestFrameIsDelivered) {
    LatestFrameExchange exchange;
    exchange.publish(cv::Mat(4, 4, CV_8UC1, cv::Scalar(1)));
    exchange.publish(cv::Mat(4, 4, CV_8UC1, cv::Scalar(2)));
    EXPECT_EQ(exchange.published(), 2u);

    cv::Mat out;
    ASSERT_TRUE(exchange.acquire(out));
    EXPECT_EQ(out.at<uchar>(0, 0), 2);
    EXPECT_FALSE(exchange.acquire(out));
}

TEST(LatestFrameExchangeTest, WaitsForProducer) {
    LatestFrameExchange exchange;
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        exchange.publish(cv::Mat(2, 2, CV_8UC3, cv::Scalar(7, 7, 7)));
    });

    cv::Mat out;
    EXPECT_TRUE(exchange.acquire(out, std::chrono::milliseconds(2000)));
    producer.join();
    EXPECT_EQ(out.size(), cv::Size(2, 2));
}

TEST(LatestFrameExchangeTest, ShutdownWakesWaiter) {
    LatestFrameExchange exchange;
    exchange.shutdown();
    cv::Mat out;
    EXPECT_FALSE(exchange.acquire(out, std::chrono::milliseconds(2000)));

    exchange.reset();
    exchange.publish(cv::Mat(1, 1, CV_8UC1, cv::Scalar(0)));
    EXPECT_TRUE(exchange.acquire(out));
}
