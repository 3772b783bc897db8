#include <gtest/gtest.h>
#include "Homography.h"

#include <vector>

namespace {
std::vector<cv::Point2f> square(float x0, float y0, float side) {
    return {{x0, y0}, {x0 + side, y0}, {x0 + side, y0 + side}, {x0, y0 + side}};
}
}

TEST(HomographyTest, IdentityFromMatchingPoints) {
    auto pts = square(40, 40, 1000);
    auto h = Homography::fromCorrespondences(pts, pts);
    ASSERT_TRUE(h.has_value());
    const cv::Matx33d m = h->matrix() * (1.0 / h->matrix()(2, 2));
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            EXPECT_NEAR(m(r, c), r == c ? 1.0 : 0.0, 1e-9);
        }
    }

    auto p = h->map({500, 500});
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, 500.0, 1e-6);
    EXPECT_NEAR(p->y, 500.0, 1e-6);
}

TEST(HomographyTest, Scaling) {
    auto h = Homography::fromCorrespondences(square(0, 0, 100), square(0, 0, 200));
    ASSERT_TRUE(h.has_value());

    auto p = h->map({50, 25});
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->x, 100.0, 1e-6);
    EXPECT_NEAR(p->y, 50.0, 1e-6);
}

TEST(HomographyTest, PerspectiveQuadMapsCorners) {
    std::vector<cv::Point2f> src = {{210, 95}, {1105, 130}, {1190, 660}, {150, 610}};
    std::vector<cv::Point2f> dst = {{140, 140}, {1780, 140}, {1780, 940}, {140, 940}};
    auto h = Homography::fromCorrespondences(src, dst);
    ASSERT_TRUE(h.has_value());

    for (size_t i = 0; i < src.size(); ++i) {
        auto p = h->map(src[i]);
        ASSERT_TRUE(p.has_value());
        EXPECT_NEAR(p->x, dst[i].x, 1e-3);
        EXPECT_NEAR(p->y, dst[i].y, 1e-3);
    }
}

TEST(HomographyTest, RejectsCollinearPoints) {
    std::vector<cv::Point2f> src = {{0, 0}, {1, 1}, {2, 2}, {0, 5}};
    EXPECT_FALSE(Homography::fromCorrespondences(src, square(0, 0, 100)).has_value());
}

TEST(HomographyTest, RejectsRepeatedPoints) {
    std::vector<cv::Point2f> src = {{10, 10}, {10, 10}, {50, 50}, {10, 50}};
    EXPECT_FALSE(Homography::fromCorrespondences(src, square(0, 0, 100)).has_value());
}

TEST(HomographyTest, RejectsMismatchedOrShortInput) {
    EXPECT_FALSE(Homography::fromCorrespondences(square(0, 0, 10), {{0, 0}, {1, 0}, {1, 1}}).has_value());
    std::vector<cv::Point2f> three = {{0, 0}, {1, 0}, {1, 1}};
    EXPECT_FALSE(Homography::fromCorrespondences(three, three).has_value());
}

TEST(HomographyTest, LeastSquaresWithExtraPoints) {
    const cv::Matx33d truth(1.2, 0.1, 30.0,
                            -0.05, 0.9, 12.0,
                            0.0001, 0.0002, 1.0);
    Homography reference(truth);

    std::vector<cv::Point2f> src = {{0, 0}, {640, 0}, {640, 480}, {0, 480}, {320, 240}, {100, 400}};
    std::vector<cv::Point2f> dst;
    for (const auto& s : src) {
        auto d = reference.map(s);
        ASSERT_TRUE(d.has_value());
        dst.emplace_back(static_cast<float>(d->x), static_cast<float>(d->y));
    }

    auto h = Homography::fromCorrespondences(src, dst);
    ASSERT_TRUE(h.has_value());
    auto expected = reference.map({200, 150});
    auto actual = h->map({200, 150});
    ASSERT_TRUE(expected.has_value());
    ASSERT_TRUE(actual.has_value());
    EXPECT_NEAR(actual->x, expected->x, 0.05);
    EXPECT_NEAR(actual->y, expected->y, 0.05);
}

TEST(HomographyTest, PointAtInfinityHasNoImage) {
    Homography h(cv::Matx33d(1, 0, 0,
                             0, 1, 0,
                             1, 0, 0));
    EXPECT_FALSE(h.map({0, 5}).has_value());
    EXPECT_TRUE(h.map({2, 5}).has_value());
}
