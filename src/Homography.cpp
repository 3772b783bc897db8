#include "Homography.h"

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>

namespace {
// Twice the signed area of the triangle abc.
double cross(const cv::Point2f& a, const cv::Point2f& b, const cv::Point2f& c) {
    return static_cast<double>(b.x - a.x) * (c.y - a.y) - static_cast<double>(b.y - a.y) * (c.x - a.x);
}

// getPerspectiveTransform happily returns garbage for collinear input, so
// reject any triple of the four points that is (nearly) collinear.
bool wellConditioned(const std::vector<cv::Point2f>& pts) {
    constexpr double kMinArea2 = 1e-3;
    for (size_t i = 0; i < pts.size(); ++i)
        for (size_t j = i + 1; j < pts.size(); ++j)
            for (size_t k = j + 1; k < pts.size(); ++k)
                if (std::abs(cross(pts[i], pts[j], pts[k])) < kMinArea2) return false;
    return true;
}
} // namespace

std::optional<Homography> Homography::fromCorrespondences(const std::vector<cv::Point2f>& src,
                                                          const std::vector<cv::Point2f>& dst) {
    if (src.size() != dst.size() || src.size() < 4) {
        return std::nullopt;
    }

    cv::Mat H;
    try {
        if (src.size() == 4) {
            if (!wellConditioned(src) || !wellConditioned(dst)) {
                return std::nullopt;
            }
            H = cv::getPerspectiveTransform(src, dst);
        } else {
            H = cv::findHomography(src, dst, 0);
        }
    } catch (const cv::Exception&) {
        return std::nullopt;
    }

    if (H.empty() || H.rows != 3 || H.cols != 3) {
        return std::nullopt;
    }

    cv::Mat Hd;
    H.convertTo(Hd, CV_64F);
    const cv::Matx33d m(Hd.ptr<double>());
    for (double v : m.val) {
        if (!std::isfinite(v)) return std::nullopt;
    }
    return Homography(m);
}

Homography::Homography(const cv::Matx33d& m) : m_(m) {}

std::optional<cv::Point2d> Homography::map(const cv::Point2d& p) const {
    // perspectiveTransform silently writes (0,0) for points on the line at infinity.
    const double w = m_(2, 0) * p.x + m_(2, 1) * p.y + m_(2, 2);
    if (!std::isfinite(w) || std::abs(w) < 1e-12) {
        return std::nullopt;
    }

    std::vector<cv::Point2d> in{p};
    std::vector<cv::Point2d> out;
    cv::perspectiveTransform(in, out, cv::Mat(m_));
    if (out.empty() || !std::isfinite(out[0].x) || !std::isfinite(out[0].y)) {
        return std::nullopt;
    }
    return out[0];
}
