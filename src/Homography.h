#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <vector>

// Planar projective transform from camera pixels to canvas pixels.
// Immutable once built; a recalibration replaces the whole object.
class Homography {
public:
    // Exact solve for 4 pairs, least squares for more. Returns nullopt when
    // the correspondences are degenerate (collinear, repeated points).
    static std::optional<Homography> fromCorrespondences(const std::vector<cv::Point2f>& src,
                                                         const std::vector<cv::Point2f>& dst);

    explicit Homography(const cv::Matx33d& m);

    // nullopt when the point maps to infinity.
    std::optional<cv::Point2d> map(const cv::Point2d& p) const;

    const cv::Matx33d& matrix() const { return m_; }

private:
    cv::Matx33d m_;
};
