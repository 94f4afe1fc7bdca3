#include "omr/BubbleDetector.hpp"

#include <opencv2/imgproc.hpp>

namespace omr {

BubbleDetector::BubbleDetector(const Range& areaRange, const Range& aspectRatioRange)
    : areaRange_(areaRange),
      aspectRatioRange_(aspectRatioRange)
{
}

bool BubbleDetector::acceptsBounds(const cv::Rect& bounds) const {
    if (bounds.width <= 0 || bounds.height <= 0) return false;
    double area = static_cast<double>(bounds.area());
    double ratio = static_cast<double>(bounds.width) / bounds.height;
    return areaRange_.contains(area) && aspectRatioRange_.contains(ratio);
}

cv::Point2d BubbleDetector::contourCentroid(const std::vector<cv::Point>& contour, const cv::Rect& bounds) {
    cv::Moments m = cv::moments(contour);
    if (m.m00 > 0.0) {
        return cv::Point2d(m.m10 / m.m00, m.m01 / m.m00);
    }
    // Degenerate (line-like) contour.
    return cv::Point2d(bounds.x + bounds.width / 2.0, bounds.y + bounds.height / 2.0);
}

std::vector<BubbleCandidate> BubbleDetector::findCandidates(const BinaryMask& mask) const {
    std::vector<BubbleCandidate> out;
    if (mask.empty()) return out;

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);

    for (auto& c : contours) {
        cv::Rect br = cv::boundingRect(c);
        if (!acceptsBounds(br)) continue;

        BubbleCandidate cand;
        cand.bounds = br;
        cand.area = static_cast<double>(br.area());
        cand.aspectRatio = static_cast<double>(br.width) / br.height;
        cand.centroid = contourCentroid(c, br);
        cand.contour = std::move(c);
        out.push_back(std::move(cand));
    }
    return out;
}

}
