#ifndef OMR_BUBBLE_DETECTOR_HPP
#define OMR_BUBBLE_DETECTOR_HPP

#include "omr/DetectorConfig.hpp"
#include "omr/Types.hpp"

#include <vector>

namespace omr {

class BubbleDetector {
public:
    BubbleDetector(const Range& areaRange, const Range& aspectRatioRange);

    // Bubble-shaped external contours of the mask, in contour order.
    std::vector<BubbleCandidate> findCandidates(const BinaryMask& mask) const;

    // Geometric filter alone, usable on a single bounding box.
    bool acceptsBounds(const cv::Rect& bounds) const;

    const Range& getAreaRange() const { return areaRange_; }
    const Range& getAspectRatioRange() const { return aspectRatioRange_; }

private:
    Range areaRange_;
    Range aspectRatioRange_;

    static cv::Point2d contourCentroid(const std::vector<cv::Point>& contour, const cv::Rect& bounds);
};

}

#endif
