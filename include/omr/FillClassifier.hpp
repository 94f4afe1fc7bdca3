#ifndef OMR_FILL_CLASSIFIER_HPP
#define OMR_FILL_CLASSIFIER_HPP

#include "omr/Types.hpp"

#include <vector>

namespace omr {

class FillClassifier {
public:
    explicit FillClassifier(double fillThreshold);

    // One marked bubble gives its letter, none gives Unmarked, several
    // give Ambiguous. The fill map is always filled in.
    QuestionResult classify(const Row& row, const BinaryMask& mask) const;

    std::vector<FillScore> scoreRow(const Row& row, const BinaryMask& mask) const;

    // Percentage of ink pixels inside the bubble contour, 0..100.
    static double fillRatio(const BubbleCandidate& bubble, const BinaryMask& mask);

    double getFillThreshold() const { return fillThreshold_; }

private:
    double fillThreshold_;
};

}

#endif
