#ifndef OMR_ROW_CLUSTERER_HPP
#define OMR_ROW_CLUSTERER_HPP

#include "omr/Logger.hpp"
#include "omr/Types.hpp"

#include <vector>

namespace omr {

// Groups candidates into question rows by vertical proximity.
//
// Candidates are swept top to bottom; a candidate joins the current row
// while |y - row mean y| <= rowThreshold, otherwise it opens a new row.
// Rows whose bubble count differs from expectedOptions are dropped and
// the rest are numbered 1..N from the top.
//
// Each member is within rowThreshold of the mean as it stood when the
// member joined. The mean keeps moving as later members join, so on a
// row that drifts downward an early member can end up more than
// rowThreshold from the final mean (100, 115, 122, 127 at 15: final mean
// 116). Printed rows are far apart compared to the threshold, so this
// only shows up on rows that are already badly skewed.
class RowClusterer {
public:
    explicit RowClusterer(double rowThreshold, Logger* logger = nullptr);

    std::vector<Row> clusterRows(const std::vector<BubbleCandidate>& candidates, int expectedOptions) const;

    // Sweep only: every row, before the option-count filter.
    std::vector<Row> groupRows(const std::vector<BubbleCandidate>& candidates) const;

    double getRowThreshold() const { return rowThreshold_; }

private:
    double rowThreshold_;
    Logger* logger_;
};

}

#endif
