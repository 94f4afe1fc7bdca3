#include "omr/RowClusterer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace omr {

namespace {

const char* const kModule = "ROWS";

bool byY(const BubbleCandidate& a, const BubbleCandidate& b) {
    if (a.centroid.y != b.centroid.y) return a.centroid.y < b.centroid.y;
    return a.centroid.x < b.centroid.x;
}

bool byX(const BubbleCandidate& a, const BubbleCandidate& b) {
    if (a.centroid.x != b.centroid.x) return a.centroid.x < b.centroid.x;
    return a.centroid.y < b.centroid.y;
}

}

RowClusterer::RowClusterer(double rowThreshold, Logger* logger)
    : rowThreshold_(rowThreshold),
      logger_(logger)
{
}

std::vector<Row> RowClusterer::groupRows(const std::vector<BubbleCandidate>& candidates) const {
    std::vector<BubbleCandidate> sorted(candidates);
    std::sort(sorted.begin(), sorted.end(), byY);

    std::vector<Row> rows;
    double sumY = 0.0;

    for (auto& cand : sorted) {
        if (!rows.empty() && std::abs(cand.centroid.y - rows.back().meanY) <= rowThreshold_) {
            Row& cur = rows.back();
            cur.bubbles.push_back(std::move(cand));
            sumY += cur.bubbles.back().centroid.y;
            cur.meanY = sumY / cur.bubbles.size();
            continue;
        }

        Row row;
        row.meanY = cand.centroid.y;
        sumY = cand.centroid.y;
        row.bubbles.push_back(std::move(cand));
        rows.push_back(std::move(row));
    }

    for (auto& row : rows) {
        std::sort(row.bubbles.begin(), row.bubbles.end(), byX);
    }
    return rows;
}

std::vector<Row> RowClusterer::clusterRows(const std::vector<BubbleCandidate>& candidates, int expectedOptions) const {
    std::vector<Row> grouped = groupRows(candidates);

    std::vector<Row> rows;
    rows.reserve(grouped.size());
    int dropped = 0;

    for (auto& row : grouped) {
        if (static_cast<int>(row.bubbles.size()) != expectedOptions) {
            ++dropped;
            if (logger_ && logger_->enabled(LogLevel::DEBUG)) {
                std::ostringstream oss;
                oss << "dropping row at y=" << row.meanY << " with " << row.bubbles.size()
                    << " bubbles (expected " << expectedOptions << ")";
                logger_->debug(kModule, oss.str());
            }
            continue;
        }
        row.questionNumber = static_cast<int>(rows.size()) + 1;
        rows.push_back(std::move(row));
    }

    if (logger_ && dropped > 0) {
        logger_->info(kModule, std::to_string(dropped) + " malformed row(s) dropped, "
                               + std::to_string(rows.size()) + " kept");
    }
    return rows;
}

}
