#include "omr/FillClassifier.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <climits>

namespace omr {

FillClassifier::FillClassifier(double fillThreshold)
    : fillThreshold_(fillThreshold)
{
}

double FillClassifier::fillRatio(const BubbleCandidate& bubble, const BinaryMask& mask) {
    if (mask.empty()) return 0.0;

    cv::Rect box = bubble.bounds & cv::Rect(0, 0, mask.cols, mask.rows);
    if (box.width <= 0 || box.height <= 0) return 0.0;

    cv::Mat region = cv::Mat::zeros(box.size(), CV_8UC1);
    if (!bubble.contour.empty()) {
        std::vector<std::vector<cv::Point>> polys{bubble.contour};
        cv::drawContours(region, polys, 0, cv::Scalar(255), cv::FILLED, cv::LINE_8,
                         cv::noArray(), INT_MAX, cv::Point(-box.x, -box.y));
    } else {
        region.setTo(cv::Scalar(255));
    }

    int total = cv::countNonZero(region);
    if (total == 0) return 0.0;

    cv::Mat ink;
    cv::bitwise_and(mask(box), region, ink);
    double ratio = 100.0 * cv::countNonZero(ink) / total;
    return std::clamp(ratio, 0.0, 100.0);
}

std::vector<FillScore> FillClassifier::scoreRow(const Row& row, const BinaryMask& mask) const {
    std::vector<FillScore> scores;
    scores.reserve(row.bubbles.size());
    for (size_t i = 0; i < row.bubbles.size(); ++i) {
        scores.push_back({optionLetter(static_cast<int>(i)), fillRatio(row.bubbles[i], mask)});
    }
    return scores;
}

QuestionResult FillClassifier::classify(const Row& row, const BinaryMask& mask) const {
    QuestionResult res;
    res.questionNumber = row.questionNumber;

    int marked = 0;
    for (const auto& s : scoreRow(row, mask)) {
        res.fillRatios[s.option] = s.fillRatio;
        if (s.fillRatio >= fillThreshold_) {
            ++marked;
            res.option = s.option;
        }
    }

    if (marked == 1) {
        res.state = AnswerState::Marked;
    } else if (marked == 0) {
        res.state = AnswerState::Unmarked;
    } else {
        res.state = AnswerState::Ambiguous;
        res.option = '\0';
    }
    return res;
}

}
