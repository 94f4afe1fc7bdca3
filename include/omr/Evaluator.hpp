#ifndef OMR_EVALUATOR_HPP
#define OMR_EVALUATOR_HPP

#include "omr/AnswerKey.hpp"
#include "omr/Types.hpp"

#include <map>
#include <string>

namespace omr {

class Evaluator {
public:
    explicit Evaluator(const AnswerKey& answerKey);

    // Scores every question of the key. Detected questions outside the
    // key are ignored. Throws EmptyAnswerKeyError for an empty key.
    EvaluationResult evaluate(const std::map<int, std::string>& detectedAnswers) const;

    // Rounded to 2 decimals.
    static double percentage(int score, int total);

    // 2 decimals, half to even.
    static double roundPercent(double pct);

private:
    const AnswerKey& answerKey_;
};

}

#endif
