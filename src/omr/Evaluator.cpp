#include "omr/Evaluator.hpp"
#include "omr/Errors.hpp"

#include <cmath>

namespace omr {

Evaluator::Evaluator(const AnswerKey& answerKey)
    : answerKey_(answerKey) {}

double Evaluator::roundPercent(double pct) {
    // Ties go to the even digit (default FE_TONEAREST): 3.125 -> 3.12.
    return std::nearbyint(pct * 100.0) / 100.0;
}

double Evaluator::percentage(int score, int total) {
    if (total <= 0) throw EmptyAnswerKeyError();
    return roundPercent(static_cast<double>(score) / total * 100.0);
}

EvaluationResult Evaluator::evaluate(const std::map<int, std::string>& detectedAnswers) const {
    if (answerKey_.empty()) throw EmptyAnswerKeyError();

    EvaluationResult result;
    result.total = answerKey_.getQuestionCount();
    result.detectedAnswers = detectedAnswers;

    // Key entries iterate in ascending question order.
    for (const auto& [question, correct] : answerKey_.entries()) {
        auto it = detectedAnswers.find(question);

        if (it == detectedAnswers.end() || it->second.empty() || it->second == kUnmarked) {
            result.unmarked.push_back(question);
        }
        else if (it->second.size() == 1 && it->second[0] == correct) {
            result.correct.push_back(question);
        }
        else {
            result.wrong.push_back(question);
        }
    }

    result.score = static_cast<int>(result.correct.size());
    result.percentage = percentage(result.score, result.total);
    return result;
}

}
