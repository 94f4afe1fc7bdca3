#include "omr/AnswerResolver.hpp"

namespace omr {

AnswerResolver::AnswerResolver(double fillThreshold)
    : classifier_(fillThreshold)
{
}

ResolvedAnswers AnswerResolver::resolve(const std::vector<Row>& rows, const BinaryMask& mask, bool debug) const {
    ResolvedAnswers out;
    out.totalQuestions = static_cast<int>(rows.size());
    out.hasFillDetails = debug;

    for (const auto& row : rows) {
        QuestionResult qr = classifier_.classify(row, mask);
        if (debug) {
            out.fillDetails[qr.questionNumber] = qr.fillRatios;
        }
        out.questions[qr.questionNumber] = std::move(qr);
    }
    return out;
}

}
