#include "omr/Types.hpp"

namespace omr {

const char* const kUnmarked = "unmarked";
const char* const kAmbiguous = "ambiguous";

std::string QuestionResult::answer() const {
    switch (state) {
    case AnswerState::Marked:
        return std::string(1, option);
    case AnswerState::Ambiguous:
        return kAmbiguous;
    case AnswerState::Unmarked:
        break;
    }
    return kUnmarked;
}

std::map<int, std::string> ResolvedAnswers::answerMap() const {
    std::map<int, std::string> out;
    for (const auto& [number, result] : questions) {
        out[number] = result.answer();
    }
    return out;
}

}
