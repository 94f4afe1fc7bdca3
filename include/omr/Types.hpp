#ifndef OMR_TYPES_HPP
#define OMR_TYPES_HPP

#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

namespace omr {

// 8-bit single channel, same size as the source image. 255 = ink.
using BinaryMask = cv::Mat;

struct BubbleCandidate {
    cv::Point2d centroid;
    cv::Rect bounds;
    double area = 0.0;          // bounds.area()
    double aspectRatio = 0.0;   // bounds.width / bounds.height
    std::vector<cv::Point> contour;
};

// One question: bubbles ordered left to right.
struct Row {
    std::vector<BubbleCandidate> bubbles;
    double meanY = 0.0;
    int questionNumber = 0;
};

struct FillScore {
    char option;
    double fillRatio;   // 0..100
};

enum class AnswerState {
    Marked,
    Unmarked,
    Ambiguous
};

extern const char* const kUnmarked;
extern const char* const kAmbiguous;

struct QuestionResult {
    int questionNumber = 0;
    AnswerState state = AnswerState::Unmarked;
    char option = '\0';                     // set only when Marked
    std::map<char, double> fillRatios;

    // Letter, "unmarked" or "ambiguous".
    std::string answer() const;
};

using FillDetails = std::map<int, std::map<char, double>>;

struct ResolvedAnswers {
    std::map<int, QuestionResult> questions;
    int totalQuestions = 0;
    bool hasFillDetails = false;
    FillDetails fillDetails;

    std::map<int, std::string> answerMap() const;
};

struct EvaluationResult {
    int score = 0;
    int total = 0;
    double percentage = 0.0;
    std::vector<int> correct;
    std::vector<int> wrong;
    std::vector<int> unmarked;
    std::map<int, std::string> detectedAnswers;
};

inline char optionLetter(int index) { return static_cast<char>('A' + index); }

}

#endif
