#ifndef OMR_ANSWER_KEY_HPP
#define OMR_ANSWER_KEY_HPP

#include <map>
#include <string>
#include <vector>

namespace omr {

class AnswerKey {
public:
    struct QuestionAnswer {
        int questionNumber;       // 1-based
        char correctAnswer;       // A, B, C, ...
    };

    AnswerKey() = default;
    explicit AnswerKey(const std::map<int, char>& answers);

    // Replaces the key. Throws ConfigError on a bad number or letter.
    void loadAnswerKey(const std::vector<QuestionAnswer>& answers);

    // "BACD..." -> {1:B, 2:A, 3:C, 4:D, ...}
    static AnswerKey fromString(const std::string& letters);

    // "1:B, 2:A, 10:D"
    static AnswerKey parse(const std::string& text);

    void set(int questionNumber, char correctAnswer);

    bool contains(int questionNumber) const;
    char getCorrectAnswer(int questionNumber) const;

    int getQuestionCount() const { return static_cast<int>(keyMap_.size()); }
    bool empty() const { return keyMap_.empty(); }

    const std::map<int, char>& entries() const { return keyMap_; }

private:
    std::map<int, char> keyMap_;
};

}

#endif
