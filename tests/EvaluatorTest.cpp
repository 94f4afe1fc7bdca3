#include "omr/Errors.hpp"
#include "omr/Evaluator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using namespace omr;

TEST(EvaluatorTest, ClassifiesEveryKeyQuestion) {
    AnswerKey key = AnswerKey::fromString("BACD");
    std::map<int, std::string> detected = {
        {1, "B"},           // correct
        {2, "ambiguous"},   // wrong
        {3, "unmarked"},    // unmarked
        // 4 missing       -> unmarked
        {9, "A"},           // not in the key
    };

    EvaluationResult r = Evaluator(key).evaluate(detected);
    EXPECT_EQ(r.total, 4);
    EXPECT_EQ(r.score, 1);
    EXPECT_DOUBLE_EQ(r.percentage, 25.0);
    EXPECT_EQ(r.correct, std::vector<int>({1}));
    EXPECT_EQ(r.wrong, std::vector<int>({2}));
    EXPECT_EQ(r.unmarked, std::vector<int>({3, 4}));
    EXPECT_EQ(r.detectedAnswers, detected);
}

TEST(EvaluatorTest, DifferentLetterIsWrong) {
    AnswerKey key(std::map<int, char>{{1, 'A'}});
    EvaluationResult r = Evaluator(key).evaluate({{1, "D"}});
    EXPECT_EQ(r.wrong, std::vector<int>({1}));
    EXPECT_EQ(r.score, 0);
    EXPECT_DOUBLE_EQ(r.percentage, 0.0);
}

TEST(EvaluatorTest, PercentageRoundsToTwoDecimals) {
    EXPECT_DOUBLE_EQ(Evaluator::percentage(1, 3), 33.33);
    EXPECT_DOUBLE_EQ(Evaluator::percentage(2, 3), 66.67);
    EXPECT_DOUBLE_EQ(Evaluator::percentage(9, 10), 90.0);
    EXPECT_THROW(Evaluator::percentage(0, 0), EmptyAnswerKeyError);
}

TEST(EvaluatorTest, HalfCentTiesRoundToEven) {
    EXPECT_DOUBLE_EQ(Evaluator::percentage(1, 32), 3.12);    // 3.125
    EXPECT_DOUBLE_EQ(Evaluator::percentage(5, 32), 15.62);   // 15.625
    EXPECT_DOUBLE_EQ(Evaluator::percentage(3, 32), 9.38);    // 9.375
    EXPECT_DOUBLE_EQ(Evaluator::roundPercent(12.5), 12.5);
}

TEST(EvaluatorTest, EmptyKeyThrows) {
    AnswerKey key;
    EXPECT_THROW(Evaluator(key).evaluate({{1, "A"}}), EmptyAnswerKeyError);
}

TEST(EvaluatorTest, ListsPartitionTheKey) {
    AnswerKey key = AnswerKey::fromString("ABCDABCDAB");
    std::map<int, std::string> detected = {
        {1, "A"}, {2, "C"}, {3, "C"}, {5, "ambiguous"}, {6, "unmarked"}, {7, "C"}, {10, "B"},
    };
    EvaluationResult r = Evaluator(key).evaluate(detected);

    std::set<int> all;
    for (auto* list : {&r.correct, &r.wrong, &r.unmarked}) {
        for (int q : *list) EXPECT_TRUE(all.insert(q).second) << "question " << q << " listed twice";
    }
    EXPECT_EQ(all.size(), static_cast<size_t>(key.getQuestionCount()));

    int matches = 0;
    for (const auto& [q, letter] : key.entries()) {
        auto it = detected.find(q);
        if (it != detected.end() && it->second == std::string(1, letter)) ++matches;
    }
    EXPECT_EQ(r.score, matches);
    EXPECT_TRUE(std::is_sorted(r.unmarked.begin(), r.unmarked.end()));
}
