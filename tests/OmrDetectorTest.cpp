#include "omr/OmrDetector.hpp"
#include "SyntheticSheet.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cstdio>
#include <memory>
#include <sstream>
#include <filesystem>

using omr::AnswerKey;
using omr::DetectionResult;
using omr::DetectorConfig;
using omr::EvaluationReport;
using omr::OmrDetector;
using omr::Status;
using omr::testing::SyntheticSheet;

namespace {

const std::string kMarks = "BACDBCADAB";

std::map<int, std::string> expectedAnswers(const std::string& letters) {
    std::map<int, std::string> out;
    for (size_t i = 0; i < letters.size(); ++i) {
        out[static_cast<int>(i) + 1] = letters[i] == ' ' ? "unmarked" : std::string(1, letters[i]);
    }
    return out;
}

}

TEST(OmrDetectorTest, ReadsOneMarkPerRow) {
    OmrDetector detector;
    DetectionResult res = detector.detect(SyntheticSheet::fromLetters(kMarks).render(), 4);

    ASSERT_TRUE(res.ok()) << res.error;
    EXPECT_EQ(res.totalQuestions, 10);
    EXPECT_EQ(res.detectedAnswers, expectedAnswers(kMarks));
    EXPECT_FALSE(res.hasFillDetails);
}

TEST(OmrDetectorTest, DoubleMarkIsAmbiguous) {
    SyntheticSheet sheet = SyntheticSheet::fromLetters(kMarks);
    sheet.marks[2] = "CD";

    DetectionResult res = OmrDetector().detect(sheet.render(), 4);
    ASSERT_TRUE(res.ok()) << res.error;
    EXPECT_EQ(res.detectedAnswers.at(3), "ambiguous");

    AnswerKey key = AnswerKey::fromString(kMarks);
    EvaluationReport rep = OmrDetector().evaluate(sheet.render(), key, 4);
    ASSERT_TRUE(rep.ok()) << rep.error;
    EXPECT_EQ(rep.score, 9);
    EXPECT_EQ(rep.wrong, std::vector<int>({3}));
    EXPECT_TRUE(rep.unmarked.empty());
}

TEST(OmrDetectorTest, UnmarkedQuestionScoresNinetyPercent) {
    std::string marks = kMarks;
    marks[4] = ' ';
    AnswerKey key = AnswerKey::fromString(kMarks);
    ASSERT_EQ(key.getCorrectAnswer(1), 'B');
    ASSERT_EQ(key.getCorrectAnswer(2), 'A');
    ASSERT_EQ(key.getCorrectAnswer(10), 'B');

    EvaluationReport rep = OmrDetector().evaluate(SyntheticSheet::fromLetters(marks).render(), key, 4);
    ASSERT_TRUE(rep.ok()) << rep.error;
    EXPECT_EQ(rep.score, 9);
    EXPECT_EQ(rep.total, 10);
    EXPECT_DOUBLE_EQ(rep.percentage, 90.0);
    EXPECT_EQ(rep.unmarked, std::vector<int>({5}));
    EXPECT_TRUE(rep.wrong.empty());
    EXPECT_EQ(rep.detectedAnswers.at(5), "unmarked");
}

TEST(OmrDetectorTest, EmptyKeyIsReportedNotThrown) {
    EvaluationReport rep;
    EXPECT_NO_THROW(rep = OmrDetector().evaluate(SyntheticSheet::fromLetters(kMarks).render(), AnswerKey(), 4));
    EXPECT_EQ(rep.status, Status::Error);
    EXPECT_NE(rep.error.find("empty"), std::string::npos);
}

TEST(OmrDetectorTest, RepeatedCallsGiveIdenticalAnswers) {
    DetectorConfig cfg;
    cfg.debug = true;
    OmrDetector detector(cfg);
    cv::Mat img = SyntheticSheet::fromLetters(kMarks).render();

    DetectionResult a = detector.detect(img, 4);
    DetectionResult b = detector.detect(img, 4);
    EXPECT_EQ(a.detectedAnswers, b.detectedAnswers);
    EXPECT_EQ(a.fillDetails, b.fillDetails);
}

TEST(OmrDetectorTest, FillDetailsInDebugStayInRange) {
    DetectorConfig cfg;
    cfg.debug = true;
    SyntheticSheet sheet = SyntheticSheet::fromLetters(kMarks);
    sheet.marks[6] = "ABCD";

    DetectionResult res = OmrDetector(cfg).detect(sheet.render(), 4);
    ASSERT_TRUE(res.ok()) << res.error;
    ASSERT_TRUE(res.hasFillDetails);
    ASSERT_EQ(res.fillDetails.size(), 10u);
    for (const auto& [q, fills] : res.fillDetails) {
        EXPECT_EQ(fills.size(), 4u) << "question " << q;
        for (const auto& [letter, ratio] : fills) {
            EXPECT_GE(ratio, 0.0);
            EXPECT_LE(ratio, 100.0);
        }
    }
    EXPECT_EQ(res.detectedAnswers.at(7), "ambiguous");
}

TEST(OmrDetectorTest, MalformedRowsAreNotCounted) {
    SyntheticSheet sheet = SyntheticSheet::fromLetters(kMarks);
    sheet.missingBubbleRows = {3, 7};

    DetectionResult res = OmrDetector().detect(sheet.render(), 4);
    ASSERT_TRUE(res.ok()) << res.error;
    EXPECT_EQ(res.totalQuestions, 8);
    EXPECT_EQ(res.detectedAnswers.size(), 8u);
    EXPECT_EQ(res.detectedAnswers.at(4), std::string(1, kMarks[4]));
}

TEST(OmrDetectorTest, OptionCountFollowsExpectedOptions) {
    SyntheticSheet sheet = SyntheticSheet::fromLetters("EAC", 5);
    DetectionResult five = OmrDetector().detect(sheet.render(), 5);
    ASSERT_TRUE(five.ok());
    EXPECT_EQ(five.detectedAnswers, expectedAnswers("EAC"));

    DetectionResult four = OmrDetector().detect(sheet.render(), 4);
    ASSERT_TRUE(four.ok());
    EXPECT_EQ(four.totalQuestions, 0);
}

TEST(OmrDetectorTest, AdaptiveThresholdReadsThinRingsUnderUnevenLight) {
    DetectorConfig cfg;
    cfg.adaptiveThreshold = true;
    cfg.adaptiveBlockSize = 101;
    cfg.adaptiveC = 5.0;
    OmrDetector detector(cfg);
    EXPECT_TRUE(detector.getConfig().adaptiveThreshold);
    EXPECT_EQ(detector.getConfig().adaptiveBlockSize, 101);

    std::string marks = kMarks;
    marks[6] = ' ';
    SyntheticSheet sheet = SyntheticSheet::fromLetters(marks);
    sheet.ringThickness = 2;
    cv::Mat img = SyntheticSheet::unevenlyLit(sheet.render(), 0.45);

    DetectionResult res = detector.detect(img, 4);
    ASSERT_TRUE(res.ok()) << res.error;
    EXPECT_EQ(res.totalQuestions, 10);
    EXPECT_EQ(res.detectedAnswers, expectedAnswers(marks));
}

TEST(OmrDetectorTest, BlankPageIsSuccessWithZeroQuestions) {
    cv::Mat blank(400, 300, CV_8UC1, cv::Scalar(255));
    DetectionResult res = OmrDetector().detect(blank, 4);
    EXPECT_EQ(res.status, Status::Success);
    EXPECT_EQ(res.totalQuestions, 0);
    EXPECT_TRUE(res.detectedAnswers.empty());
}

TEST(OmrDetectorTest, ColorInputIsAccepted) {
    cv::Mat bgr;
    cv::cvtColor(SyntheticSheet::fromLetters(kMarks).render(), bgr, cv::COLOR_GRAY2BGR);
    DetectionResult res = OmrDetector().detect(bgr, 4);
    ASSERT_TRUE(res.ok()) << res.error;
    EXPECT_EQ(res.detectedAnswers, expectedAnswers(kMarks));
}

TEST(OmrDetectorTest, BadInputsBecomeErrorResults) {
    OmrDetector detector;

    DetectionResult empty = detector.detect(cv::Mat(), 4);
    EXPECT_EQ(empty.status, Status::Error);
    EXPECT_FALSE(empty.error.empty());

    DetectionResult badOptions = detector.detect(SyntheticSheet::fromLetters("A").render(), 0);
    EXPECT_EQ(badOptions.status, Status::Error);
    EXPECT_NE(badOptions.error.find("expected_options"), std::string::npos);

    DetectionResult missing = detector.detectFile("/nonexistent/sheet.png", 4);
    EXPECT_EQ(missing.status, Status::Error);
    EXPECT_NE(missing.error.find("could not read image"), std::string::npos);
}

TEST(OmrDetectorTest, ReadsSheetFromFile) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "omr_detector_test_sheet.png";
    ASSERT_TRUE(cv::imwrite(path.string(), SyntheticSheet::fromLetters(kMarks).render()));

    EvaluationReport rep = OmrDetector().evaluateFile(path.string(), AnswerKey::fromString(kMarks), 4);
    std::remove(path.string().c_str());

    ASSERT_TRUE(rep.ok()) << rep.error;
    EXPECT_EQ(rep.score, 10);
    EXPECT_DOUBLE_EQ(rep.percentage, 100.0);
}

TEST(OmrDetectorTest, ConvenienceFunctionsUseGivenThreshold) {
    cv::Mat img = SyntheticSheet::fromLetters(kMarks).render();

    DetectionResult res = omr::detectOmrAnswers(img, 4, 40.0, true);
    ASSERT_TRUE(res.ok()) << res.error;
    EXPECT_TRUE(res.hasFillDetails);
    EXPECT_EQ(res.detectedAnswers, expectedAnswers(kMarks));

    // Rings alone reach the threshold, so every row has four marks.
    DetectionResult low = omr::detectOmrAnswers(img, 4, 1.0);
    ASSERT_TRUE(low.ok()) << low.error;
    for (const auto& [q, answer] : low.detectedAnswers) EXPECT_EQ(answer, "ambiguous");

    EvaluationReport rep = omr::evaluateOmr(img, AnswerKey::fromString(kMarks), 4, 40.0);
    ASSERT_TRUE(rep.ok()) << rep.error;
    EXPECT_EQ(rep.score, 10);

    EXPECT_EQ(omr::detectOmrAnswers(img, 4, 140.0).status, Status::Error);
}

TEST(OmrDetectorTest, RunExposesEveryStage) {
    omr::PipelineTrace trace = OmrDetector().run(SyntheticSheet::fromLetters(kMarks).render(), 4);
    EXPECT_EQ(trace.stage, omr::PipelineStage::Resolved);
    EXPECT_EQ(trace.candidates.size(), 40u);
    EXPECT_EQ(trace.rows.size(), 10u);
    EXPECT_EQ(trace.answers.totalQuestions, 10);
}

TEST(OmrDetectorTest, DebugOverlayMarksDecisions) {
    SyntheticSheet sheet = SyntheticSheet::fromLetters(kMarks);
    sheet.marks[2] = "CD";
    cv::Mat img = sheet.render();

    OmrDetector detector;
    cv::Mat vis = detector.renderDebugOverlay(img, 4);
    ASSERT_EQ(vis.size(), img.size());
    ASSERT_EQ(vis.type(), CV_8UC3);

    omr::PipelineTrace trace = detector.run(img, 4);
    ASSERT_EQ(trace.rows.size(), 10u);
    auto leftEdge = [&](const cv::Rect& r) {
        return vis.at<cv::Vec3b>(r.y + r.height / 2, r.x);
    };

    // Question 1 is marked B: green box.
    const cv::Rect& marked = trace.rows[0].bubbles[1].bounds;
    EXPECT_EQ(leftEdge(marked), cv::Vec3b(0, 255, 0));

    // Question 3 is ambiguous: its filled bubbles and the dots on the empty ones are red.
    const auto& ambiguous = trace.rows[2].bubbles;
    EXPECT_EQ(leftEdge(ambiguous[2].bounds), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(leftEdge(ambiguous[3].bounds), cv::Vec3b(0, 0, 255));
    cv::Point dot(cvRound(ambiguous[0].centroid.x), cvRound(ambiguous[0].centroid.y));
    EXPECT_EQ(vis.at<cv::Vec3b>(dot), cv::Vec3b(0, 0, 255));
}

TEST(OmrDetectorTest, DebugOverlayOfBadInputIsEmpty) {
    std::ostringstream out;
    auto logger = std::make_shared<omr::StreamLogger>(out, omr::LogLevel::ERROR);
    OmrDetector detector(DetectorConfig(), logger);

    cv::Mat vis;
    EXPECT_NO_THROW(vis = detector.renderDebugOverlay(cv::Mat(), 4));
    EXPECT_TRUE(vis.empty());
    EXPECT_NE(out.str().find("image is empty"), std::string::npos);

    EXPECT_NO_THROW(vis = detector.renderDebugOverlay(SyntheticSheet::fromLetters("A").render(), 27));
    EXPECT_TRUE(vis.empty());

    cv::Mat floatImage(50, 50, CV_32FC1, cv::Scalar(0.5f));
    EXPECT_NO_THROW(vis = detector.renderDebugOverlay(floatImage, 4));
    EXPECT_TRUE(vis.empty());
}

TEST(OmrDetectorTest, StatusAndStageNames) {
    EXPECT_EQ(omr::statusToString(Status::Success), "success");
    EXPECT_EQ(omr::statusToString(Status::Error), "error");
    EXPECT_EQ(omr::stageToString(omr::PipelineStage::CandidatesFound), "candidates_found");
    EXPECT_EQ(omr::stageToString(omr::PipelineStage::Evaluated), "evaluated");
}

TEST(OmrDetectorTest, ErrorNamesTheStageReached) {
    DetectionResult res = OmrDetector().detect(cv::Mat(), 4);
    ASSERT_EQ(res.status, Status::Error);
    EXPECT_NE(res.error.find("image is empty"), std::string::npos);
    EXPECT_NE(res.error.find("after stage 'loaded'"), std::string::npos);
}
