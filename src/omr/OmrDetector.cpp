#include "omr/OmrDetector.hpp"
#include "omr/Errors.hpp"
#include "omr/Evaluator.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <sstream>

namespace omr {

namespace {

const char* const kModule = "DETECTOR";

const DetectorConfig& validated(const DetectorConfig& config) {
    config.validate();
    return config;
}

void checkExpectedOptions(int expectedOptions) {
    if (expectedOptions < 1 || expectedOptions > 26) {
        throw ConfigError("expected_options must be within [1, 26], got " + std::to_string(expectedOptions));
    }
}

void copyDetection(const DetectionResult& d, EvaluationReport& r) {
    r.status = d.status;
    r.totalQuestions = d.totalQuestions;
    r.detectedAnswers = d.detectedAnswers;
    r.hasFillDetails = d.hasFillDetails;
    r.fillDetails = d.fillDetails;
    r.error = d.error;
}

}

std::string statusToString(Status status) {
    return status == Status::Success ? "success" : "error";
}

std::string stageToString(PipelineStage stage) {
    switch (stage) {
    case PipelineStage::Loaded:          return "loaded";
    case PipelineStage::Preprocessed:    return "preprocessed";
    case PipelineStage::CandidatesFound: return "candidates_found";
    case PipelineStage::RowsClustered:   return "rows_clustered";
    case PipelineStage::Classified:      return "classified";
    case PipelineStage::Resolved:        return "resolved";
    case PipelineStage::Evaluated:       return "evaluated";
    }
    return "unknown";
}

OmrDetector::OmrDetector(const DetectorConfig& config, std::shared_ptr<Logger> logger)
    : config_(validated(config)),
      logger_(logger ? std::move(logger) : std::make_shared<NullLogger>()),
      preprocessor_(config_),
      bubbleDetector_(config_.bubbleAreaRange, config_.aspectRatioRange),
      rowClusterer_(config_.rowThreshold, logger_.get()),
      resolver_(config_.fillThreshold)
{
    logger_->debug(kModule, "detector ready: " + config_.describe());
}

cv::Mat OmrDetector::loadImage(const std::string& path) {
    cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
    if (img.empty()) {
        throw ImageLoadError("could not read image '" + path + "'");
    }
    return img;
}

void OmrDetector::advance(PipelineTrace& trace, PipelineStage next, const std::string& detail) const {
    trace.stage = next;
    if (logger_->enabled(LogLevel::DEBUG)) {
        logger_->debug(kModule, stageToString(next) + ": " + detail);
    }
}

PipelineTrace OmrDetector::run(const cv::Mat& image, int expectedOptions) const {
    PipelineTrace trace;
    execute(image, expectedOptions, trace);
    return trace;
}

void OmrDetector::execute(const cv::Mat& image, int expectedOptions, PipelineTrace& trace) const {
    trace.stage = PipelineStage::Loaded;
    checkExpectedOptions(expectedOptions);

    trace.mask = preprocessor_.preprocess(image);
    advance(trace, PipelineStage::Preprocessed,
            std::to_string(trace.mask.cols) + "x" + std::to_string(trace.mask.rows) + " mask");

    trace.candidates = bubbleDetector_.findCandidates(trace.mask);
    advance(trace, PipelineStage::CandidatesFound, std::to_string(trace.candidates.size()) + " candidates");

    trace.rows = rowClusterer_.clusterRows(trace.candidates, expectedOptions);
    advance(trace, PipelineStage::RowsClustered, std::to_string(trace.rows.size()) + " rows");

    trace.answers = resolver_.resolve(trace.rows, trace.mask, config_.debug);
    advance(trace, PipelineStage::Classified, std::to_string(trace.answers.questions.size()) + " questions classified");
    advance(trace, PipelineStage::Resolved, std::to_string(trace.answers.totalQuestions) + " questions");

    if (trace.answers.totalQuestions == 0) {
        logger_->warning(kModule, "no bubble rows with " + std::to_string(expectedOptions) + " options found");
    }
}

DetectionResult OmrDetector::failure(const std::string& message) const {
    logger_->error(kModule, message);
    DetectionResult res;
    res.status = Status::Error;
    res.error = message;
    return res;
}

DetectionResult OmrDetector::failure(const std::string& message, PipelineStage reached) const {
    return failure(message + " (after stage '" + stageToString(reached) + "')");
}

DetectionResult OmrDetector::detect(const cv::Mat& image, int expectedOptions) const {
    PipelineTrace trace;
    try {
        execute(image, expectedOptions, trace);

        DetectionResult res;
        res.status = Status::Success;
        res.totalQuestions = trace.answers.totalQuestions;
        res.detectedAnswers = trace.answers.answerMap();
        res.hasFillDetails = trace.answers.hasFillDetails;
        res.fillDetails = std::move(trace.answers.fillDetails);

        logger_->info(kModule, "detected " + std::to_string(res.totalQuestions) + " questions");
        return res;
    } catch (const OmrError& e) {
        return failure(e.what(), trace.stage);
    } catch (const cv::Exception& e) {
        return failure(std::string("image processing failed: ") + e.what(), trace.stage);
    }
}

DetectionResult OmrDetector::detectFile(const std::string& path, int expectedOptions) const {
    cv::Mat image;
    try {
        image = loadImage(path);
    } catch (const ImageLoadError& e) {
        return failure(e.what());
    }
    return detect(image, expectedOptions);
}

EvaluationReport OmrDetector::evaluate(const cv::Mat& image, const AnswerKey& answerKey, int expectedOptions) const {
    EvaluationReport report;

    if (answerKey.empty()) {
        EmptyAnswerKeyError e;
        copyDetection(failure(e.what()), report);
        return report;
    }

    copyDetection(detect(image, expectedOptions), report);
    if (!report.ok()) return report;

    try {
        Evaluator evaluator(answerKey);
        EvaluationResult ev = evaluator.evaluate(report.detectedAnswers);
        report.score = ev.score;
        report.total = ev.total;
        report.percentage = ev.percentage;
        report.correct = std::move(ev.correct);
        report.wrong = std::move(ev.wrong);
        report.unmarked = std::move(ev.unmarked);
    } catch (const OmrError& e) {
        copyDetection(failure(e.what()), report);
        return report;
    }

    if (logger_->enabled(LogLevel::INFO)) {
        std::ostringstream oss;
        oss << stageToString(PipelineStage::Evaluated) << ": " << report.score << "/" << report.total
            << " (" << report.percentage << "%)";
        logger_->info(kModule, oss.str());
    }
    return report;
}

EvaluationReport OmrDetector::evaluateFile(const std::string& path, const AnswerKey& answerKey, int expectedOptions) const {
    cv::Mat image;
    try {
        image = loadImage(path);
    } catch (const ImageLoadError& e) {
        EvaluationReport report;
        copyDetection(failure(e.what()), report);
        return report;
    }
    return evaluate(image, answerKey, expectedOptions);
}

cv::Mat OmrDetector::renderDebugOverlay(const cv::Mat& image, int expectedOptions) const {
    PipelineTrace trace;
    try {
        execute(image, expectedOptions, trace);
        return drawOverlay(image, trace);
    } catch (const OmrError& e) {
        logger_->error(kModule, std::string("debug overlay: ") + e.what()
                                + " (after stage '" + stageToString(trace.stage) + "')");
    } catch (const cv::Exception& e) {
        logger_->error(kModule, std::string("debug overlay failed: ") + e.what());
    }
    return cv::Mat();
}

cv::Mat OmrDetector::drawOverlay(const cv::Mat& image, const PipelineTrace& trace) const {
    cv::Mat vis;
    cv::Mat gray = Preprocessor::toGray(image);
    cv::cvtColor(gray, vis, cv::COLOR_GRAY2BGR);

    for (const auto& c : trace.candidates) {
        cv::rectangle(vis, c.bounds, cv::Scalar(100, 100, 100), 1);
    }

    for (const auto& row : trace.rows) {
        const QuestionResult& qr = trace.answers.questions.at(row.questionNumber);
        const cv::Scalar rowColor = qr.state == AnswerState::Ambiguous ? cv::Scalar(0, 0, 255)
                                                                        : cv::Scalar(255, 160, 0);

        const cv::Rect& first = row.bubbles.front().bounds;
        cv::putText(vis, std::to_string(row.questionNumber),
                    cv::Point(std::max(0, first.x - 30), first.y + first.height / 2 + 5),
                    cv::FONT_HERSHEY_SIMPLEX, 0.45, rowColor, 1);

        for (size_t i = 0; i < row.bubbles.size(); ++i) {
            const auto& b = row.bubbles[i];
            double ratio = qr.fillRatios.at(optionLetter(static_cast<int>(i)));

            if (ratio >= config_.fillThreshold) {
                cv::Scalar color = qr.state == AnswerState::Marked ? cv::Scalar(0, 255, 0) : rowColor;
                cv::rectangle(vis, b.bounds, color, 2);
                cv::putText(vis, std::to_string(static_cast<int>(ratio)),
                            cv::Point(b.bounds.x, b.bounds.y - 3),
                            cv::FONT_HERSHEY_SIMPLEX, 0.35, color, 1);
            } else {
                cv::circle(vis, cv::Point(cvRound(b.centroid.x), cvRound(b.centroid.y)), 2, rowColor, cv::FILLED);
            }
        }
    }
    return vis;
}

DetectionResult detectOmrAnswers(const cv::Mat& image, int expectedOptions, double fillThreshold, bool debug) {
    DetectorConfig config;
    config.fillThreshold = fillThreshold;
    config.debug = debug;
    try {
        return OmrDetector(config).detect(image, expectedOptions);
    } catch (const ConfigError& e) {
        DetectionResult res;
        res.status = Status::Error;
        res.error = e.what();
        return res;
    }
}

EvaluationReport evaluateOmr(const cv::Mat& image, const AnswerKey& answerKey,
                             int expectedOptions, double fillThreshold, bool debug) {
    DetectorConfig config;
    config.fillThreshold = fillThreshold;
    config.debug = debug;
    try {
        return OmrDetector(config).evaluate(image, answerKey, expectedOptions);
    } catch (const ConfigError& e) {
        EvaluationReport report;
        report.status = Status::Error;
        report.error = e.what();
        return report;
    }
}

}
