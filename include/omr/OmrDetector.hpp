#ifndef OMR_OMR_DETECTOR_HPP
#define OMR_OMR_DETECTOR_HPP

#include "omr/AnswerKey.hpp"
#include "omr/AnswerResolver.hpp"
#include "omr/BubbleDetector.hpp"
#include "omr/DetectorConfig.hpp"
#include "omr/Logger.hpp"
#include "omr/Preprocessor.hpp"
#include "omr/RowClusterer.hpp"
#include "omr/Types.hpp"

#include <opencv2/core.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace omr {

enum class Status {
    Success,
    Error
};

enum class PipelineStage {
    Loaded,
    Preprocessed,
    CandidatesFound,
    RowsClustered,
    Classified,
    Resolved,
    Evaluated
};

std::string statusToString(Status status);
std::string stageToString(PipelineStage stage);

struct DetectionResult {
    Status status = Status::Success;
    int totalQuestions = 0;
    std::map<int, std::string> detectedAnswers;   // letter, "unmarked" or "ambiguous"
    bool hasFillDetails = false;
    FillDetails fillDetails;
    std::string error;

    bool ok() const { return status == Status::Success; }
};

struct EvaluationReport {
    Status status = Status::Success;
    int totalQuestions = 0;
    std::map<int, std::string> detectedAnswers;
    bool hasFillDetails = false;
    FillDetails fillDetails;
    std::string error;

    int score = 0;
    int total = 0;
    double percentage = 0.0;
    std::vector<int> correct;
    std::vector<int> wrong;
    std::vector<int> unmarked;

    bool ok() const { return status == Status::Success; }
};

// Everything a single detection run produced, for callers that want the
// intermediate stages (debug drawing, tests).
struct PipelineTrace {
    BinaryMask mask;
    std::vector<BubbleCandidate> candidates;
    std::vector<Row> rows;
    ResolvedAnswers answers;
    PipelineStage stage = PipelineStage::Loaded;
};

// Reusable, immutable detector. All methods are const and may be called
// from several threads at once.
class OmrDetector {
public:
    explicit OmrDetector(const DetectorConfig& config = DetectorConfig(),
                         std::shared_ptr<Logger> logger = nullptr);

    DetectionResult detect(const cv::Mat& image, int expectedOptions) const;
    DetectionResult detectFile(const std::string& path, int expectedOptions) const;

    EvaluationReport evaluate(const cv::Mat& image, const AnswerKey& answerKey, int expectedOptions) const;
    EvaluationReport evaluateFile(const std::string& path, const AnswerKey& answerKey, int expectedOptions) const;

    // Throws ImageLoadError / ConfigError; no status wrapping.
    PipelineTrace run(const cv::Mat& image, int expectedOptions) const;

    // BGR copy of the image with candidates, rows and decisions drawn on it:
    // marked bubbles green, ambiguous rows red. Returns an empty Mat (and
    // logs the error) when the image cannot be processed.
    cv::Mat renderDebugOverlay(const cv::Mat& image, int expectedOptions) const;

    const DetectorConfig& getConfig() const { return config_; }

    static cv::Mat loadImage(const std::string& path);

private:
    DetectorConfig config_;
    std::shared_ptr<Logger> logger_;
    Preprocessor preprocessor_;
    BubbleDetector bubbleDetector_;
    RowClusterer rowClusterer_;
    AnswerResolver resolver_;

    void execute(const cv::Mat& image, int expectedOptions, PipelineTrace& trace) const;
    cv::Mat drawOverlay(const cv::Mat& image, const PipelineTrace& trace) const;
    void advance(PipelineTrace& trace, PipelineStage next, const std::string& detail) const;
    DetectionResult failure(const std::string& message) const;
    DetectionResult failure(const std::string& message, PipelineStage reached) const;
};

DetectionResult detectOmrAnswers(const cv::Mat& image,
                                 int expectedOptions = 4,
                                 double fillThreshold = 40.0,
                                 bool debug = false);

EvaluationReport evaluateOmr(const cv::Mat& image,
                             const AnswerKey& answerKey,
                             int expectedOptions = 4,
                             double fillThreshold = 40.0,
                             bool debug = false);

}

#endif
