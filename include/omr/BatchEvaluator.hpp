#ifndef OMR_BATCH_EVALUATOR_HPP
#define OMR_BATCH_EVALUATOR_HPP

#include "omr/AnswerKey.hpp"
#include "omr/OmrDetector.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace omr {

struct BatchItem {
    std::string name;
    cv::Mat image;
};

struct BatchEntry {
    std::string name;
    EvaluationReport report;
};

struct BatchSummary {
    std::vector<BatchEntry> entries;   // same order as the input
    int succeeded = 0;
    int failed = 0;
    double averagePercentage = 0.0;    // over succeeded entries
};

// Scores many sheets against one key. Each sheet runs the full pipeline
// on its own worker; the detector and key are shared read-only.
class BatchEvaluator {
public:
    BatchEvaluator(const OmrDetector& detector, unsigned workers = 0);

    BatchSummary evaluate(const std::vector<BatchItem>& items,
                          const AnswerKey& answerKey,
                          int expectedOptions) const;

    // Images are decoded inside the workers; entry names are the paths.
    BatchSummary evaluateFiles(const std::vector<std::string>& paths,
                               const AnswerKey& answerKey,
                               int expectedOptions) const;

    unsigned getWorkers() const { return workers_; }

private:
    const OmrDetector& detector_;
    unsigned workers_;

    template <typename Job>
    void runParallel(std::vector<BatchEntry>& entries, Job job) const;

    static EvaluationReport failedReport(const std::string& message);

    static void summarize(BatchSummary& summary);
};

}

#endif
