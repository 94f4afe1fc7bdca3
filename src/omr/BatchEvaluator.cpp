#include "omr/BatchEvaluator.hpp"
#include "omr/Evaluator.hpp"

#include <algorithm>
#include <atomic>
#include <new>
#include <system_error>
#include <thread>

namespace omr {

BatchEvaluator::BatchEvaluator(const OmrDetector& detector, unsigned workers)
    : detector_(detector),
      workers_(workers > 0 ? workers : std::max(1u, std::thread::hardware_concurrency()))
{
}

EvaluationReport BatchEvaluator::failedReport(const std::string& message) {
    EvaluationReport report;
    report.status = Status::Error;
    report.error = message;
    return report;
}

template <typename Job>
void BatchEvaluator::runParallel(std::vector<BatchEntry>& entries, Job job) const {
    const size_t count = entries.size();
    std::atomic<size_t> next{0};

    // Exceptions must not leave a worker thread; each one becomes the
    // entry's error.
    auto worker = [&]() {
        for (size_t i = next++; i < count; i = next++) {
            try {
                entries[i].report = job(i);
            } catch (const std::exception& e) {
                entries[i].report = failedReport(std::string("sheet could not be evaluated: ") + e.what());
            }
        }
    };

    size_t n = std::min<size_t>(workers_, count);
    if (n <= 1) {
        worker();
        return;
    }

    std::vector<std::thread> threads;
    bool shortOfThreads = false;
    try {
        threads.reserve(n);
        for (size_t t = 0; t < n; ++t) threads.emplace_back(worker);
    } catch (const std::system_error&) {
        shortOfThreads = true;
    } catch (const std::bad_alloc&) {
        shortOfThreads = true;
    }

    // Whatever the started threads do not pick up runs here.
    if (shortOfThreads) worker();
    for (auto& t : threads) t.join();
}

void BatchEvaluator::summarize(BatchSummary& summary) {
    double sum = 0.0;
    for (const auto& e : summary.entries) {
        if (e.report.ok()) {
            summary.succeeded++;
            sum += e.report.percentage;
        } else {
            summary.failed++;
        }
    }
    if (summary.succeeded > 0) {
        summary.averagePercentage = Evaluator::roundPercent(sum / summary.succeeded);
    }
}

BatchSummary BatchEvaluator::evaluate(const std::vector<BatchItem>& items,
                                      const AnswerKey& answerKey,
                                      int expectedOptions) const
{
    BatchSummary summary;
    summary.entries.resize(items.size());

    for (size_t i = 0; i < items.size(); ++i) summary.entries[i].name = items[i].name;

    // Each worker writes only its own slot.
    runParallel(summary.entries, [&](size_t i) {
        return detector_.evaluate(items[i].image, answerKey, expectedOptions);
    });

    summarize(summary);
    return summary;
}

BatchSummary BatchEvaluator::evaluateFiles(const std::vector<std::string>& paths,
                                           const AnswerKey& answerKey,
                                           int expectedOptions) const
{
    BatchSummary summary;
    summary.entries.resize(paths.size());

    for (size_t i = 0; i < paths.size(); ++i) summary.entries[i].name = paths[i];

    runParallel(summary.entries, [&](size_t i) {
        return detector_.evaluateFile(paths[i], answerKey, expectedOptions);
    });

    summarize(summary);
    return summary;
}

}
