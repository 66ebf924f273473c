#pragma once

#include "SymbolExtractor.hpp"
#include "SymbolTypes.hpp"
#include <opencv2/core.hpp>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace SymbolCutter {

/**
 * Isolates a set of symbols on a fixed pool of worker threads.
 *
 * Every submit() starts a new generation and supersedes the previous one.
 * Jobs of a superseded generation are dropped when dequeued, and results of
 * jobs that were already running are discarded, so only the latest request
 * ever reaches its completion callback.
 *
 * Completion callbacks are serialized with generation changes: while one runs,
 * submit(), cancel() and shutdown() from other threads wait for it. A callback
 * may call submit(), cancel() or shutdown() itself but must not destroy the
 * processor.
 */
class BatchProcessor {
public:
    using Generation = uint64_t;
    using CompletionCallback = std::function<void(Generation, const std::vector<ExtractionResult>&)>;

    struct BatchItem {
        cv::Mat image;              // RGBA, owned by the job once submitted
        ProcessingHints hints;
    };

    /**
     * @param params Pipeline parameters shared by all jobs; InvalidConfig if out of range.
     * @param workerCount Number of worker threads, 0 = one per hardware thread.
     */
    explicit BatchProcessor(const SymbolExtractor::ProcessingParams& params = SymbolExtractor::ProcessingParams(),
                            std::size_t workerCount = 0);
    ~BatchProcessor() noexcept;

    BatchProcessor(const BatchProcessor&) = delete;
    BatchProcessor& operator=(const BatchProcessor&) = delete;
    BatchProcessor(BatchProcessor&&) = delete;
    BatchProcessor& operator=(BatchProcessor&&) = delete;

    /**
     * Queues one job per item under a new generation.
     * @param onComplete Invoked once, on a worker thread (or the caller's thread
     *        for an empty batch), with results in submission order.
     * @return The generation token of this batch.
     * @throws std::runtime_error if the processor has been shut down.
     */
    Generation submit(std::vector<BatchItem> items, CompletionCallback onComplete = nullptr);

    // Supersedes the current batch without starting a new one.
    void cancel();

    // Blocks until the generation completes (returns its results) or is superseded (returns nullopt).
    std::optional<std::vector<ExtractionResult>> wait(Generation generation);

    Generation currentGeneration() const;
    std::size_t workerCount() const { return workers_.size(); }

    void shutdown() noexcept;

private:
    struct Batch {
        Generation generation = 0;
        std::vector<ExtractionResult> results;
        std::size_t remaining = 0;
        bool done = false;
        CompletionCallback onComplete;
    };

    struct Job {
        std::shared_ptr<Batch> batch;
        std::size_t index = 0;
        BatchItem item;
    };

    void workerLoop();
    std::optional<Job> pop();
    void commit(const Job& job, ExtractionResult result);
    void deliver(const std::shared_ptr<Batch>& batch);

    SymbolExtractor extractor_;

    // Held while bumping the generation and while delivering a completion
    std::recursive_mutex callbackMutex_;
    mutable std::mutex mutex_;
    std::condition_variable jobCond_;
    std::condition_variable doneCond_;
    std::queue<Job> queue_;
    std::shared_ptr<Batch> currentBatch_;
    Generation generation_ = 0;
    bool stopped_ = false;

    std::vector<std::thread> workers_;
};

} // namespace SymbolCutter
