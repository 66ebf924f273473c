#include "BatchProcessor.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

using namespace std;

namespace SymbolCutter {

BatchProcessor::BatchProcessor(const SymbolExtractor::ProcessingParams& params, size_t workerCount)
    : extractor_(params) {
    if (workerCount == 0) {
        workerCount = max(1u, thread::hardware_concurrency());
    }

    workers_.reserve(workerCount);
    for (size_t i = 0; i < workerCount; i++) {
        workers_.emplace_back(&BatchProcessor::workerLoop, this);
    }

    if (params.verboseOutput) {
        cout << "[INFO] Batch processor started with " << workerCount << " workers" << endl;
    }
}

BatchProcessor::~BatchProcessor() noexcept {
    shutdown();
}

void BatchProcessor::shutdown() noexcept {
    {
        lock_guard<recursive_mutex> callbackLock(callbackMutex_);
        lock_guard<mutex> lock(mutex_);
        if (!stopped_) {
            stopped_ = true;
            generation_++;
            currentBatch_.reset();
            queue_ = {};
        }
    }
    jobCond_.notify_all();
    doneCond_.notify_all();

    // Called from a completion callback: the workers exit once they see
    // stopped_ and are joined by a later shutdown() or the destructor.
    const thread::id self = this_thread::get_id();
    for (const auto& worker : workers_) {
        if (worker.get_id() == self) {
            return;
        }
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

BatchProcessor::Generation BatchProcessor::submit(vector<BatchItem> items, CompletionCallback onComplete) {
    auto batch = make_shared<Batch>();
    batch->results.resize(items.size());
    batch->remaining = items.size();
    batch->onComplete = move(onComplete);

    {
        lock_guard<recursive_mutex> callbackLock(callbackMutex_);
        {
            lock_guard<mutex> lock(mutex_);
            if (stopped_) {
                throw runtime_error("submit on stopped BatchProcessor");
            }

            // Queued jobs of the previous generation are dropped lazily by the workers
            batch->generation = ++generation_;
            currentBatch_ = batch;
            batch->done = items.empty();

            for (size_t i = 0; i < items.size(); i++) {
                queue_.push(Job{batch, i, move(items[i])});
            }
        }

        if (batch->done) {
            doneCond_.notify_all();
            if (batch->onComplete) {
                batch->onComplete(batch->generation, batch->results);
            }
            return batch->generation;
        }
    }

    jobCond_.notify_all();
    return batch->generation;
}

void BatchProcessor::cancel() {
    {
        lock_guard<recursive_mutex> callbackLock(callbackMutex_);
        lock_guard<mutex> lock(mutex_);
        generation_++;
        currentBatch_.reset();
    }
    doneCond_.notify_all();
}

optional<vector<ExtractionResult>> BatchProcessor::wait(Generation generation) {
    unique_lock<mutex> lock(mutex_);
    doneCond_.wait(lock, [&] {
        return stopped_ || generation_ != generation || (currentBatch_ && currentBatch_->done);
    });

    if (currentBatch_ && currentBatch_->generation == generation && currentBatch_->done) {
        return currentBatch_->results;
    }
    return nullopt;
}

BatchProcessor::Generation BatchProcessor::currentGeneration() const {
    lock_guard<mutex> lock(mutex_);
    return generation_;
}

optional<BatchProcessor::Job> BatchProcessor::pop() {
    unique_lock<mutex> lock(mutex_);
    while (true) {
        jobCond_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        if (stopped_) {
            return nullopt;
        }

        Job job = move(queue_.front());
        queue_.pop();
        if (job.batch->generation == generation_) {
            return job;
        }
        // Stale job: its buffers are released here without running the pipeline
    }
}

void BatchProcessor::workerLoop() {
    while (true) {
        optional<Job> job = pop();
        if (!job) {
            break;
        }

        ExtractionResult result;
        try {
            result = extractor_.extract(job->item.image, job->item.hints);
        } catch (const exception& e) {
            cerr << "[ERROR] Batch job " << job->index << " failed: " << e.what() << endl;
            result.image = job->item.image.clone();
            result.bbox = BoundingBox::fromSize(job->item.image.size());
            result.state = PipelineState::FallbackOriginal;
            result.fallbackUsed = true;
            result.diagnostic = e.what();
        }
        commit(*job, move(result));
    }
}

void BatchProcessor::commit(const Job& job, ExtractionResult result) {
    shared_ptr<Batch> completed;
    {
        lock_guard<mutex> lock(mutex_);
        if (job.batch->generation != generation_) {
            return;
        }

        job.batch->results[job.index] = move(result);
        if (--job.batch->remaining == 0) {
            job.batch->done = true;
            completed = job.batch;
        }
    }

    if (completed) {
        doneCond_.notify_all();
        deliver(completed);
    }
}

// The generation may have moved on between commit and delivery; a superseded
// batch is dropped here. Generation bumps wait on callbackMutex_, so the check
// stays valid for the duration of the callback.
void BatchProcessor::deliver(const shared_ptr<Batch>& batch) {
    if (!batch->onComplete) return;

    lock_guard<recursive_mutex> callbackLock(callbackMutex_);
    {
        lock_guard<mutex> lock(mutex_);
        if (batch->generation != generation_) {
            return;
        }
    }
    batch->onComplete(batch->generation, batch->results);
}

} // namespace SymbolCutter
