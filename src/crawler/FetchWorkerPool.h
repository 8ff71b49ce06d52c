#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "../extraction/SignalExtractor.h"
#include "../../include/site_audit/crawler/FetchPort.h"
#include "../../include/site_audit/models/CrawlBudget.h"
#include "../../include/site_audit/models/PageSignals.h"

namespace site_audit::crawler {

struct FetchTask {
    size_t slot = 0;          // position inside the batch
    std::string url;
    std::chrono::milliseconds timeout{0};
};

struct FetchCompletion {
    uint64_t batch = 0;
    size_t slot = 0;
    FetchResult fetch;
    std::optional<PageSignals> signals;   // set for successful HTML responses
};

// Fixed set of threads running fetch + extraction. Tasks go in per batch; the
// coordinator collects completions for that batch from a blocking queue.
// Completions that arrive after their batch was abandoned are dropped.
class FetchWorkerPool {
public:
    FetchWorkerPool(FetchPort& fetcher,
                    const extraction::SignalExtractor& extractor,
                    size_t workerCount = kCrawlWorkerCount);
    ~FetchWorkerPool();

    FetchWorkerPool(const FetchWorkerPool&) = delete;
    FetchWorkerPool& operator=(const FetchWorkerPool&) = delete;

    // Returns the batch id used to collect the results
    uint64_t submitBatch(std::vector<FetchTask> tasks);

    // Blocks until every task of the batch completed or the deadline passed.
    // Missing slots are the caller's to account for.
    std::vector<FetchCompletion> awaitBatch(uint64_t batch,
                                            size_t expected,
                                            std::chrono::steady_clock::time_point deadline);

    // Drops queued tasks that no worker has started yet
    void cancelPending();

    size_t workerCount() const { return workers_.size(); }

private:
    struct QueuedTask {
        uint64_t batch = 0;
        FetchTask task;
    };

    void startWorkers(size_t count);
    void stopWorkers();
    void workerLoop();
    FetchCompletion runTask(const QueuedTask& queued);

    FetchPort& fetcher_;
    const extraction::SignalExtractor& extractor_;

    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};

    std::mutex taskMutex_;
    std::condition_variable taskCv_;
    std::deque<QueuedTask> tasks_;

    std::mutex completionMutex_;
    std::condition_variable completionCv_;
    std::vector<FetchCompletion> completions_;

    uint64_t currentBatch_ = 0;   // coordinator thread only
};

} // namespace site_audit::crawler
