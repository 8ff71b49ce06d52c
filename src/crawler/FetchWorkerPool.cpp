#include "FetchWorkerPool.h"
#include "ScopeFilter.h"
#include "../../include/Logger.h"
#include <algorithm>

namespace site_audit::crawler {

FetchWorkerPool::FetchWorkerPool(FetchPort& fetcher,
                                 const extraction::SignalExtractor& extractor,
                                 size_t workerCount)
    : fetcher_(fetcher)
    , extractor_(extractor) {
    startWorkers(std::max<size_t>(1, workerCount));
}

FetchWorkerPool::~FetchWorkerPool() {
    stopWorkers();
}

void FetchWorkerPool::startWorkers(size_t count) {
    running_ = true;
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&FetchWorkerPool::workerLoop, this);
    }
    LOG_DEBUG("Started " + std::to_string(count) + " fetch workers");
}

void FetchWorkerPool::stopWorkers() {
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        running_ = false;
        tasks_.clear();
    }
    taskCv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    LOG_DEBUG("Stopped fetch workers");
}

uint64_t FetchWorkerPool::submitBatch(std::vector<FetchTask> tasks) {
    const uint64_t batch = ++currentBatch_;
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        for (auto& task : tasks) {
            tasks_.push_back(QueuedTask{batch, std::move(task)});
        }
    }
    taskCv_.notify_all();
    return batch;
}

std::vector<FetchCompletion> FetchWorkerPool::awaitBatch(uint64_t batch,
                                                         size_t expected,
                                                         std::chrono::steady_clock::time_point deadline) {
    std::vector<FetchCompletion> received;
    std::unique_lock<std::mutex> lock(completionMutex_);

    while (true) {
        // Anything from an older batch is stale by now
        for (auto& completion : completions_) {
            if (completion.batch == batch) {
                received.push_back(std::move(completion));
            }
        }
        completions_.clear();

        if (received.size() >= expected) {
            break;
        }
        if (completionCv_.wait_until(lock, deadline) == std::cv_status::timeout && completions_.empty()) {
            LOG_WARNING("Fetch batch " + std::to_string(batch) + " hit its deadline with " +
                        std::to_string(expected - received.size()) + " pages outstanding");
            break;
        }
    }

    return received;
}

void FetchWorkerPool::cancelPending() {
    std::lock_guard<std::mutex> lock(taskMutex_);
    if (!tasks_.empty()) {
        LOG_DEBUG("Cancelling " + std::to_string(tasks_.size()) + " queued fetches");
    }
    tasks_.clear();
}

void FetchWorkerPool::workerLoop() {
    while (true) {
        QueuedTask queued;
        {
            std::unique_lock<std::mutex> lock(taskMutex_);
            taskCv_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
            if (!running_) {
                return;
            }
            queued = std::move(tasks_.front());
            tasks_.pop_front();
        }

        FetchCompletion completion = runTask(queued);
        {
            std::lock_guard<std::mutex> lock(completionMutex_);
            completions_.push_back(std::move(completion));
        }
        completionCv_.notify_all();
    }
}

FetchCompletion FetchWorkerPool::runTask(const QueuedTask& queued) {
    FetchCompletion completion;
    completion.batch = queued.batch;
    completion.slot = queued.task.slot;

    try {
        completion.fetch = fetcher_.fetch(queued.task.url, queued.task.timeout);
    } catch (const std::exception& e) {
        // A misbehaving port must not take the worker down with it
        completion.fetch.errorKind = FetchErrorKind::Network;
        completion.fetch.errorMessage = std::string("fetch threw: ") + e.what();
        LOG_ERROR("Fetch port threw for " + queued.task.url + ": " + e.what());
    }

    if (completion.fetch.finalUrl.empty()) {
        completion.fetch.finalUrl = queued.task.url;
    }

    if (completion.fetch.success && ScopeFilter::isHtmlContentType(completion.fetch.contentType)) {
        completion.signals = extractor_.extract(completion.fetch.html, completion.fetch.finalUrl);
    }
    // Keep only what the coordinator needs
    completion.fetch.html.clear();
    completion.fetch.html.shrink_to_fit();

    return completion;
}

} // namespace site_audit::crawler
