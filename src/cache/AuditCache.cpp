#include "../../include/site_audit/cache/AuditCache.h"
#include "../../include/Logger.h"
#include <stdexcept>

namespace site_audit::cache {

AuditCache::AuditCache(TimeSource now)
    : now_(std::move(now)) {
    if (!now_) {
        throw std::invalid_argument("AuditCache requires a time source");
    }
}

Report AuditCache::getOrCompute(const CacheKey& key, std::chrono::seconds ttl, const ComputeFn& compute) {
    const std::string id = key.toString();
    std::promise<Report> promise;
    std::shared_future<Report> pending;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = entries_.find(id);
        if (entry != entries_.end()) {
            if (now_() < entry->second.expiresAt) {
                ++stats_.hits;
                LOG_DEBUG("Audit cache hit: " + id);
                Report cached = entry->second.report;
                cached.fromCache = true;
                return cached;
            }
            LOG_DEBUG("Audit cache entry expired: " + id);
            entries_.erase(entry);
        }

        auto running = inFlight_.find(id);
        if (running != inFlight_.end()) {
            ++stats_.coalesced;
            pending = running->second;
        } else {
            ++stats_.misses;
            ++stats_.computations;
            owner = true;
            pending = promise.get_future().share();
            inFlight_.emplace(id, pending);
        }
    }

    if (!owner) {
        LOG_DEBUG("Waiting for in-flight audit: " + id);
        Report shared = pending.get();
        shared.fromCache = true;
        return shared;
    }

    LOG_INFO("Audit cache miss, computing: " + id);
    try {
        Report report = compute();
        report.fromCache = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_[id] = Entry{report, now_() + ttl};
            inFlight_.erase(id);
        }
        promise.set_value(report);
        return report;
    } catch (const std::exception& e) {
        LOG_WARNING("Audit computation failed for " + id + ": " + e.what());
        abandon(id, promise);
        throw;
    } catch (...) {
        LOG_WARNING("Audit computation failed for " + id + " with a non-standard exception");
        abandon(id, promise);
        throw;
    }
}

void AuditCache::abandon(const std::string& id, std::promise<Report>& promise) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failures;
        inFlight_.erase(id);
    }
    promise.set_exception(std::current_exception());
}

std::optional<Report> AuditCache::peek(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = entries_.find(key.toString());
    if (entry == entries_.end() || now_() >= entry->second.expiresAt) {
        return std::nullopt;
    }
    Report cached = entry->second.report;
    cached.fromCache = true;
    return cached;
}

AuditCache::Stats AuditCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats snapshot = stats_;
    snapshot.entries = entries_.size();
    snapshot.inFlight = inFlight_.size();
    return snapshot;
}

size_t AuditCache::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expiresAt) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void AuditCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    LOG_INFO("Audit cache cleared");
}

} // namespace site_audit::cache
