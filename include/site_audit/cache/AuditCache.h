#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "../models/CrawlBudget.h"
#include "../models/Report.h"

namespace site_audit::cache {

struct CacheKey {
    std::string url;          // normalized target
    AuditProfile profile = AuditProfile::Full;

    std::string toString() const { return profileToString(profile) + "|" + url; }
};

// Process-wide report cache with per-entry TTL and single-flight computation:
// concurrent requests for the same key share one computation. Failed computations
// reach every waiter and leave nothing behind.
class AuditCache {
public:
    using TimeSource = std::function<std::chrono::steady_clock::time_point()>;
    using ComputeFn = std::function<Report()>;

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t coalesced = 0;      // callers that waited on someone else's computation
        uint64_t computations = 0;
        uint64_t failures = 0;
        size_t entries = 0;
        size_t inFlight = 0;
    };

    explicit AuditCache(TimeSource now = [] { return std::chrono::steady_clock::now(); });

    AuditCache(const AuditCache&) = delete;
    AuditCache& operator=(const AuditCache&) = delete;

    // Rethrows whatever compute throws, in the owner and in every coalesced waiter.
    // Report::fromCache is set for hits and coalesced waiters, cleared for the computing caller.
    Report getOrCompute(const CacheKey& key, std::chrono::seconds ttl, const ComputeFn& compute);

    // Fresh entry if present, marked fromCache; never computes
    std::optional<Report> peek(const CacheKey& key) const;

    Stats stats() const;

    // Drops expired entries, returns how many
    size_t purgeExpired();
    void clear();

private:
    struct Entry {
        Report report;
        std::chrono::steady_clock::time_point expiresAt;
    };

    // Called from a catch block: forwards the active exception to the waiters
    void abandon(const std::string& id, std::promise<Report>& promise);

    TimeSource now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, std::shared_future<Report>> inFlight_;
    Stats stats_;
};

} // namespace site_audit::cache
