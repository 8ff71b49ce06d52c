#include <catch2/catch_test_macros.hpp>
#include "../../include/site_audit/cache/AuditCache.h"
#include "../../include/site_audit/common/Errors.h"
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace site_audit;
using namespace site_audit::cache;

namespace {

using Clock = std::chrono::steady_clock;

// Manually advanced clock shared with the cache
struct ManualClock {
    std::shared_ptr<Clock::time_point> current = std::make_shared<Clock::time_point>(Clock::now());

    AuditCache::TimeSource source() const {
        auto shared = current;
        return [shared] { return *shared; };
    }

    void advance(std::chrono::seconds by) { *current += by; }
};

Report reportFor(const std::string& url, size_t totalFindings = 0) {
    Report report;
    report.targetUrl = url;
    report.totalFindings = totalFindings;
    return report;
}

const CacheKey kKey{"https://example.com/", AuditProfile::Full};
const std::chrono::seconds kTtl{900};

} // namespace

TEST_CASE("AuditCache computes once and serves hits", "[AuditCache]") {
    AuditCache cache;
    int computations = 0;
    auto compute = [&] {
        ++computations;
        return reportFor(kKey.url, 7);
    };

    Report first = cache.getOrCompute(kKey, kTtl, compute);
    Report second = cache.getOrCompute(kKey, kTtl, compute);

    REQUIRE(computations == 1);
    REQUIRE(first.totalFindings == 7);
    REQUIRE(second.totalFindings == 7);

    auto stats = cache.stats();
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.computations == 1);
    REQUIRE(stats.entries == 1);
    REQUIRE(stats.inFlight == 0);
}

TEST_CASE("AuditCache tells cached reports from fresh ones", "[AuditCache]") {
    AuditCache cache;
    auto compute = [] {
        Report report = reportFor(kKey.url, 3);
        report.fromCache = true;   // whatever compute says, the caller computed it
        return report;
    };

    REQUIRE_FALSE(cache.getOrCompute(kKey, kTtl, compute).fromCache);
    REQUIRE(cache.getOrCompute(kKey, kTtl, compute).fromCache);

    auto peeked = cache.peek(kKey);
    REQUIRE(peeked.has_value());
    REQUIRE(peeked->fromCache);

    cache.clear();
    REQUIRE_FALSE(cache.getOrCompute(kKey, kTtl, compute).fromCache);
}

TEST_CASE("AuditCache keys on target and profile", "[AuditCache]") {
    AuditCache cache;
    int computations = 0;
    auto compute = [&] {
        ++computations;
        return reportFor("x");
    };

    cache.getOrCompute(kKey, kTtl, compute);
    cache.getOrCompute(CacheKey{kKey.url, AuditProfile::Summary}, kTtl, compute);
    cache.getOrCompute(CacheKey{"https://other.example.org/", AuditProfile::Full}, kTtl, compute);

    REQUIRE(computations == 3);
    REQUIRE(cache.stats().entries == 3);
    REQUIRE(kKey.toString() == "full|https://example.com/");
}

TEST_CASE("AuditCache expires entries after their TTL", "[AuditCache]") {
    ManualClock clock;
    AuditCache cache(clock.source());
    int computations = 0;
    auto compute = [&] {
        ++computations;
        return reportFor(kKey.url, static_cast<size_t>(computations));
    };

    cache.getOrCompute(kKey, std::chrono::seconds(600), compute);
    clock.advance(std::chrono::seconds(599));
    REQUIRE(cache.peek(kKey).has_value());
    REQUIRE(cache.getOrCompute(kKey, std::chrono::seconds(600), compute).totalFindings == 1);

    clock.advance(std::chrono::seconds(1));
    REQUIRE_FALSE(cache.peek(kKey).has_value());
    REQUIRE(cache.getOrCompute(kKey, std::chrono::seconds(600), compute).totalFindings == 2);
    REQUIRE(computations == 2);
}

TEST_CASE("AuditCache purges expired entries", "[AuditCache]") {
    ManualClock clock;
    AuditCache cache(clock.source());

    cache.getOrCompute(kKey, std::chrono::seconds(60), [] { return reportFor("a"); });
    cache.getOrCompute(CacheKey{kKey.url, AuditProfile::Summary}, std::chrono::seconds(600),
                       [] { return reportFor("b"); });

    clock.advance(std::chrono::seconds(120));
    REQUIRE(cache.purgeExpired() == 1);
    REQUIRE(cache.stats().entries == 1);

    cache.clear();
    REQUIRE(cache.stats().entries == 0);
}

TEST_CASE("AuditCache coalesces concurrent requests", "[AuditCache]") {
    AuditCache cache;
    std::atomic<int> computations{0};
    std::atomic<bool> release{false};

    auto compute = [&] {
        ++computations;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return reportFor(kKey.url, 42);
    };

    constexpr int kCallers = 6;
    std::vector<std::thread> callers;
    std::vector<size_t> results(kCallers, 0);
    std::vector<int> served(kCallers, 0);
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&, i] {
            Report report = cache.getOrCompute(kKey, kTtl, compute);
            results[i] = report.totalFindings;
            served[i] = report.fromCache ? 1 : 0;
        });
    }

    // Wait until every caller has either started the computation or joined it
    for (int attempt = 0; attempt < 400; ++attempt) {
        auto stats = cache.stats();
        if (stats.misses + stats.coalesced == kCallers) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(cache.stats().inFlight == 1);
    release = true;
    for (auto& caller : callers) caller.join();

    REQUIRE(computations == 1);
    for (size_t value : results) {
        REQUIRE(value == 42);
    }
    // Only the computing caller sees a fresh report
    REQUIRE(std::count(served.begin(), served.end(), 1) == kCallers - 1);
    auto stats = cache.stats();
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.coalesced == kCallers - 1);
    REQUIRE(stats.inFlight == 0);
}

TEST_CASE("AuditCache does not keep failures", "[AuditCache]") {
    AuditCache cache;

    SECTION("Failure reaches the caller and the next call recomputes") {
        REQUIRE_THROWS_AS(cache.getOrCompute(kKey, kTtl, []() -> Report {
            throw SeedUnreachableError(kKey.url, "Couldn't resolve host name");
        }), SeedUnreachableError);

        auto stats = cache.stats();
        REQUIRE(stats.failures == 1);
        REQUIRE(stats.entries == 0);
        REQUIRE(stats.inFlight == 0);

        REQUIRE(cache.getOrCompute(kKey, kTtl, [] { return reportFor(kKey.url, 3); }).totalFindings == 3);
    }

    SECTION("Every waiter sees the failure") {
        std::atomic<bool> release{false};
        auto failing = [&]() -> Report {
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            throw AuditError("crawl exploded");
        };

        constexpr int kCallers = 4;
        std::atomic<int> failures{0};
        std::vector<std::thread> callers;
        for (int i = 0; i < kCallers; ++i) {
            callers.emplace_back([&] {
                try {
                    cache.getOrCompute(kKey, kTtl, failing);
                } catch (const AuditError&) {
                    ++failures;
                }
            });
        }

        for (int attempt = 0; attempt < 400; ++attempt) {
            auto stats = cache.stats();
            if (stats.misses + stats.coalesced == kCallers) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        release = true;
        for (auto& caller : callers) caller.join();

        REQUIRE(failures == kCallers);
        REQUIRE(cache.stats().entries == 0);
        REQUIRE_FALSE(cache.peek(kKey).has_value());
    }
}
