#pragma once

#include <chrono>
#include <set>
#include <string>
#include <unordered_map>
#include "../extraction/SignalExtractor.h"
#include "../../include/site_audit/crawler/FetchPort.h"
#include "../../include/site_audit/models/CrawlBudget.h"
#include "../../include/site_audit/models/CrawlResult.h"

namespace site_audit::crawler {

class RobotsGate;

// Bounded breadth-first crawl of one origin. Each run owns its frontier, robots
// cache and worker pool; nothing carries over between runs.
class AuditCrawler {
public:
    // pageFetcher serves HTML pages (may be a rendering client), resourceFetcher
    // serves robots.txt and sitemap probes. Both must outlive the crawler.
    AuditCrawler(FetchPort& pageFetcher,
                 FetchPort& resourceFetcher,
                 std::string userAgent,
                 size_t workerCount = kCrawlWorkerCount);

    // Uses the budget of the request's profile
    CrawlResult run(const CrawlRequest& request) const;

    // Throws SeedUnreachableError when the seed cannot be reached and nothing was fetched,
    // AuditError when the budget is not usable
    CrawlResult run(const CrawlRequest& request, const CrawlBudget& budget) const;

    // Extra wait on top of the per-page timeout before a batch is abandoned
    static constexpr std::chrono::milliseconds kBatchGrace{200};

private:
    // Verifies discovered internal links in sorted order, reusing statuses the crawl already saw
    void checkInternalLinks(const std::set<std::string>& links,
                            std::unordered_map<std::string, int>& knownStatus,
                            RobotsGate& robots,
                            const CrawlBudget& budget,
                            std::chrono::steady_clock::time_point start,
                            CrawlResult& result) const;

    FetchPort& pageFetcher_;
    FetchPort& resourceFetcher_;
    std::string userAgent_;
    size_t workerCount_;
    extraction::SignalExtractor extractor_;
};

} // namespace site_audit::crawler
