#pragma once

#include <memory>
#include <string>
#include "SummaryRefiner.h"
#include "../audit/AuditScorer.h"
#include "../audit/RuleSet.h"
#include "../cache/AuditCache.h"
#include "../crawler/FetchPort.h"
#include "../models/CrawlResult.h"
#include "../models/ExecutiveSummary.h"
#include "../models/Report.h"

namespace site_audit::services {

// The two operations served to callers, both backed by the shared audit cache.
// Thread-safe: concurrent callers only share the cache and the fetchers.
class AuditService {
public:
    AuditService(std::shared_ptr<cache::AuditCache> cache,
                 std::shared_ptr<crawler::FetchPort> pageFetcher,
                 std::shared_ptr<crawler::FetchPort> resourceFetcher,
                 std::string userAgent,
                 std::shared_ptr<SummaryRefiner> refiner = nullptr,
                 std::shared_ptr<const audit::RuleSet> rules = audit::RuleSet::createDefault(),
                 const audit::ScoringConfig& scoring = audit::ScoringConfig::createDefault());

    // Full-profile report. Throws InvalidUrlError, SeedUnreachableError or AuditError.
    Report report(const std::string& url);

    // Executive summary from a fresh full-profile report when cached, otherwise
    // from a summary-profile audit. Refinement failures keep the deterministic text.
    ExecutiveSummary analyzeSummary(const std::string& url);

    // Uncached crawl -> classify -> score -> assemble for an already normalized target
    Report runAudit(const CrawlRequest& request) const;

    cache::AuditCache& cache() { return *cache_; }

private:
    Report cachedAudit(const std::string& normalizedUrl, AuditProfile profile);

    std::shared_ptr<cache::AuditCache> cache_;
    std::shared_ptr<crawler::FetchPort> pageFetcher_;
    std::shared_ptr<crawler::FetchPort> resourceFetcher_;
    std::string userAgent_;
    std::shared_ptr<SummaryRefiner> refiner_;
    std::shared_ptr<const audit::RuleSet> rules_;
    audit::ScoringConfig scoring_;
};

} // namespace site_audit::services
