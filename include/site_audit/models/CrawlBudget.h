#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace site_audit {

enum class AuditProfile {
    Full,
    Summary
};

inline std::string profileToString(AuditProfile profile) {
    return profile == AuditProfile::Summary ? "summary" : "full";
}

inline std::optional<AuditProfile> profileFromString(const std::string& value) {
    if (value == "full") return AuditProfile::Full;
    if (value == "summary") return AuditProfile::Summary;
    return std::nullopt;
}

// Width of the fetch worker pool. Not user-controlled.
constexpr size_t kCrawlWorkerCount = 4;

struct CrawlBudget {
    size_t maxPages = 150;
    size_t maxDepth = 6;
    std::chrono::milliseconds maxRuntime{120000};
    std::chrono::milliseconds perPageTimeout{20000};

    // Discovered internal links whose status is verified after the crawl; 0 disables
    size_t maxLinkChecks = 400;

    // Lifetime of the cached report produced under this budget
    std::chrono::seconds cacheTtl{900};

    // Probe /sitemap.xml when robots.txt declares no sitemap
    bool probeSitemap = true;

    // Emit a finding when the crawl stopped on a page/time limit
    bool reportLimitNotes = true;

    bool isValid() const {
        return maxPages > 0 && maxDepth > 0 &&
               maxRuntime.count() > 0 && perPageTimeout.count() > 0;
    }

    static CrawlBudget forProfile(AuditProfile profile);
};

inline CrawlBudget CrawlBudget::forProfile(AuditProfile profile) {
    CrawlBudget budget;
    if (profile == AuditProfile::Summary) {
        budget.maxPages = 12;
        budget.maxDepth = 1;
        budget.maxRuntime = std::chrono::seconds(8);
        budget.perPageTimeout = std::chrono::seconds(5);
        budget.maxLinkChecks = 0;
        budget.cacheTtl = std::chrono::seconds(600);
        budget.probeSitemap = false;
        budget.reportLimitNotes = false;
    }
    return budget;
}

} // namespace site_audit
