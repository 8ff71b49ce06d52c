#pragma once

#include <string>
#include "../../include/site_audit/models/CrawlResult.h"

namespace site_audit::testing {

// Signals of a page that the built-in rules consider healthy: no weakness,
// opportunity or bottleneck fires for it.
inline PageSignals healthySignals(const std::string& url) {
    PageSignals s;
    s.pageUrl = url;
    s.title = "Healthy page for testing";
    s.metaDescription = "A meta description long enough to sit inside the recommended range for results.";
    s.canonical = url;
    s.lang = "en";
    s.hasViewport = true;
    s.hasOpenGraph = true;
    s.hasStructuredData = true;
    s.h1Count = 1;
    s.h2Count = 3;
    s.navItemCount = 5;
    s.wordCount = 600;
    s.formCount = 1;
    s.ctaCount = 2;
    s.hasFaq = true;
    s.hasTestimonials = true;
    s.hasPricing = true;
    s.resourceCount = 12;
    s.renderBlockingCount = 1;
    s.htmlBytes = 40000;
    s.statusCode = 200;
    s.responseTime = std::chrono::milliseconds(300);
    return s;
}

inline PageRecord successRecord(size_t index, const std::string& url, size_t depth, PageSignals signals) {
    PageRecord record;
    record.index = index;
    record.url = url;
    record.finalUrl = url;
    record.depth = depth;
    record.outcome = FetchOutcome::Success;
    record.statusCode = 200;
    record.contentType = "text/html";
    record.signals = std::move(signals);
    return record;
}

inline PageRecord failedRecord(size_t index, const std::string& url, size_t depth, FetchOutcome outcome,
                               int statusCode = 0) {
    PageRecord record;
    record.index = index;
    record.url = url;
    record.finalUrl = url;
    record.depth = depth;
    record.outcome = outcome;
    record.statusCode = statusCode;
    return record;
}

// A crawl of the given records with robots.txt and a sitemap in place
inline CrawlResult crawlOf(const std::string& target, std::vector<PageRecord> pages,
                           AuditProfile profile = AuditProfile::Full) {
    CrawlResult crawl;
    crawl.request = CrawlRequest{target, profile};
    crawl.budget = CrawlBudget::forProfile(profile);
    crawl.pages = std::move(pages);
    for (const auto& page : crawl.pages) {
        if (page.outcome != FetchOutcome::SkippedRobots && page.outcome != FetchOutcome::SkippedScope) {
            ++crawl.pagesFetched;
        }
        if (page.depth > 0 && page.outcome != FetchOutcome::SkippedRobots) {
            ++crawl.linksCheckedInternal;
        }
        if (page.depth > 0 && page.outcome == FetchOutcome::Error && page.statusCode >= 400) {
            crawl.brokenInternalLinks.push_back(BrokenLink{page.url, page.statusCode});
        }
    }
    crawl.startedAt = std::chrono::system_clock::now();
    crawl.duration = std::chrono::milliseconds(1500);
    crawl.robotsUrl = target + "robots.txt";
    crawl.robotsPresent = true;
    crawl.sitemapPresent = true;
    return crawl;
}

} // namespace site_audit::testing
