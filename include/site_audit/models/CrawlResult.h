#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "CrawlBudget.h"
#include "PageSignals.h"

namespace site_audit {

struct CrawlRequest {
    std::string targetUrl;   // normalized
    AuditProfile profile = AuditProfile::Full;
};

enum class FetchOutcome {
    Success,
    Timeout,
    Error,
    SkippedRobots,
    SkippedScope,
    SkippedNonHtml
};

inline std::string outcomeToString(FetchOutcome outcome) {
    switch (outcome) {
        case FetchOutcome::Success: return "success";
        case FetchOutcome::Timeout: return "timeout";
        case FetchOutcome::Error: return "error";
        case FetchOutcome::SkippedRobots: return "skipped-robots";
        case FetchOutcome::SkippedScope: return "skipped-scope";
        case FetchOutcome::SkippedNonHtml: return "skipped-non-html";
    }
    return "unknown";
}

// One attempted URL. Created once, appended in BFS discovery order.
struct PageRecord {
    size_t index = 0;
    std::string url;
    std::string finalUrl;
    size_t depth = 0;
    FetchOutcome outcome = FetchOutcome::Error;
    int statusCode = 0;
    std::string contentType;
    std::optional<PageSignals> signals;   // only for FetchOutcome::Success
    std::chrono::milliseconds elapsed{0};
    std::string errorMessage;
};

struct BrokenLink {
    std::string url;
    int statusCode = 0;
};

struct CrawlResult {
    CrawlRequest request;
    CrawlBudget budget;

    std::vector<PageRecord> pages;
    size_t pagesFetched = 0;

    std::chrono::system_clock::time_point startedAt;
    std::chrono::milliseconds duration{0};
    std::vector<std::string> limitNotes;

    // Discovered links that were never enqueued
    size_t linksCrossOrigin = 0;
    size_t linksWrongScheme = 0;
    size_t linksNonHtml = 0;
    size_t internalLinksDiscovered = 0;

    std::string robotsUrl;
    bool robotsPresent = false;
    std::optional<bool> sitemapPresent;   // unknown when not checked

    // Internal links whose status was verified, and those answering >= 400 or not at all (status 0)
    size_t linksCheckedInternal = 0;
    std::vector<BrokenLink> brokenInternalLinks;

    size_t countOutcome(FetchOutcome outcome) const {
        return static_cast<size_t>(std::count_if(pages.begin(), pages.end(),
            [outcome](const PageRecord& page) { return page.outcome == outcome; }));
    }

    size_t evaluatedPageCount() const {
        return static_cast<size_t>(std::count_if(pages.begin(), pages.end(),
            [](const PageRecord& page) { return page.signals.has_value(); }));
    }

    size_t maxDepthObserved() const {
        size_t depth = 0;
        for (const auto& page : pages) {
            depth = std::max(depth, page.depth);
        }
        return depth;
    }
};

} // namespace site_audit
