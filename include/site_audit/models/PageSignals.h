#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace site_audit {

// Structured facts extracted from one page's HTML. Text values are absent when
// the page does not carry them; counters default to zero.
// Redirect hops from which a page is counted as sitting behind a redirect chain
constexpr int kRedirectChainHops = 3;

struct PageSignals {
    std::string pageUrl;                       // URL the HTML was served from

    // Head metadata
    std::optional<std::string> title;
    std::optional<std::string> metaDescription;
    std::optional<std::string> canonical;      // resolved against the page URL
    std::optional<std::string> metaRobots;     // lowercase content
    std::optional<std::string> lang;
    bool noindex = false;
    bool hasViewport = false;
    bool hasOpenGraph = false;
    bool hasStructuredData = false;

    // Structure
    int h1Count = 0;
    int h2Count = 0;
    int h3Count = 0;
    int sectionCount = 0;
    int navItemCount = 0;
    size_t wordCount = 0;

    // Images
    int imagesTotal = 0;
    int imagesMissingAlt = 0;
    int imagesLazy = 0;
    int imagesModernFormat = 0;

    // Forms and conversion markers
    int inputsTotal = 0;
    int inputsMissingLabel = 0;
    int formCount = 0;
    int ctaCount = 0;
    bool hasWhatsapp = false;
    bool hasFaq = false;
    bool hasTestimonials = false;
    bool hasPricing = false;

    // Link graph (absolute http(s), fragment-less, de-duplicated, document order)
    std::vector<std::string> links;
    int internalLinkCount = 0;
    int externalLinkCount = 0;

    // Load-relevant proxies
    int resourceCount = 0;
    int renderBlockingCount = 0;
    int inlineScriptCount = 0;
    size_t inlineScriptBytes = 0;
    size_t htmlBytes = 0;
    int mixedContentCount = 0;

    // Fetch facts, stamped by the crawler
    int statusCode = 0;
    std::chrono::milliseconds responseTime{0};
    int redirectCount = 0;
};

} // namespace site_audit
