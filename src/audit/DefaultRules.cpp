#include "../../include/site_audit/audit/RuleSet.h"
#include "../../include/site_audit/common/UrlUtils.h"
#include <algorithm>
#include <sstream>

namespace site_audit::audit {

namespace {

constexpr long long kSlowResponseMs = 1200;
constexpr long long kVerySlowResponseMs = 2500;
constexpr long long kFastResponseMs = 500;
constexpr size_t kHeavyHtmlBytes = 512000;
constexpr int kMaxResources = 80;
constexpr int kMaxRenderBlocking = 5;
constexpr size_t kMaxInlineScriptBytes = 100 * 1024;
constexpr size_t kTitleMin = 15;
constexpr size_t kTitleMax = 60;
constexpr size_t kMetaDescriptionMin = 70;
constexpr size_t kMetaDescriptionMax = 160;
constexpr size_t kThinContentWords = 120;
constexpr int kManyMissingAlt = 20;
constexpr size_t kManyBrokenLinks = 10;

// Length in code points, so accented titles are not over-counted
size_t utf8Length(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(),
        [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

std::unique_ptr<AuditRule> pageRule(RuleInfo info, PageCheckRule::Check check) {
    return std::make_unique<PageCheckRule>(std::move(info), std::move(check));
}

std::unique_ptr<SiteRule> siteRule(RuleInfo info, SiteCheckRule::Check check) {
    return std::make_unique<SiteCheckRule>(std::move(info), std::move(check));
}

RuleHit hit(Severity severity, std::string detail, std::string metric = "") {
    return RuleHit{severity, std::move(detail), std::move(metric)};
}

void addPerformanceRules(RuleSet& rules) {
    rules.addPageRule(pageRule(
        {"performance.slow-response", AuditCategory::Performance, FindingKind::Weakness, Severity::High,
         "Slow server response",
         "Cache rendered pages, enable compression and review slow backend queries so the HTML arrives in under 1.2 s."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            const long long ms = s.responseTime.count();
            if (ms <= kSlowResponseMs) return std::nullopt;
            return hit(ms > kVerySlowResponseMs ? Severity::High : Severity::Medium,
                       "The page took " + std::to_string(ms) + " ms to respond.", std::to_string(ms) + "ms");
        }));

    rules.addPageRule(pageRule(
        {"performance.heavy-html", AuditCategory::Performance, FindingKind::Weakness, Severity::Medium,
         "Heavy HTML document",
         "Move inline data and markup that is not needed for first paint out of the document."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.htmlBytes <= kHeavyHtmlBytes) return std::nullopt;
            return hit(Severity::Medium, "The HTML weighs " + std::to_string(s.htmlBytes / 1024) + " KB.",
                       std::to_string(s.htmlBytes) + " bytes");
        }));

    rules.addPageRule(pageRule(
        {"performance.many-resources", AuditCategory::Performance, FindingKind::Weakness, Severity::Medium,
         "Too many referenced resources",
         "Bundle scripts and styles, drop unused third-party tags and defer below-the-fold media."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.resourceCount <= kMaxResources) return std::nullopt;
            return hit(Severity::Medium, std::to_string(s.resourceCount) + " resources are referenced by the page.",
                       std::to_string(s.resourceCount));
        }));

    rules.addPageRule(pageRule(
        {"performance.render-blocking", AuditCategory::Performance, FindingKind::Weakness, Severity::Medium,
         "Render-blocking resources in head",
         "Add defer or async to head scripts and inline the critical CSS."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.renderBlockingCount <= kMaxRenderBlocking) return std::nullopt;
            return hit(Severity::Medium,
                       std::to_string(s.renderBlockingCount) + " scripts and stylesheets block the first render.",
                       std::to_string(s.renderBlockingCount));
        }));

    rules.addPageRule(pageRule(
        {"performance.inline-scripts", AuditCategory::Performance, FindingKind::Weakness, Severity::Low,
         "Large inline scripts",
         "Move inline JavaScript into cacheable external files."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.inlineScriptBytes <= kMaxInlineScriptBytes) return std::nullopt;
            return hit(Severity::Low,
                       std::to_string(s.inlineScriptCount) + " inline scripts add " +
                           std::to_string(s.inlineScriptBytes / 1024) + " KB to the document.",
                       std::to_string(s.inlineScriptBytes) + " bytes");
        }));

    rules.addPageRule(pageRule(
        {"performance.mixed-content", AuditCategory::Performance, FindingKind::CriticalBottleneck, Severity::High,
         "Insecure resources on a secure page",
         "Serve every script, stylesheet and image over HTTPS."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.mixedContentCount == 0) return std::nullopt;
            return hit(Severity::High,
                       std::to_string(s.mixedContentCount) + " resources are loaded over plain HTTP.",
                       std::to_string(s.mixedContentCount));
        }));

    rules.addPageRule(pageRule(
        {"performance.lazy-images", AuditCategory::Performance, FindingKind::Opportunity, Severity::Low,
         "Images could load lazily",
         "Add loading=\"lazy\" to images below the fold."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.imagesTotal < 5 || s.imagesLazy > 0) return std::nullopt;
            return hit(Severity::Low, "None of the " + std::to_string(s.imagesTotal) + " images is lazy-loaded.",
                       std::to_string(s.imagesTotal));
        }));

    rules.addPageRule(pageRule(
        {"performance.modern-images", AuditCategory::Performance, FindingKind::Opportunity, Severity::Low,
         "Images could use modern formats",
         "Serve WebP or AVIF versions of photos and keep SVG for icons."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.imagesTotal < 3 || s.imagesModernFormat > 0) return std::nullopt;
            return hit(Severity::Low, "No WebP, AVIF or SVG images were found.", std::to_string(s.imagesTotal));
        }));

    rules.addPageRule(pageRule(
        {"performance.fast-response", AuditCategory::Performance, FindingKind::Strength, Severity::Low,
         "Fast server response",
         "Keep caching and hosting as they are."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            const long long ms = s.responseTime.count();
            if (ms <= 0 || ms > kFastResponseMs) return std::nullopt;
            return hit(Severity::Low, "The page responded in " + std::to_string(ms) + " ms.", std::to_string(ms) + "ms");
        }));
}

void addSeoRules(RuleSet& rules) {
    rules.addPageRule(pageRule(
        {"seo.title-missing", AuditCategory::Seo, FindingKind::Weakness, Severity::High,
         "Missing page title",
         "Give every page a unique <title> that names the page topic and the brand."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.title) return std::nullopt;
            return hit(Severity::High, "The page has no <title> element or it is empty.");
        }));

    rules.addPageRule(pageRule(
        {"seo.title-length", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium,
         "Title length out of range",
         "Keep titles between 15 and 60 characters so search results show them in full."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (!s.title) return std::nullopt;
            const size_t length = utf8Length(*s.title);
            if (length >= kTitleMin && length <= kTitleMax) return std::nullopt;
            return hit(Severity::Medium,
                       std::string("The title is ") + (length < kTitleMin ? "too short" : "too long") +
                           " (" + std::to_string(length) + " characters).",
                       std::to_string(length) + " chars");
        }));

    rules.addPageRule(pageRule(
        {"seo.meta-description-missing", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium,
         "Missing meta description",
         "Write a meta description that summarises the page and invites the click."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.metaDescription) return std::nullopt;
            return hit(Severity::Medium, "No meta description was found.");
        }));

    rules.addPageRule(pageRule(
        {"seo.meta-description-length", AuditCategory::Seo, FindingKind::Weakness, Severity::Low,
         "Meta description length out of range",
         "Keep meta descriptions between 70 and 160 characters."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (!s.metaDescription) return std::nullopt;
            const size_t length = utf8Length(*s.metaDescription);
            if (length >= kMetaDescriptionMin && length <= kMetaDescriptionMax) return std::nullopt;
            return hit(Severity::Low, "The meta description has " + std::to_string(length) + " characters.",
                       std::to_string(length) + " chars");
        }));

    rules.addPageRule(pageRule(
        {"seo.canonical-missing", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium,
         "Missing canonical link",
         "Declare <link rel=\"canonical\"> pointing at the preferred URL of the page."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.canonical) return std::nullopt;
            return hit(Severity::Medium, "The page does not declare a canonical URL.");
        }));

    rules.addPageRule(pageRule(
        {"seo.canonical-cross-origin", AuditCategory::Seo, FindingKind::Weakness, Severity::High,
         "Canonical points to another site",
         "Point the canonical link at this site unless the content is intentionally syndicated."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (!s.canonical || s.pageUrl.empty() || common::isSameOrigin(*s.canonical, s.pageUrl)) {
                return std::nullopt;
            }
            return hit(Severity::High, "The canonical URL is " + *s.canonical + ".", *s.canonical);
        }));

    rules.addPageRule(pageRule(
        {"seo.h1-count", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium,
         "Heading structure without a single H1",
         "Use exactly one <h1> describing the main subject and structure the rest with h2/h3."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.h1Count == 1) return std::nullopt;
            return hit(Severity::Medium,
                       s.h1Count == 0 ? "The page has no <h1>."
                                      : "The page has " + std::to_string(s.h1Count) + " <h1> elements.",
                       std::to_string(s.h1Count));
        }));

    rules.addPageRule(pageRule(
        {"seo.noindex", AuditCategory::Seo, FindingKind::CriticalBottleneck, Severity::High,
         "Page excluded from search engines",
         "Remove noindex from the robots meta tag on pages that should rank."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (!s.noindex) return std::nullopt;
            return hit(Severity::High, "The robots meta tag is \"" + s.metaRobots.value_or("") + "\".",
                       s.metaRobots.value_or(""));
        }));

    rules.addPageRule(pageRule(
        {"seo.structured-data", AuditCategory::Seo, FindingKind::Opportunity, Severity::Low,
         "No structured data",
         "Describe the organisation, products or articles with schema.org JSON-LD."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.hasStructuredData) return std::nullopt;
            return hit(Severity::Low, "No JSON-LD or microdata was found.");
        }));

    rules.addPageRule(pageRule(
        {"seo.open-graph", AuditCategory::Seo, FindingKind::Opportunity, Severity::Low,
         "No Open Graph tags",
         "Add og:title, og:description and og:image so shared links render a preview."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.hasOpenGraph) return std::nullopt;
            return hit(Severity::Low, "No og: meta properties were found.");
        }));

    rules.addPageRule(pageRule(
        {"seo.well-formed", AuditCategory::Seo, FindingKind::Strength, Severity::Low,
         "Well-formed on-page basics",
         "Keep the title, description and heading pattern when adding pages."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (!s.title || !s.metaDescription || s.h1Count != 1) return std::nullopt;
            const size_t length = utf8Length(*s.title);
            if (length < kTitleMin || length > kTitleMax) return std::nullopt;
            return hit(Severity::Low, "Title, meta description and a single H1 are present.");
        }));
}

void addUxRules(RuleSet& rules) {
    rules.addPageRule(pageRule(
        {"ux.viewport-missing", AuditCategory::Ux, FindingKind::Weakness, Severity::High,
         "Not configured for mobile screens",
         "Add <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.hasViewport) return std::nullopt;
            return hit(Severity::High, "The page has no viewport meta tag.");
        }));

    rules.addPageRule(pageRule(
        {"ux.thin-content", AuditCategory::Ux, FindingKind::Weakness, Severity::Medium,
         "Thin content",
         "Explain the offer, audience and next step in at least a few paragraphs."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.wordCount >= kThinContentWords) return std::nullopt;
            return hit(Severity::Medium, "Only " + std::to_string(s.wordCount) + " words of visible text.",
                       std::to_string(s.wordCount) + " words");
        }));

    rules.addPageRule(pageRule(
        {"ux.navigation-missing", AuditCategory::Ux, FindingKind::Weakness, Severity::Low,
         "No recognisable navigation",
         "Provide a <nav> menu with the main sections of the site."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.navItemCount > 0) return std::nullopt;
            return hit(Severity::Low, "No navigation links were found in nav, header or menu containers.");
        }));

    rules.addPageRule(pageRule(
        {"ux.redirect-chain", AuditCategory::Ux, FindingKind::CriticalBottleneck, Severity::High,
         "Redirect chain",
         "Link directly to the final URL and collapse chained redirects into one hop."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.redirectCount < kRedirectChainHops) return std::nullopt;
            return hit(Severity::High, "Reaching the page took " + std::to_string(s.redirectCount) + " redirects.",
                       std::to_string(s.redirectCount) + " hops");
        }));

    rules.addPageRule(pageRule(
        {"ux.responsive-navigation", AuditCategory::Ux, FindingKind::Strength, Severity::Low,
         "Mobile-ready layout with navigation",
         "Keep the viewport setup and menu consistent across templates."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (!s.hasViewport || s.navItemCount == 0) return std::nullopt;
            return hit(Severity::Low, std::to_string(s.navItemCount) + " navigation items on a responsive page.",
                       std::to_string(s.navItemCount));
        }));
}

void addAccessibilityRules(RuleSet& rules) {
    rules.addPageRule(pageRule(
        {"accessibility.lang-missing", AuditCategory::Accessibility, FindingKind::Weakness, Severity::Medium,
         "Document language not declared",
         "Set the lang attribute on <html> so screen readers pick the right voice."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.lang) return std::nullopt;
            return hit(Severity::Medium, "The <html> element has no lang attribute.");
        }));

    rules.addPageRule(pageRule(
        {"accessibility.image-alt", AuditCategory::Accessibility, FindingKind::Weakness, Severity::High,
         "Images without alternative text",
         "Describe informative images in alt and mark decorative ones with role=\"presentation\"."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.imagesMissingAlt == 0) return std::nullopt;
            return hit(s.imagesMissingAlt >= kManyMissingAlt ? Severity::High : Severity::Medium,
                       std::to_string(s.imagesMissingAlt) + " of " + std::to_string(s.imagesTotal) +
                           " images have no alt text.",
                       std::to_string(s.imagesMissingAlt));
        }));

    rules.addPageRule(pageRule(
        {"accessibility.input-label", AuditCategory::Accessibility, FindingKind::Weakness, Severity::High,
         "Form fields without labels",
         "Associate every field with a <label for>, a wrapping label or aria-label."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.inputsMissingLabel == 0) return std::nullopt;
            return hit(Severity::High,
                       std::to_string(s.inputsMissingLabel) + " of " + std::to_string(s.inputsTotal) +
                           " form fields have no accessible label.",
                       std::to_string(s.inputsMissingLabel));
        }));

    rules.addPageRule(pageRule(
        {"accessibility.page-title", AuditCategory::Accessibility, FindingKind::Weakness, Severity::Medium,
         "Page not identifiable by title",
         "Add a descriptive <title>; assistive technology announces it first."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.title) return std::nullopt;
            return hit(Severity::Medium, "Assistive technology has no page title to announce.");
        }));

    rules.addPageRule(pageRule(
        {"accessibility.alt-coverage", AuditCategory::Accessibility, FindingKind::Strength, Severity::Low,
         "All images described",
         "Keep writing alt text for new images."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.imagesTotal == 0 || s.imagesMissingAlt > 0) return std::nullopt;
            return hit(Severity::Low, "All " + std::to_string(s.imagesTotal) + " images carry alt text.",
                       std::to_string(s.imagesTotal));
        }));
}

void addConversionRules(RuleSet& rules) {
    rules.addPageRule(pageRule(
        {"conversion.cta-missing", AuditCategory::Conversion, FindingKind::Weakness, Severity::Medium,
         "No clear call to action",
         "Add a visible button or link that tells the visitor what to do next."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.ctaCount > 0) return std::nullopt;
            return hit(Severity::Medium, "No contact, quote or purchase call to action was found.");
        }));

    rules.addPageRule(pageRule(
        {"conversion.contact-channel", AuditCategory::Conversion, FindingKind::Opportunity, Severity::Medium,
         "No direct contact channel",
         "Offer a short contact form or a messaging link next to the main offer."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.formCount > 0 || s.hasWhatsapp) return std::nullopt;
            return hit(Severity::Medium, "The page has neither a form nor a messaging link.");
        }));

    rules.addPageRule(pageRule(
        {"conversion.social-proof", AuditCategory::Conversion, FindingKind::Opportunity, Severity::Low,
         "No social proof",
         "Show testimonials, reviews or client logos close to the call to action."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.hasTestimonials) return std::nullopt;
            return hit(Severity::Low, "No testimonials or reviews were detected.");
        }));

    rules.addPageRule(pageRule(
        {"conversion.faq", AuditCategory::Conversion, FindingKind::Opportunity, Severity::Low,
         "No FAQ content",
         "Answer the most common objections in a short FAQ block."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.hasFaq) return std::nullopt;
            return hit(Severity::Low, "No frequently asked questions were found.");
        }));

    rules.addPageRule(pageRule(
        {"conversion.pricing-transparency", AuditCategory::Conversion, FindingKind::Opportunity, Severity::Low,
         "No pricing cues",
         "Give at least a starting price or the factors that define it."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.hasPricing) return std::nullopt;
            return hit(Severity::Low, "No prices or pricing plans were mentioned.");
        }));

    rules.addPageRule(pageRule(
        {"conversion.clear-cta", AuditCategory::Conversion, FindingKind::Strength, Severity::Low,
         "Clear call to action",
         "Keep one primary action per page and repeat it after long sections."},
        [](const PageSignals& s) -> std::optional<RuleHit> {
            if (s.ctaCount == 0) return std::nullopt;
            return hit(Severity::Low, std::to_string(s.ctaCount) + " distinct calls to action were found.",
                       std::to_string(s.ctaCount));
        }));
}

void addSiteRules(RuleSet& rules) {
    rules.addSiteRule(siteRule(
        {"site.robots-missing", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium,
         "robots.txt not available",
         "Publish a robots.txt that allows crawling and lists the sitemap."},
        [](const CrawlResult& crawl) -> std::optional<RuleHit> {
            if (crawl.robotsPresent) return std::nullopt;
            return hit(Severity::Medium, crawl.robotsUrl + " could not be retrieved.", crawl.robotsUrl);
        }));

    rules.addSiteRule(siteRule(
        {"site.sitemap-missing", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium,
         "No XML sitemap",
         "Generate /sitemap.xml and reference it from robots.txt."},
        [](const CrawlResult& crawl) -> std::optional<RuleHit> {
            if (!crawl.sitemapPresent.has_value() || *crawl.sitemapPresent) return std::nullopt;
            return hit(Severity::Medium, "robots.txt declares no sitemap and /sitemap.xml is not served.");
        }));

    rules.addSiteRule(siteRule(
        {"site.broken-links", AuditCategory::Seo, FindingKind::Weakness, Severity::Critical,
         "Broken internal links",
         "Fix or redirect internal links that lead to error pages."},
        [](const CrawlResult& crawl) -> std::optional<RuleHit> {
            const size_t count = crawl.brokenInternalLinks.size();
            if (count == 0) return std::nullopt;
            std::ostringstream detail;
            detail << count << " internal link targets answered with an error, e.g. "
                   << crawl.brokenInternalLinks.front().url
                   << " (HTTP " << crawl.brokenInternalLinks.front().statusCode << ").";
            return hit(count >= kManyBrokenLinks ? Severity::Critical : Severity::High, detail.str(),
                       std::to_string(count));
        }));

    rules.addSiteRule(siteRule(
        {"site.http-errors", AuditCategory::Performance, FindingKind::CriticalBottleneck, Severity::Critical,
         "Pages answering with HTTP errors",
         "Check server logs for the failing URLs and restore or redirect them."},
        [](const CrawlResult& crawl) -> std::optional<RuleHit> {
            size_t errors = 0;
            bool serverError = false;
            for (const auto& page : crawl.pages) {
                if (page.outcome == FetchOutcome::Error && page.statusCode >= 400) {
                    ++errors;
                    serverError = serverError || page.statusCode >= 500;
                }
            }
            if (errors == 0) return std::nullopt;
            return hit(serverError ? Severity::Critical : Severity::High,
                       std::to_string(errors) + " crawled pages returned an HTTP error" +
                           (serverError ? ", including server errors." : "."),
                       std::to_string(errors));
        }));

    rules.addSiteRule(siteRule(
        {"site.partial-crawl", AuditCategory::Performance, FindingKind::CriticalBottleneck, Severity::Critical,
         "Site could not be covered within the audit budget",
         "Reduce the number of reachable URLs or speed up responses, then audit again."},
        [](const CrawlResult& crawl) -> std::optional<RuleHit> {
            if (!crawl.budget.reportLimitNotes || crawl.limitNotes.empty()) return std::nullopt;
            std::string notes;
            for (const auto& note : crawl.limitNotes) {
                if (!notes.empty()) notes += ", ";
                notes += note;
            }
            return hit(Severity::Critical, "The crawl stopped early: " + notes + ".", notes);
        }));
}

} // namespace

std::shared_ptr<const RuleSet> RuleSet::createDefault() {
    auto rules = std::make_shared<RuleSet>();
    addPerformanceRules(*rules);
    addSeoRules(*rules);
    addUxRules(*rules);
    addAccessibilityRules(*rules);
    addConversionRules(*rules);
    addSiteRules(*rules);
    return rules;
}

} // namespace site_audit::audit
