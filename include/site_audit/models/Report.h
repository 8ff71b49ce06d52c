#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "CrawlBudget.h"
#include "Finding.h"
#include "ScoreCard.h"

namespace site_audit {

inline const std::string kNoSignificantFindings = "No significant findings";

enum class SectionId {
    Cover,
    SiteOverview,
    TechnicalPerformance,
    OnPageSeo,
    Ux,
    Accessibility,
    ConversionCommunication,
    Strengths,
    CriticalBottlenecks,
    StrategicOpportunities,
    ConsolidatedDiagnosis,
    WorstPagesAppendix
};

constexpr std::array<SectionId, 12> kReportSectionOrder = {
    SectionId::Cover,
    SectionId::SiteOverview,
    SectionId::TechnicalPerformance,
    SectionId::OnPageSeo,
    SectionId::Ux,
    SectionId::Accessibility,
    SectionId::ConversionCommunication,
    SectionId::Strengths,
    SectionId::CriticalBottlenecks,
    SectionId::StrategicOpportunities,
    SectionId::ConsolidatedDiagnosis,
    SectionId::WorstPagesAppendix
};

inline std::string sectionKey(SectionId id) {
    switch (id) {
        case SectionId::Cover: return "cover";
        case SectionId::SiteOverview: return "site_overview";
        case SectionId::TechnicalPerformance: return "technical_performance";
        case SectionId::OnPageSeo: return "on_page_seo";
        case SectionId::Ux: return "ux";
        case SectionId::Accessibility: return "accessibility";
        case SectionId::ConversionCommunication: return "conversion_communication";
        case SectionId::Strengths: return "strengths";
        case SectionId::CriticalBottlenecks: return "critical_bottlenecks";
        case SectionId::StrategicOpportunities: return "strategic_opportunities";
        case SectionId::ConsolidatedDiagnosis: return "consolidated_diagnosis";
        case SectionId::WorstPagesAppendix: return "worst_pages_appendix";
    }
    return "unknown";
}

inline std::string sectionTitle(SectionId id) {
    switch (id) {
        case SectionId::Cover: return "Cover";
        case SectionId::SiteOverview: return "Site Overview";
        case SectionId::TechnicalPerformance: return "Technical Performance";
        case SectionId::OnPageSeo: return "On-Page SEO";
        case SectionId::Ux: return "User Experience";
        case SectionId::Accessibility: return "Accessibility";
        case SectionId::ConversionCommunication: return "Conversion & Communication";
        case SectionId::Strengths: return "Strengths";
        case SectionId::CriticalBottlenecks: return "Critical Bottlenecks";
        case SectionId::StrategicOpportunities: return "Strategic Opportunities";
        case SectionId::ConsolidatedDiagnosis: return "Consolidated Diagnosis";
        case SectionId::WorstPagesAppendix: return "Appendix: Worst Pages";
    }
    return "Unknown";
}

// Findings of one rule merged across pages
struct FindingGroup {
    std::string ruleId;
    AuditCategory category = AuditCategory::Seo;
    FindingKind kind = FindingKind::Weakness;
    Severity severity = Severity::Low;     // highest across the group
    std::string title;
    std::string detail;                    // from the first occurrence
    std::string howToFix;
    size_t affectedPages = 0;
    std::vector<std::string> affectedUrls; // capped, discovery order
    Evidence firstEvidence;
};

struct ReportSection {
    SectionId id = SectionId::Cover;
    std::string key;
    std::string title;
    std::string summary;
    std::vector<FindingGroup> findings;
    std::vector<std::string> nextActions;
    std::vector<std::string> notes;
    std::optional<CategoryScore> score;    // category sections only
    bool empty = true;                     // true when findings is empty
    std::string emptyMarker;               // kNoSignificantFindings when empty
};

struct WorstPage {
    size_t pageIndex = 0;
    std::string url;
    int statusCode = 0;
    size_t issueCount = 0;
    int severityTotal = 0;
    std::map<std::string, size_t> issuesByCategory;
};

struct CrawlStats {
    size_t pagesAttempted = 0;
    size_t pagesFetched = 0;
    size_t pagesEvaluated = 0;
    size_t timeouts = 0;
    size_t errors = 0;
    size_t httpErrors = 0;
    size_t skippedRobots = 0;
    size_t skippedScope = 0;
    size_t skippedNonHtml = 0;
    size_t linksCrossOrigin = 0;
    size_t linksWrongScheme = 0;
    size_t linksNonHtml = 0;
    size_t brokenInternalLinks = 0;
    size_t linksCheckedInternal = 0;
    size_t maxDepthObserved = 0;
    long long durationMs = 0;
    CrawlBudget budget;
    std::vector<std::string> limitNotes;
    bool robotsPresent = false;
    std::optional<bool> sitemapPresent;

    // Appendix counters over the evaluated pages
    size_t noindexPages = 0;
    size_t missingTitle = 0;
    size_t missingMetaDescription = 0;
    size_t missingLang = 0;
    size_t imagesMissingAlt = 0;       // total across pages
    size_t inputsMissingLabel = 0;     // total across pages
    size_t mixedContentPages = 0;
    size_t redirectChainPages = 0;
};

struct Report {
    std::string targetUrl;
    AuditProfile profile = AuditProfile::Full;
    std::string generatedAt;               // ISO-8601 UTC
    CrawlStats crawl;
    ScoreCard scores;
    std::vector<ReportSection> sections;   // kReportSectionOrder
    std::vector<WorstPage> worstPages;
    size_t totalFindings = 0;
    bool partial = false;
    bool fromCache = false;                // answered from the audit cache, not computed for this call

    const ReportSection& section(SectionId id) const {
        for (const auto& s : sections) {
            if (s.id == id) {
                return s;
            }
        }
        throw std::out_of_range("report has no section " + sectionKey(id));
    }
};

} // namespace site_audit
