#include "../../include/site_audit/audit/ReportRenderer.h"
#include <sstream>

using json = nlohmann::json;

namespace site_audit::audit {

namespace {

json optionalScore(const std::optional<int>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

json ReportRenderer::toJson(const FindingGroup& group) {
    return json{
        {"rule_id", group.ruleId},
        {"category", categoryToString(group.category)},
        {"kind", kindToString(group.kind)},
        {"severity", severityToString(group.severity)},
        {"title", group.title},
        {"detail", group.detail},
        {"how_to_fix", group.howToFix},
        {"affected_pages", group.affectedPages},
        {"affected_urls", group.affectedUrls},
        {"evidence", {
            {"page_index", group.firstEvidence.pageIndex},
            {"url", group.firstEvidence.url},
            {"metric", group.firstEvidence.metric}
        }}
    };
}

json ReportRenderer::toJson(const ReportSection& section) {
    json findings = json::array();
    for (const auto& group : section.findings) {
        findings.push_back(toJson(group));
    }

    json out{
        {"key", section.key},
        {"title", section.title},
        {"summary", section.summary},
        {"findings", findings},
        {"next_actions", section.nextActions},
        {"notes", section.notes},
        {"empty", section.empty}
    };
    if (section.empty) {
        out["empty_marker"] = section.emptyMarker;
    }
    if (section.score) {
        out["score"] = optionalScore(section.score->value);
        out["status"] = statusToString(section.score->status);
    }
    return out;
}

json ReportRenderer::toJson(const ScoreCard& scores) {
    json categories = json::object();
    for (const auto& score : scores.categories) {
        categories[categoryToString(score.category)] = {
            {"score", optionalScore(score.value)},
            {"status", statusToString(score.status)},
            {"findings", score.findingCount},
            {"issues", score.weaknessCount}
        };
    }
    return json{
        {"overall", optionalScore(scores.overall)},
        {"overall_status", statusToString(scores.overallStatus)},
        {"categories", categories}
    };
}

json ReportRenderer::toJson(const CrawlStats& stats) {
    return json{
        {"pages_attempted", stats.pagesAttempted},
        {"pages_fetched", stats.pagesFetched},
        {"pages_evaluated", stats.pagesEvaluated},
        {"timeouts", stats.timeouts},
        {"errors", stats.errors},
        {"http_errors", stats.httpErrors},
        {"skipped_robots", stats.skippedRobots},
        {"skipped_scope", stats.skippedScope},
        {"skipped_non_html", stats.skippedNonHtml},
        {"links_cross_origin", stats.linksCrossOrigin},
        {"links_wrong_scheme", stats.linksWrongScheme},
        {"links_non_html", stats.linksNonHtml},
        {"broken_internal_links", stats.brokenInternalLinks},
        {"max_depth_observed", stats.maxDepthObserved},
        {"duration_ms", stats.durationMs},
        {"limit_notes", stats.limitNotes},
        {"robots_present", stats.robotsPresent},
        {"sitemap_present", stats.sitemapPresent ? json(*stats.sitemapPresent) : json(nullptr)},
        {"links_checked_internal", stats.linksCheckedInternal},
        {"appendix", {
            {"noindex_pages", stats.noindexPages},
            {"missing_title", stats.missingTitle},
            {"missing_meta_description", stats.missingMetaDescription},
            {"missing_lang", stats.missingLang},
            {"images_missing_alt", stats.imagesMissingAlt},
            {"inputs_missing_label", stats.inputsMissingLabel},
            {"mixed_content_pages", stats.mixedContentPages},
            {"redirect_chain_pages", stats.redirectChainPages}
        }},
        {"budget", {
            {"max_pages", stats.budget.maxPages},
            {"max_depth", stats.budget.maxDepth},
            {"max_runtime_ms", stats.budget.maxRuntime.count()},
            {"per_page_timeout_ms", stats.budget.perPageTimeout.count()},
            {"max_link_checks", stats.budget.maxLinkChecks}
        }}
    };
}

json ReportRenderer::toJson(const Report& report) {
    json sections = json::array();
    for (const auto& section : report.sections) {
        sections.push_back(toJson(section));
    }

    json worstPages = json::array();
    for (const auto& page : report.worstPages) {
        worstPages.push_back({
            {"page_index", page.pageIndex},
            {"url", page.url},
            {"status_code", page.statusCode},
            {"issues", page.issueCount},
            {"severity_total", page.severityTotal},
            {"issues_by_category", page.issuesByCategory}
        });
    }

    return json{
        {"url", report.targetUrl},
        {"profile", profileToString(report.profile)},
        {"generated_at", report.generatedAt},
        {"partial", report.partial},
        {"data_origin", report.fromCache ? "cache" : "fresh"},
        {"total_findings", report.totalFindings},
        {"crawl", toJson(report.crawl)},
        {"scores", toJson(report.scores)},
        {"sections", sections},
        {"worst_pages", worstPages}
    };
}

std::string ReportRenderer::toText(const Report& report) {
    std::ostringstream out;
    out << "SITE AUDIT: " << report.targetUrl << "\n"
        << "Profile: " << profileToString(report.profile)
        << " | Generated: " << report.generatedAt
        << (report.partial ? " | PARTIAL" : "")
        << (report.fromCache ? " | CACHED" : "") << "\n\n";

    size_t number = 1;
    for (const auto& section : report.sections) {
        out << number++ << ". " << section.title << "\n";
        if (!section.summary.empty()) {
            out << "   " << section.summary << "\n";
        }
        for (const auto& note : section.notes) {
            out << "   - " << note << "\n";
        }
        if (section.empty) {
            out << "   " << section.emptyMarker << "\n";
        }
        for (const auto& group : section.findings) {
            out << "   [" << severityToString(group.severity) << "] " << group.title
                << " (" << group.affectedPages << (group.affectedPages == 1 ? " page" : " pages") << ")\n"
                << "       " << group.detail << "\n";
        }
        if (!section.nextActions.empty()) {
            out << "   Next actions:\n";
            for (const auto& action : section.nextActions) {
                out << "     * " << action << "\n";
            }
        }
        out << "\n";
    }
    return out.str();
}

} // namespace site_audit::audit
