#include "../../include/site_audit/audit/ReportAssembler.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <functional>
#include <iomanip>
#include <optional>
#include <set>
#include <sstream>
#include <unordered_map>

namespace site_audit::audit {

namespace {

std::string isoTimestamp(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::optional<AuditCategory> sectionCategory(SectionId id) {
    switch (id) {
        case SectionId::TechnicalPerformance: return AuditCategory::Performance;
        case SectionId::OnPageSeo: return AuditCategory::Seo;
        case SectionId::Ux: return AuditCategory::Ux;
        case SectionId::Accessibility: return AuditCategory::Accessibility;
        case SectionId::ConversionCommunication: return AuditCategory::Conversion;
        default: return std::nullopt;
    }
}

std::vector<const Finding*> filterFindings(const std::vector<Finding>& findings,
                                          const std::function<bool(const Finding&)>& predicate) {
    std::vector<const Finding*> selected;
    for (const auto& finding : findings) {
        if (predicate(finding)) {
            selected.push_back(&finding);
        }
    }
    return selected;
}

std::vector<std::string> nextActionsFor(const std::vector<FindingGroup>& groups) {
    std::vector<std::string> actions;
    for (const auto& group : groups) {
        if (group.howToFix.empty() ||
            std::find(actions.begin(), actions.end(), group.howToFix) != actions.end()) {
            continue;
        }
        actions.push_back(group.howToFix);
        if (actions.size() >= ReportAssembler::kMaxNextActions) {
            break;
        }
    }
    return actions;
}

std::string scoreText(const std::optional<int>& value, ScoreStatus status) {
    if (!value) {
        return "not evaluated";
    }
    return std::to_string(*value) + "/100 (" + statusToString(status) + ")";
}

std::string plural(size_t count, const std::string& singular, const std::string& pluralForm) {
    return std::to_string(count) + " " + (count == 1 ? singular : pluralForm);
}

} // namespace

ReportAssembler::ReportAssembler(const ScoringConfig& config)
    : config_(config) {
}

std::vector<FindingGroup> ReportAssembler::groupFindings(const std::vector<const Finding*>& findings) {
    std::vector<FindingGroup> groups;
    std::unordered_map<std::string, size_t> indexByRule;
    std::unordered_map<std::string, std::set<size_t>> pagesByRule;

    for (const Finding* finding : findings) {
        auto [it, inserted] = indexByRule.emplace(finding->ruleId, groups.size());
        if (inserted) {
            FindingGroup group;
            group.ruleId = finding->ruleId;
            group.category = finding->category;
            group.kind = finding->kind;
            group.severity = finding->severity;
            group.title = finding->title;
            group.detail = finding->detail;
            group.howToFix = finding->howToFix;
            group.firstEvidence = finding->evidence;
            groups.push_back(std::move(group));
        }

        FindingGroup& group = groups[it->second];
        if (static_cast<int>(finding->severity) > static_cast<int>(group.severity)) {
            group.severity = finding->severity;
        }
        if (pagesByRule[finding->ruleId].insert(finding->evidence.pageIndex).second) {
            ++group.affectedPages;
            if (group.affectedUrls.size() < kMaxAffectedUrls) {
                group.affectedUrls.push_back(finding->evidence.url);
            }
        }
    }

    std::stable_sort(groups.begin(), groups.end(), [](const FindingGroup& a, const FindingGroup& b) {
        if (a.severity != b.severity) {
            return static_cast<int>(a.severity) > static_cast<int>(b.severity);
        }
        return a.title < b.title;
    });
    return groups;
}

std::vector<WorstPage> ReportAssembler::rankWorstPages(const CrawlResult& crawl,
                                                       const std::vector<Finding>& findings) const {
    std::unordered_map<size_t, WorstPage> byPage;
    std::unordered_map<size_t, double> weightByPage;

    for (const auto& finding : findings) {
        if (finding.siteWide || !isPenalized(finding.kind)) {
            continue;
        }
        const size_t index = finding.evidence.pageIndex;
        WorstPage& page = byPage[index];
        page.pageIndex = index;
        page.url = finding.evidence.url;
        if (index < crawl.pages.size()) {
            page.statusCode = crawl.pages[index].statusCode;
        }
        ++page.issueCount;
        ++page.issuesByCategory[categoryToString(finding.category)];
        weightByPage[index] += config_.penaltyFor(finding.severity);
    }

    std::vector<WorstPage> ranked;
    ranked.reserve(byPage.size());
    for (auto& [index, page] : byPage) {
        page.severityTotal = static_cast<int>(std::lround(weightByPage[index]));
        ranked.push_back(std::move(page));
    }

    std::sort(ranked.begin(), ranked.end(), [](const WorstPage& a, const WorstPage& b) {
        if (a.severityTotal != b.severityTotal) return a.severityTotal > b.severityTotal;
        if (a.issueCount != b.issueCount) return a.issueCount > b.issueCount;
        return a.pageIndex < b.pageIndex;
    });
    if (ranked.size() > kMaxWorstPages) {
        ranked.resize(kMaxWorstPages);
    }
    return ranked;
}

CrawlStats ReportAssembler::collectStats(const CrawlResult& crawl) {
    CrawlStats stats;
    stats.pagesAttempted = crawl.pages.size();
    stats.pagesFetched = crawl.pagesFetched;
    stats.pagesEvaluated = crawl.evaluatedPageCount();
    stats.timeouts = crawl.countOutcome(FetchOutcome::Timeout);
    stats.errors = crawl.countOutcome(FetchOutcome::Error);
    stats.httpErrors = static_cast<size_t>(std::count_if(crawl.pages.begin(), crawl.pages.end(),
        [](const PageRecord& page) { return page.outcome == FetchOutcome::Error && page.statusCode >= 400; }));
    stats.skippedRobots = crawl.countOutcome(FetchOutcome::SkippedRobots);
    stats.skippedScope = crawl.countOutcome(FetchOutcome::SkippedScope);
    stats.skippedNonHtml = crawl.countOutcome(FetchOutcome::SkippedNonHtml);
    stats.linksCrossOrigin = crawl.linksCrossOrigin;
    stats.linksWrongScheme = crawl.linksWrongScheme;
    stats.linksNonHtml = crawl.linksNonHtml;
    stats.brokenInternalLinks = crawl.brokenInternalLinks.size();
    stats.maxDepthObserved = crawl.maxDepthObserved();
    stats.durationMs = crawl.duration.count();
    stats.budget = crawl.budget;
    stats.limitNotes = crawl.limitNotes;
    stats.robotsPresent = crawl.robotsPresent;
    stats.sitemapPresent = crawl.sitemapPresent;
    stats.linksCheckedInternal = crawl.linksCheckedInternal;

    const auto absent = [](const std::optional<std::string>& value) { return !value || value->empty(); };
    for (const auto& page : crawl.pages) {
        if (!page.signals) {
            continue;
        }
        const PageSignals& s = *page.signals;
        if (s.noindex) ++stats.noindexPages;
        if (absent(s.title)) ++stats.missingTitle;
        if (absent(s.metaDescription)) ++stats.missingMetaDescription;
        if (absent(s.lang)) ++stats.missingLang;
        if (s.mixedContentCount > 0) ++stats.mixedContentPages;
        if (s.redirectCount >= kRedirectChainHops) ++stats.redirectChainPages;
        stats.imagesMissingAlt += static_cast<size_t>(std::max(s.imagesMissingAlt, 0));
        stats.inputsMissingLabel += static_cast<size_t>(std::max(s.inputsMissingLabel, 0));
    }
    return stats;
}

Report ReportAssembler::assemble(const CrawlResult& crawl,
                                 const std::vector<Finding>& findings,
                                 const ScoreCard& scores) const {
    Report report;
    report.targetUrl = crawl.request.targetUrl;
    report.profile = crawl.request.profile;
    report.generatedAt = isoTimestamp(std::chrono::system_clock::now());
    report.crawl = collectStats(crawl);
    report.scores = scores;
    report.totalFindings = findings.size();
    report.partial = !crawl.limitNotes.empty();
    report.worstPages = rankWorstPages(crawl, findings);

    const auto penalized = [](const Finding& f) { return isPenalized(f.kind); };
    const CrawlStats& stats = report.crawl;

    for (SectionId id : kReportSectionOrder) {
        ReportSection section;
        section.id = id;
        section.key = sectionKey(id);
        section.title = sectionTitle(id);

        std::vector<FindingGroup> groups;
        size_t limit = kMaxGroupsPerSection;
        bool withActions = true;
        std::ostringstream summary;

        if (auto category = sectionCategory(id)) {
            const CategoryScore& score = scores.forCategory(*category);
            section.score = score;
            groups = groupFindings(filterFindings(findings, [&](const Finding& f) {
                return f.category == *category && isPenalized(f.kind);
            }));
            summary << "Score " << scoreText(score.value, score.status) << "; "
                    << plural(score.weaknessCount, "issue", "issues") << " found.";
        } else {
            switch (id) {
                case SectionId::Cover:
                    groups = groupFindings(filterFindings(findings, penalized));
                    limit = kMaxCoverHeadlines;
                    withActions = false;
                    summary << "Website audit of " << report.targetUrl << " (" << profileToString(report.profile)
                            << " profile). Overall score: " << scoreText(scores.overall, scores.overallStatus) << ".";
                    section.notes.push_back("Generated at " + report.generatedAt);
                    if (report.partial) {
                        section.notes.push_back("Partial crawl: the audit budget ended before every page was visited");
                    }
                    break;
                case SectionId::SiteOverview:
                    groups = groupFindings(filterFindings(findings, [](const Finding& f) { return f.siteWide; }));
                    summary << stats.pagesEvaluated << " of " << stats.pagesAttempted << " discovered pages evaluated ("
                            << stats.pagesFetched << " fetched in " << stats.durationMs << " ms).";
                    section.notes.push_back("Timeouts: " + std::to_string(stats.timeouts));
                    section.notes.push_back("Fetch errors: " + std::to_string(stats.errors) +
                                            " (HTTP errors: " + std::to_string(stats.httpErrors) + ")");
                    section.notes.push_back("Skipped by robots.txt: " + std::to_string(stats.skippedRobots));
                    section.notes.push_back("Skipped out of scope: " + std::to_string(stats.skippedScope));
                    section.notes.push_back("Skipped non-HTML: " + std::to_string(stats.skippedNonHtml));
                    section.notes.push_back("Links not followed: " + std::to_string(stats.linksCrossOrigin) +
                                            " cross-origin, " + std::to_string(stats.linksWrongScheme) +
                                            " other scheme, " + std::to_string(stats.linksNonHtml) + " non-HTML");
                    section.notes.push_back("Deepest level reached: " + std::to_string(stats.maxDepthObserved));
                    section.notes.push_back(std::string("robots.txt: ") + (stats.robotsPresent ? "present" : "missing"));
                    section.notes.push_back(std::string("Sitemap: ") +
                                            (!stats.sitemapPresent ? "not checked"
                                                                   : (*stats.sitemapPresent ? "present" : "missing")));
                    for (const auto& note : stats.limitNotes) {
                        section.notes.push_back("Limit: " + note);
                    }
                    break;
                case SectionId::Strengths:
                    groups = groupFindings(filterFindings(findings, [](const Finding& f) {
                        return f.kind == FindingKind::Strength;
                    }));
                    withActions = false;
                    summary << plural(groups.size(), "strength", "strengths") << " identified.";
                    break;
                case SectionId::CriticalBottlenecks:
                    groups = groupFindings(filterFindings(findings, [](const Finding& f) {
                        return f.kind == FindingKind::CriticalBottleneck ||
                               (isPenalized(f.kind) && f.severity == Severity::Critical);
                    }));
                    summary << plural(groups.size(), "critical bottleneck", "critical bottlenecks") << " identified.";
                    break;
                case SectionId::StrategicOpportunities:
                    groups = groupFindings(filterFindings(findings, [](const Finding& f) {
                        return f.kind == FindingKind::Opportunity;
                    }));
                    summary << plural(groups.size(), "improvement opportunity", "improvement opportunities")
                            << " identified.";
                    break;
                case SectionId::ConsolidatedDiagnosis: {
                    groups = groupFindings(filterFindings(findings, penalized));
                    summary << "Overall score " << scoreText(scores.overall, scores.overallStatus) << ".";
                    const CategoryScore* weakest = nullptr;
                    for (const auto& score : scores.categories) {
                        section.notes.push_back(categoryToString(score.category) + ": " +
                                                scoreText(score.value, score.status));
                        if (score.value && (!weakest || *score.value < *weakest->value)) {
                            weakest = &score;
                        }
                    }
                    if (weakest) {
                        summary << " Weakest area: " << categoryToString(weakest->category) << ".";
                    }
                    break;
                }
                case SectionId::WorstPagesAppendix:
                    withActions = false;
                    summary << plural(report.worstPages.size(), "page", "pages") << " with issues listed.";
                    for (const auto& page : report.worstPages) {
                        section.notes.push_back(page.url + ": " + plural(page.issueCount, "issue", "issues") +
                                                ", severity total " + std::to_string(page.severityTotal));
                    }
                    section.notes.push_back("Pages with noindex: " + std::to_string(stats.noindexPages));
                    section.notes.push_back("Pages without title: " + std::to_string(stats.missingTitle));
                    section.notes.push_back("Pages without meta description: " +
                                            std::to_string(stats.missingMetaDescription));
                    section.notes.push_back("Pages without lang: " + std::to_string(stats.missingLang));
                    section.notes.push_back("Images without alt: " + std::to_string(stats.imagesMissingAlt));
                    section.notes.push_back("Inputs without label: " + std::to_string(stats.inputsMissingLabel));
                    section.notes.push_back("Pages with mixed content: " + std::to_string(stats.mixedContentPages));
                    section.notes.push_back("Pages behind a redirect chain: " + std::to_string(stats.redirectChainPages));
                    section.notes.push_back("Internal links checked: " + std::to_string(stats.linksCheckedInternal) +
                                            " (" + std::to_string(stats.brokenInternalLinks) + " broken)");
                    break;
                default:
                    break;
            }
        }

        if (groups.size() > limit) {
            groups.resize(limit);
        }
        if (withActions) {
            section.nextActions = nextActionsFor(groups);
        }
        section.findings = std::move(groups);
        section.summary = summary.str();

        section.empty = id == SectionId::WorstPagesAppendix ? report.worstPages.empty() : section.findings.empty();
        if (section.empty) {
            section.emptyMarker = kNoSignificantFindings;
        }
        report.sections.push_back(std::move(section));
    }

    LOG_INFO("Assembled report for " + report.targetUrl + ": " + std::to_string(report.totalFindings) +
             " findings, overall " + scoreText(scores.overall, scores.overallStatus));
    return report;
}

} // namespace site_audit::audit
