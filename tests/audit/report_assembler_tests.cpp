#include <catch2/catch_test_macros.hpp>
#include "../../include/site_audit/audit/AuditScorer.h"
#include "../../include/site_audit/audit/Classifier.h"
#include "../../include/site_audit/audit/ReportAssembler.h"
#include "CrawlFixtures.h"
#include <algorithm>

using namespace site_audit;
using namespace site_audit::audit;
using namespace site_audit::testing;

namespace {

const std::string kTarget = "https://example.com/";

Report auditOf(const CrawlResult& crawl) {
    auto rules = RuleSet::createDefault();
    Classifier classifier(rules);
    AuditScorer scorer(rules);
    auto findings = classifier.classifyCrawl(crawl);
    return ReportAssembler().assemble(crawl, findings, scorer.score(findings, crawl.evaluatedPageCount()));
}

Finding weakness(const std::string& ruleId, Severity severity, size_t pageIndex, const std::string& url,
                 const std::string& fix = "") {
    Finding f;
    f.ruleId = ruleId;
    f.category = AuditCategory::Seo;
    f.kind = FindingKind::Weakness;
    f.severity = severity;
    f.title = "Title " + ruleId;
    f.detail = "detail " + std::to_string(pageIndex);
    f.howToFix = fix.empty() ? "fix " + ruleId : fix;
    f.evidence.pageIndex = pageIndex;
    f.evidence.url = url;
    return f;
}

} // namespace

TEST_CASE("ReportAssembler always emits every section in order", "[ReportAssembler]") {
    CrawlResult crawl = crawlOf(kTarget, {
        successRecord(0, kTarget, 0, healthySignals(kTarget)),
        successRecord(1, kTarget + "about", 1, healthySignals(kTarget + "about")),
    });
    Report report = auditOf(crawl);

    REQUIRE(report.sections.size() == kReportSectionOrder.size());
    for (size_t i = 0; i < kReportSectionOrder.size(); ++i) {
        REQUIRE(report.sections[i].id == kReportSectionOrder[i]);
        REQUIRE(report.sections[i].key == sectionKey(kReportSectionOrder[i]));
        REQUIRE_FALSE(report.sections[i].summary.empty());
    }

    REQUIRE(report.targetUrl == kTarget);
    REQUIRE(report.profile == AuditProfile::Full);
    REQUIRE_FALSE(report.partial);
    REQUIRE(report.generatedAt.size() == 20);
    REQUIRE(report.generatedAt.back() == 'Z');

    // A healthy site: only the strengths section carries findings
    for (const auto& section : report.sections) {
        INFO(section.key);
        if (section.id == SectionId::Strengths) {
            REQUIRE_FALSE(section.empty);
            REQUIRE(section.nextActions.empty());
        } else {
            REQUIRE(section.empty);
            REQUIRE(section.emptyMarker == kNoSignificantFindings);
        }
    }
    REQUIRE(report.scores.overall == std::optional<int>(100));
}

TEST_CASE("ReportAssembler handles a crawl with nothing evaluated", "[ReportAssembler]") {
    CrawlResult crawl = crawlOf(kTarget, {failedRecord(0, kTarget, 0, FetchOutcome::SkippedRobots)});
    Report report = auditOf(crawl);

    REQUIRE(report.totalFindings == 0);
    REQUIRE(report.worstPages.empty());
    REQUIRE_FALSE(report.scores.overall.has_value());
    for (const auto& section : report.sections) {
        INFO(section.key);
        REQUIRE(section.findings.empty());
        REQUIRE(section.empty);
        REQUIRE(section.emptyMarker == kNoSignificantFindings);
    }
    REQUIRE(report.section(SectionId::OnPageSeo).score->status == ScoreStatus::NotEvaluated);
    REQUIRE(report.crawl.skippedRobots == 1);
    REQUIRE(report.crawl.pagesEvaluated == 0);
}

TEST_CASE("ReportAssembler groups findings per rule", "[ReportAssembler]") {
    std::vector<const Finding*> findings;
    std::vector<Finding> storage = {
        weakness("seo.low", Severity::Low, 0, kTarget),
        weakness("seo.mixed", Severity::Medium, 0, kTarget),
        weakness("seo.mixed", Severity::High, 1, kTarget + "a"),
        weakness("seo.mixed", Severity::Medium, 1, kTarget + "a"),
        weakness("seo.critical", Severity::Critical, 2, kTarget + "b"),
    };
    for (const auto& f : storage) findings.push_back(&f);

    auto groups = ReportAssembler::groupFindings(findings);
    REQUIRE(groups.size() == 3);

    REQUIRE(groups[0].ruleId == "seo.critical");
    REQUIRE(groups[1].ruleId == "seo.mixed");
    REQUIRE(groups[2].ruleId == "seo.low");

    const FindingGroup& mixed = groups[1];
    REQUIRE(mixed.severity == Severity::High);
    REQUIRE(mixed.affectedPages == 2);
    REQUIRE(mixed.affectedUrls == std::vector<std::string>{kTarget, kTarget + "a"});
    REQUIRE(mixed.detail == "detail 0");
    REQUIRE(mixed.firstEvidence.pageIndex == 0);
}

TEST_CASE("ReportAssembler caps affected URLs and section findings", "[ReportAssembler]") {
    std::vector<Finding> storage;
    for (size_t page = 0; page < ReportAssembler::kMaxAffectedUrls + 5; ++page) {
        storage.push_back(weakness("seo.everywhere", Severity::Medium, page, kTarget + "p" + std::to_string(page)));
    }
    for (size_t rule = 0; rule < ReportAssembler::kMaxGroupsPerSection + 3; ++rule) {
        storage.push_back(weakness("seo.rule" + std::to_string(rule), Severity::Low, 0, kTarget, "shared fix"));
    }

    std::vector<const Finding*> findings;
    for (const auto& f : storage) findings.push_back(&f);
    auto groups = ReportAssembler::groupFindings(findings);
    REQUIRE(groups[0].affectedPages == ReportAssembler::kMaxAffectedUrls + 5);
    REQUIRE(groups[0].affectedUrls.size() == ReportAssembler::kMaxAffectedUrls);

    CrawlResult crawl = crawlOf(kTarget, {successRecord(0, kTarget, 0, healthySignals(kTarget))});
    ReportAssembler assembler;
    AuditScorer scorer(RuleSet::createDefault());
    Report report = assembler.assemble(crawl, storage, scorer.score(storage, 1));

    const ReportSection& seo = report.section(SectionId::OnPageSeo);
    REQUIRE(seo.findings.size() == ReportAssembler::kMaxGroupsPerSection);
    // The repeated fix text appears once
    REQUIRE(seo.nextActions.size() == 2);
    REQUIRE(seo.nextActions[0] == "fix seo.everywhere");
    REQUIRE(seo.nextActions[1] == "shared fix");

    REQUIRE(report.section(SectionId::Cover).findings.size() == ReportAssembler::kMaxCoverHeadlines);
    REQUIRE(report.totalFindings == storage.size());
}

TEST_CASE("ReportAssembler ranks the worst pages", "[ReportAssembler]") {
    CrawlResult crawl = crawlOf(kTarget, {
        successRecord(0, kTarget, 0, healthySignals(kTarget)),
        successRecord(1, kTarget + "a", 1, healthySignals(kTarget + "a")),
        successRecord(2, kTarget + "b", 1, healthySignals(kTarget + "b")),
    });

    Finding siteWide = weakness("site.thing", Severity::Critical, 0, kTarget);
    siteWide.siteWide = true;
    Finding strength = weakness("seo.good", Severity::Low, 0, kTarget);
    strength.kind = FindingKind::Strength;

    std::vector<Finding> findings = {
        weakness("seo.one", Severity::Low, 1, kTarget + "a"),
        weakness("seo.two", Severity::Low, 1, kTarget + "a"),
        weakness("seo.big", Severity::High, 2, kTarget + "b"),
        siteWide,
        strength,
    };

    auto ranked = ReportAssembler().rankWorstPages(crawl, findings);
    REQUIRE(ranked.size() == 2);
    REQUIRE(ranked[0].url == kTarget + "b");
    REQUIRE(ranked[0].severityTotal == 20);
    REQUIRE(ranked[1].url == kTarget + "a");
    REQUIRE(ranked[1].issueCount == 2);
    REQUIRE(ranked[1].severityTotal == 8);
    REQUIRE(ranked[1].statusCode == 200);
    REQUIRE(ranked[1].issuesByCategory.at("seo") == 2);
}

TEST_CASE("ReportAssembler counts the appendix aggregates", "[ReportAssembler]") {
    PageSignals hidden = healthySignals(kTarget + "hidden");
    hidden.noindex = true;
    hidden.title.reset();
    hidden.lang.reset();
    hidden.imagesMissingAlt = 3;
    hidden.inputsMissingLabel = 2;

    PageSignals moved = healthySignals(kTarget + "moved");
    moved.metaDescription.reset();
    moved.mixedContentCount = 1;
    moved.redirectCount = 3;
    moved.imagesMissingAlt = 2;

    CrawlResult crawl = crawlOf(kTarget, {
        successRecord(0, kTarget, 0, healthySignals(kTarget)),
        successRecord(1, kTarget + "hidden", 1, hidden),
        successRecord(2, kTarget + "moved", 1, moved),
        failedRecord(3, kTarget + "slow", 1, FetchOutcome::Timeout),
    });
    crawl.linksCheckedInternal = 7;

    Report report = auditOf(crawl);
    const CrawlStats& stats = report.crawl;
    REQUIRE(stats.noindexPages == 1);
    REQUIRE(stats.missingTitle == 1);
    REQUIRE(stats.missingMetaDescription == 1);
    REQUIRE(stats.missingLang == 1);
    REQUIRE(stats.imagesMissingAlt == 5);
    REQUIRE(stats.inputsMissingLabel == 2);
    REQUIRE(stats.mixedContentPages == 1);
    REQUIRE(stats.redirectChainPages == 1);
    REQUIRE(stats.linksCheckedInternal == 7);

    const ReportSection& appendix = report.section(SectionId::WorstPagesAppendix);
    const auto hasNote = [&](const std::string& note) {
        return std::find(appendix.notes.begin(), appendix.notes.end(), note) != appendix.notes.end();
    };
    REQUIRE(hasNote("Pages with noindex: 1"));
    REQUIRE(hasNote("Images without alt: 5"));
    REQUIRE(hasNote("Pages behind a redirect chain: 1"));
    REQUIRE(hasNote("Internal links checked: 7 (0 broken)"));
}

TEST_CASE("ReportAssembler reflects crawl statistics and limits", "[ReportAssembler]") {
    CrawlResult crawl = crawlOf(kTarget, {
        successRecord(0, kTarget, 0, healthySignals(kTarget)),
        failedRecord(1, kTarget + "slow", 1, FetchOutcome::Timeout),
        failedRecord(2, kTarget + "gone", 1, FetchOutcome::Error, 404),
        failedRecord(3, kTarget + "feed", 1, FetchOutcome::SkippedNonHtml, 200),
    });
    crawl.limitNotes.push_back("max runtime reached");
    crawl.linksCrossOrigin = 4;

    Report report = auditOf(crawl);
    REQUIRE(report.partial);
    REQUIRE(report.crawl.pagesAttempted == 4);
    REQUIRE(report.crawl.timeouts == 1);
    REQUIRE(report.crawl.httpErrors == 1);
    REQUIRE(report.crawl.skippedNonHtml == 1);
    REQUIRE(report.crawl.brokenInternalLinks == 1);
    REQUIRE(report.crawl.linksCrossOrigin == 4);
    REQUIRE(report.crawl.maxDepthObserved == 1);

    const ReportSection& overview = report.section(SectionId::SiteOverview);
    REQUIRE_FALSE(overview.empty);
    REQUIRE(std::find(overview.notes.begin(), overview.notes.end(), "Limit: max runtime reached") != overview.notes.end());

    const ReportSection& critical = report.section(SectionId::CriticalBottlenecks);
    REQUIRE_FALSE(critical.empty);
    REQUIRE(critical.findings[0].ruleId == "site.partial-crawl");

    const ReportSection& cover = report.section(SectionId::Cover);
    REQUIRE(cover.notes.size() == 2);
}
