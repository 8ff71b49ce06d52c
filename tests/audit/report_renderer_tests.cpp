#include <catch2/catch_test_macros.hpp>
#include "../../include/site_audit/audit/AuditScorer.h"
#include "../../include/site_audit/audit/Classifier.h"
#include "../../include/site_audit/audit/ReportAssembler.h"
#include "../../include/site_audit/audit/ReportRenderer.h"
#include "CrawlFixtures.h"

using namespace site_audit;
using namespace site_audit::audit;
using namespace site_audit::testing;
using json = nlohmann::json;

namespace {

const std::string kTarget = "https://example.com/";

Report sampleReport() {
    PageSignals untitled = healthySignals(kTarget + "about");
    untitled.title.reset();

    CrawlResult crawl = crawlOf(kTarget, {
        successRecord(0, kTarget, 0, healthySignals(kTarget)),
        successRecord(1, kTarget + "about", 1, untitled),
        failedRecord(2, kTarget + "slow", 1, FetchOutcome::Timeout),
    });
    crawl.sitemapPresent.reset();

    auto rules = RuleSet::createDefault();
    auto findings = Classifier(rules).classifyCrawl(crawl);
    return ReportAssembler().assemble(crawl, findings, AuditScorer(rules).score(findings, crawl.evaluatedPageCount()));
}

} // namespace

TEST_CASE("ReportRenderer produces the JSON document", "[ReportRenderer]") {
    Report report = sampleReport();
    json out = ReportRenderer::toJson(report);

    REQUIRE(out["url"] == kTarget);
    REQUIRE(out["profile"] == "full");
    REQUIRE(out["partial"] == false);
    REQUIRE(out["total_findings"] == report.totalFindings);
    REQUIRE(out["generated_at"] == report.generatedAt);

    REQUIRE(out["crawl"]["pages_attempted"] == 3);
    REQUIRE(out["crawl"]["pages_evaluated"] == 2);
    REQUIRE(out["crawl"]["timeouts"] == 1);
    REQUIRE(out["crawl"]["sitemap_present"].is_null());
    REQUIRE(out["crawl"]["budget"]["max_pages"] == 150);

    REQUIRE(out["scores"]["overall"].is_number_integer());
    REQUIRE(out["scores"]["categories"].size() == kAllCategories.size());
    REQUIRE(out["scores"]["categories"].contains("accessibility"));

    const json& sections = out["sections"];
    REQUIRE(sections.size() == kReportSectionOrder.size());
    REQUIRE(sections[0]["key"] == "cover");
    REQUIRE(sections[11]["key"] == "worst_pages_appendix");
    REQUIRE(out["worst_pages"].size() == 1);
    REQUIRE(out["worst_pages"][0]["url"] == kTarget + "about");
}

TEST_CASE("ReportRenderer writes the appendix counters and data origin", "[ReportRenderer]") {
    Report report = sampleReport();

    json fresh = ReportRenderer::toJson(report);
    REQUIRE(fresh["data_origin"] == "fresh");
    REQUIRE(fresh["crawl"]["links_checked_internal"] == 2);
    REQUIRE(fresh["crawl"]["budget"]["max_link_checks"] == 400);

    const json& appendix = fresh["crawl"]["appendix"];
    REQUIRE(appendix["missing_title"] == 1);
    REQUIRE(appendix["missing_meta_description"] == 0);
    REQUIRE(appendix["noindex_pages"] == 0);
    REQUIRE(appendix["images_missing_alt"] == 0);
    REQUIRE(appendix["redirect_chain_pages"] == 0);

    report.fromCache = true;
    REQUIRE(ReportRenderer::toJson(report)["data_origin"] == "cache");
    REQUIRE(ReportRenderer::toText(report).find("| CACHED") != std::string::npos);
}

TEST_CASE("ReportRenderer marks empty sections", "[ReportRenderer]") {
    Report report = sampleReport();
    json out = ReportRenderer::toJson(report);

    for (const auto& section : out["sections"]) {
        INFO(section["key"].get<std::string>());
        if (section["empty"].get<bool>()) {
            REQUIRE(section["empty_marker"] == kNoSignificantFindings);
            REQUIRE(section["findings"].empty());
        } else {
            REQUIRE_FALSE(section.contains("empty_marker"));
        }
    }

    const json seo = ReportRenderer::toJson(report.section(SectionId::OnPageSeo));
    REQUIRE(seo.contains("score"));
    REQUIRE(seo["status"].is_string());
    REQUIRE_FALSE(seo["findings"].empty());
    REQUIRE(seo["findings"][0]["rule_id"] == "seo.title-missing");
    REQUIRE(seo["findings"][0]["evidence"]["url"] == kTarget + "about");

    const json strengths = ReportRenderer::toJson(report.section(SectionId::Strengths));
    REQUIRE_FALSE(strengths.contains("score"));
}

TEST_CASE("ReportRenderer writes unevaluated scores as null", "[ReportRenderer]") {
    ScoreCard card;
    CategoryScore unevaluated;
    unevaluated.category = AuditCategory::Conversion;
    card.categories.push_back(unevaluated);

    json out = ReportRenderer::toJson(card);
    REQUIRE(out["overall"].is_null());
    REQUIRE(out["overall_status"] == "not-evaluated");
    REQUIRE(out["categories"]["conversion"]["score"].is_null());
}

TEST_CASE("ReportRenderer produces a readable text report", "[ReportRenderer]") {
    Report report = sampleReport();
    const std::string text = ReportRenderer::toText(report);

    REQUIRE(text.rfind("SITE AUDIT: " + kTarget, 0) == 0);
    REQUIRE(text.find("1. Cover") != std::string::npos);
    REQUIRE(text.find("12. Appendix: Worst Pages") != std::string::npos);
    REQUIRE(text.find("Missing page title") != std::string::npos);
    REQUIRE(text.find(kNoSignificantFindings) != std::string::npos);
    REQUIRE(text.find("PARTIAL") == std::string::npos);
}
