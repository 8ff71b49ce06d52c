#include <catch2/catch_test_macros.hpp>
#include "../../include/site_audit/audit/AuditScorer.h"
#include "../../include/site_audit/audit/RuleSet.h"
#include "CrawlFixtures.h"
#include <set>
#include <stdexcept>

using namespace site_audit;
using namespace site_audit::audit;
using site_audit::testing::healthySignals;

namespace {

std::unique_ptr<AuditRule> alwaysFires(const std::string& id, AuditCategory category, FindingKind kind,
                                       Severity maxSeverity, Severity reported) {
    return std::make_unique<PageCheckRule>(
        RuleInfo{id, category, kind, maxSeverity, "Title of " + id, "Fix " + id},
        [reported](const PageSignals&) -> std::optional<RuleHit> {
            return RuleHit{reported, "detail", "metric"};
        });
}

std::vector<Finding> runPageRules(const RuleSet& rules, const PageSignals& signals) {
    std::vector<Finding> findings;
    for (const auto& rule : rules.pageRules()) {
        if (auto finding = rule->evaluate(signals)) {
            findings.push_back(*finding);
        }
    }
    return findings;
}

bool hasRule(const std::vector<Finding>& findings, const std::string& id) {
    for (const auto& finding : findings) {
        if (finding.ruleId == id) return true;
    }
    return false;
}

} // namespace

TEST_CASE("RuleSet keeps rules in insertion order with unique ids", "[RuleSet]") {
    RuleSet rules;
    rules.addPageRule(alwaysFires("b.second", AuditCategory::Seo, FindingKind::Weakness, Severity::Low, Severity::Low));
    rules.addPageRule(alwaysFires("a.first", AuditCategory::Ux, FindingKind::Weakness, Severity::Low, Severity::Low));

    REQUIRE(rules.size() == 2);
    REQUIRE(rules.pageRules()[0]->info().id == "b.second");
    REQUIRE(rules.pageRules()[1]->info().id == "a.first");

    REQUIRE_THROWS_AS(
        rules.addPageRule(alwaysFires("a.first", AuditCategory::Seo, FindingKind::Weakness, Severity::Low, Severity::Low)),
        std::invalid_argument);
    REQUIRE_THROWS_AS(rules.addPageRule(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(rules.addSiteRule(nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(PageCheckRule(RuleInfo{"empty.check"}, nullptr), std::invalid_argument);
}

TEST_CASE("Rules never report worse than their declared severity", "[RuleSet]") {
    auto rule = alwaysFires("seo.capped", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium, Severity::Critical);
    auto finding = rule->evaluate(PageSignals{});

    REQUIRE(finding.has_value());
    REQUIRE(finding->severity == Severity::Medium);
    REQUIRE(finding->ruleId == "seo.capped");
    REQUIRE(finding->title == "Title of seo.capped");
    REQUIRE(finding->howToFix == "Fix seo.capped");
    REQUIRE(finding->evidence.metric == "metric");
    REQUIRE_FALSE(finding->siteWide);
}

TEST_CASE("RuleSet weights only penalized kinds", "[RuleSet]") {
    const ScoringConfig config = ScoringConfig::createDefault();
    RuleSet rules;
    rules.addPageRule(alwaysFires("seo.w", AuditCategory::Seo, FindingKind::Weakness, Severity::High, Severity::High));
    rules.addPageRule(alwaysFires("seo.c", AuditCategory::Seo, FindingKind::CriticalBottleneck, Severity::Medium, Severity::Medium));
    rules.addPageRule(alwaysFires("seo.s", AuditCategory::Seo, FindingKind::Strength, Severity::Low, Severity::Low));
    rules.addPageRule(alwaysFires("seo.o", AuditCategory::Seo, FindingKind::Opportunity, Severity::Low, Severity::Low));
    rules.addSiteRule(std::make_unique<SiteCheckRule>(
        RuleInfo{"site.w", AuditCategory::Seo, FindingKind::Weakness, Severity::Critical, "Site", "Fix"},
        [](const CrawlResult&) -> std::optional<RuleHit> { return std::nullopt; }));

    REQUIRE(rules.pageWeight(AuditCategory::Seo, config) == config.severityWeights.high + config.severityWeights.medium);
    REQUIRE(rules.siteWeight(AuditCategory::Seo, config) == config.severityWeights.critical);
    REQUIRE(rules.pageWeight(AuditCategory::Ux, config) == 0.0);
}

TEST_CASE("Default rules cover every category", "[RuleSet]") {
    auto rules = RuleSet::createDefault();
    const ScoringConfig config = ScoringConfig::createDefault();

    std::set<std::string> ids;
    for (const auto& rule : rules->pageRules()) ids.insert(rule->info().id);
    for (const auto& rule : rules->siteRules()) ids.insert(rule->info().id);
    REQUIRE(ids.size() == rules->size());
    REQUIRE_FALSE(rules->siteRules().empty());

    for (AuditCategory category : kAllCategories) {
        INFO(categoryToString(category));
        REQUIRE(rules->pageWeight(category, config) > 0.0);
    }
}

TEST_CASE("Default rules stay quiet on a healthy page", "[RuleSet]") {
    auto rules = RuleSet::createDefault();
    auto findings = runPageRules(*rules, healthySignals("https://example.com/"));

    for (const auto& finding : findings) {
        INFO(finding.ruleId);
        REQUIRE(finding.kind == FindingKind::Strength);
    }
    REQUIRE(hasRule(findings, "performance.fast-response"));
    REQUIRE(hasRule(findings, "seo.well-formed"));
    REQUIRE(hasRule(findings, "conversion.clear-cta"));
}

TEST_CASE("Default rules flag common page problems", "[RuleSet]") {
    auto rules = RuleSet::createDefault();
    PageSignals signals = healthySignals("https://example.com/");

    SECTION("Missing title hurts SEO and accessibility") {
        signals.title.reset();
        auto findings = runPageRules(*rules, signals);
        REQUIRE(hasRule(findings, "seo.title-missing"));
        REQUIRE(hasRule(findings, "accessibility.page-title"));
        REQUIRE_FALSE(hasRule(findings, "seo.well-formed"));
    }

    SECTION("Accented titles are measured in characters") {
        // 57 characters, 68 bytes
        signals.title = "Órgãos Públicos São Paulo Ação Educação Informação Região";
        auto findings = runPageRules(*rules, signals);
        REQUIRE_FALSE(hasRule(findings, "seo.title-length"));
    }

    SECTION("Slow responses escalate with latency") {
        signals.responseTime = std::chrono::milliseconds(1800);
        auto medium = runPageRules(*rules, signals);
        REQUIRE(hasRule(medium, "performance.slow-response"));
        REQUIRE_FALSE(hasRule(medium, "performance.fast-response"));

        signals.responseTime = std::chrono::milliseconds(4000);
        for (const auto& finding : runPageRules(*rules, signals)) {
            if (finding.ruleId == "performance.slow-response") {
                REQUIRE(finding.severity == Severity::High);
            }
        }
    }

    SECTION("Noindex and mixed content are critical bottlenecks") {
        signals.noindex = true;
        signals.metaRobots = "noindex";
        signals.mixedContentCount = 2;
        auto findings = runPageRules(*rules, signals);
        size_t bottlenecks = 0;
        for (const auto& finding : findings) {
            if (finding.kind == FindingKind::CriticalBottleneck) ++bottlenecks;
        }
        REQUIRE(bottlenecks == 2);
    }

    SECTION("Canonical to another origin") {
        signals.canonical = "https://mirror.example.net/";
        REQUIRE(hasRule(runPageRules(*rules, signals), "seo.canonical-cross-origin"));
    }

    SECTION("Unlabelled inputs and missing alt text") {
        signals.inputsTotal = 3;
        signals.inputsMissingLabel = 2;
        signals.imagesTotal = 4;
        signals.imagesMissingAlt = 1;
        auto findings = runPageRules(*rules, signals);
        REQUIRE(hasRule(findings, "accessibility.input-label"));
        REQUIRE(hasRule(findings, "accessibility.image-alt"));
        REQUIRE_FALSE(hasRule(findings, "accessibility.alt-coverage"));
    }

    SECTION("No call to action or contact channel") {
        signals.ctaCount = 0;
        signals.formCount = 0;
        auto findings = runPageRules(*rules, signals);
        REQUIRE(hasRule(findings, "conversion.cta-missing"));
        REQUIRE(hasRule(findings, "conversion.contact-channel"));
        REQUIRE_FALSE(hasRule(findings, "conversion.clear-cta"));
    }
}
