#include <catch2/catch_test_macros.hpp>
#include "../../include/site_audit/audit/AuditScorer.h"
#include <stdexcept>

using namespace site_audit;
using namespace site_audit::audit;

namespace {

void addRule(RuleSet& rules, const std::string& id, AuditCategory category, FindingKind kind, Severity maxSeverity) {
    rules.addPageRule(std::make_unique<PageCheckRule>(
        RuleInfo{id, category, kind, maxSeverity, id, "fix " + id},
        [](const PageSignals&) -> std::optional<RuleHit> { return std::nullopt; }));
}

// SEO: one High (20) and one Medium (10) weakness per page; UX: one Critical (35) weakness
std::shared_ptr<const RuleSet> scoringRules() {
    auto rules = std::make_shared<RuleSet>();
    addRule(*rules, "seo.high", AuditCategory::Seo, FindingKind::Weakness, Severity::High);
    addRule(*rules, "seo.medium", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium);
    addRule(*rules, "seo.strength", AuditCategory::Seo, FindingKind::Strength, Severity::Low);
    addRule(*rules, "ux.critical", AuditCategory::Ux, FindingKind::CriticalBottleneck, Severity::Critical);
    return rules;
}

Finding finding(const std::string& ruleId, AuditCategory category, FindingKind kind, Severity severity,
                size_t pageIndex = 0) {
    Finding f;
    f.ruleId = ruleId;
    f.category = category;
    f.kind = kind;
    f.severity = severity;
    f.title = ruleId;
    f.evidence.pageIndex = pageIndex;
    return f;
}

} // namespace

TEST_CASE("AuditScorer leaves everything unevaluated without pages", "[AuditScorer]") {
    AuditScorer scorer(scoringRules());
    ScoreCard card = scorer.score({}, 0);

    REQUIRE(card.categories.size() == kAllCategories.size());
    for (const auto& score : card.categories) {
        REQUIRE_FALSE(score.value.has_value());
        REQUIRE(score.status == ScoreStatus::NotEvaluated);
    }
    REQUIRE_FALSE(card.overall.has_value());
    REQUIRE(card.overallStatus == ScoreStatus::NotEvaluated);
}

TEST_CASE("AuditScorer gives full marks when nothing is wrong", "[AuditScorer]") {
    AuditScorer scorer(scoringRules());
    ScoreCard card = scorer.score({finding("seo.strength", AuditCategory::Seo, FindingKind::Strength, Severity::Low)}, 3);

    const CategoryScore& seo = card.forCategory(AuditCategory::Seo);
    REQUIRE(seo.value == std::optional<int>(100));
    REQUIRE(seo.status == ScoreStatus::Ok);
    REQUIRE(seo.findingCount == 1);
    REQUIRE(seo.weaknessCount == 0);

    // Categories without penalized rules have no capacity and stay unevaluated
    REQUIRE_FALSE(card.forCategory(AuditCategory::Conversion).value.has_value());
    REQUIRE(card.overall == std::optional<int>(100));
    REQUIRE(card.overallStatus == ScoreStatus::Ok);
}

TEST_CASE("AuditScorer scales penalties by evaluated capacity", "[AuditScorer]") {
    AuditScorer scorer(scoringRules());

    SECTION("One page, one high finding") {
        // 100 * (1 - 20 / 30)
        ScoreCard card = scorer.score({finding("seo.high", AuditCategory::Seo, FindingKind::Weakness, Severity::High)}, 1);
        const CategoryScore& seo = card.forCategory(AuditCategory::Seo);
        REQUIRE(seo.value == std::optional<int>(33));
        REQUIRE(seo.status == ScoreStatus::Critical);
        REQUIRE(seo.capacity == 30.0);
        REQUIRE(seo.penalty == 20.0);
    }

    SECTION("Two pages, one medium finding") {
        // 100 * (1 - 10 / 60)
        ScoreCard card = scorer.score({finding("seo.medium", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium)}, 2);
        REQUIRE(card.forCategory(AuditCategory::Seo).value == std::optional<int>(83));
        REQUIRE(card.forCategory(AuditCategory::Seo).status == ScoreStatus::Attention);
    }

    SECTION("Penalties beyond capacity clamp at zero") {
        std::vector<Finding> findings;
        for (int i = 0; i < 5; ++i) {
            findings.push_back(finding("seo.high", AuditCategory::Seo, FindingKind::Weakness, Severity::High));
        }
        ScoreCard card = scorer.score(findings, 1);
        REQUIRE(card.forCategory(AuditCategory::Seo).value == std::optional<int>(0));
    }
}

TEST_CASE("AuditScorer marks categories with critical findings as critical", "[AuditScorer]") {
    AuditScorer scorer(scoringRules());
    // 100 * (1 - 35 / 350) = 90, still critical because of the finding's severity
    ScoreCard card = scorer.score({finding("ux.critical", AuditCategory::Ux, FindingKind::CriticalBottleneck,
                                           Severity::Critical)}, 10);

    const CategoryScore& ux = card.forCategory(AuditCategory::Ux);
    REQUIRE(ux.value == std::optional<int>(90));
    REQUIRE(ux.status == ScoreStatus::Critical);
    REQUIRE(card.overallStatus == ScoreStatus::Critical);
    REQUIRE(card.forCategory(AuditCategory::Seo).status == ScoreStatus::Ok);
}

TEST_CASE("AuditScorer weights the overall score by category", "[AuditScorer]") {
    AuditScorer scorer(scoringRules());
    // SEO 33 (weight 0.25), UX 100 (weight 0.20): (0.25 * 33 + 0.20 * 100) / 0.45 = 62.8
    ScoreCard card = scorer.score({finding("seo.high", AuditCategory::Seo, FindingKind::Weakness, Severity::High)}, 1);
    REQUIRE(card.overall == std::optional<int>(63));
    REQUIRE(card.overallStatus == ScoreStatus::Attention);
}

TEST_CASE("AuditScorer penalty of a finding", "[AuditScorer]") {
    AuditScorer scorer(scoringRules());
    REQUIRE(scorer.penaltyOf(finding("x", AuditCategory::Seo, FindingKind::Weakness, Severity::Medium)) == 10.0);
    REQUIRE(scorer.penaltyOf(finding("x", AuditCategory::Seo, FindingKind::Opportunity, Severity::Medium)) == 0.0);
    REQUIRE(scorer.penaltyOf(finding("x", AuditCategory::Seo, FindingKind::Strength, Severity::Low)) == 0.0);
}

TEST_CASE("ScoringConfig reads partial JSON overrides", "[ScoringConfig]") {
    auto config = ScoringConfig::fromJson(nlohmann::json::parse(R"({
        "severityWeights": {"high": 25},
        "thresholds": {"critical": 50}
    })"));

    REQUIRE(config.severityWeights.high == 25.0);
    REQUIRE(config.severityWeights.low == 4.0);
    REQUIRE(config.thresholds.critical == 50);
    REQUIRE(config.thresholds.attention == 85);
    REQUIRE(config.toJson()["severityWeights"]["high"] == 25.0);

    REQUIRE_THROWS_AS(ScoringConfig::fromJson(nlohmann::json::parse(R"({"severityWeights": {"low": -1}})")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(ScoringConfig::fromJson(nlohmann::json::parse(R"({"categoryWeights": {"seo": "high"}})")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(ScoringConfig::fromJson(nlohmann::json::parse(R"({"thresholds": {"critical": 90, "attention": 80}})")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(ScoringConfig::fromJson(nlohmann::json::array()), std::invalid_argument);
}

TEST_CASE("AuditScorer requires a rule set", "[AuditScorer]") {
    REQUIRE_THROWS_AS(AuditScorer(nullptr), std::invalid_argument);
}
