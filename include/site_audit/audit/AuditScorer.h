#pragma once

#include <map>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "RuleSet.h"
#include "../models/Finding.h"
#include "../models/ScoreCard.h"

namespace site_audit::audit {

struct ScoringConfig {
    // Penalty added per finding of the given severity
    struct SeverityWeights {
        double low = 4.0;
        double medium = 10.0;
        double high = 20.0;
        double critical = 35.0;
    } severityWeights;

    // Share of each category in the overall score
    struct CategoryWeights {
        double performance = 0.20;
        double seo = 0.25;
        double ux = 0.20;
        double accessibility = 0.15;
        double conversion = 0.20;
    } categoryWeights;

    struct StatusThresholds {
        int critical = 60;    // below -> critical
        int attention = 85;   // below -> attention
    } thresholds;

    double penaltyFor(Severity severity) const;
    double weightFor(AuditCategory category) const;

    static ScoringConfig createDefault();

    // Missing keys keep their defaults. Throws std::invalid_argument on negative
    // weights or inverted thresholds.
    static ScoringConfig fromJson(const nlohmann::json& config);
    nlohmann::json toJson() const;
};

// Turns findings into bounded per-category scores and a weighted overall score
class AuditScorer {
public:
    explicit AuditScorer(std::shared_ptr<const RuleSet> rules,
                         const ScoringConfig& config = ScoringConfig::createDefault());

    ScoreCard score(const std::vector<Finding>& findings, size_t evaluatedPages) const;

    const ScoringConfig& config() const { return config_; }

    // Severity-weighted sum used to rank pages
    double penaltyOf(const Finding& finding) const;

private:
    ScoreStatus statusFor(int value, bool hasCriticalFinding) const;

    std::shared_ptr<const RuleSet> rules_;
    ScoringConfig config_;
};

} // namespace site_audit::audit
