#include "../../include/site_audit/audit/AuditScorer.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace site_audit::audit {

// ===== ScoringConfig =====

double ScoringConfig::penaltyFor(Severity severity) const {
    switch (severity) {
        case Severity::Low: return severityWeights.low;
        case Severity::Medium: return severityWeights.medium;
        case Severity::High: return severityWeights.high;
        case Severity::Critical: return severityWeights.critical;
    }
    return 0.0;
}

double ScoringConfig::weightFor(AuditCategory category) const {
    switch (category) {
        case AuditCategory::Performance: return categoryWeights.performance;
        case AuditCategory::Seo: return categoryWeights.seo;
        case AuditCategory::Ux: return categoryWeights.ux;
        case AuditCategory::Accessibility: return categoryWeights.accessibility;
        case AuditCategory::Conversion: return categoryWeights.conversion;
    }
    return 0.0;
}

ScoringConfig ScoringConfig::createDefault() {
    return ScoringConfig();
}

ScoringConfig ScoringConfig::fromJson(const nlohmann::json& config) {
    ScoringConfig result;
    if (!config.is_object()) {
        throw std::invalid_argument("scoring config must be a JSON object");
    }

    auto readWeight = [](const nlohmann::json& section, const char* key, double& target) {
        if (!section.contains(key)) {
            return;
        }
        if (!section[key].is_number()) {
            throw std::invalid_argument(std::string("scoring weight '") + key + "' must be a number");
        }
        const double value = section[key].get<double>();
        if (value < 0.0 || !std::isfinite(value)) {
            throw std::invalid_argument(std::string("scoring weight '") + key + "' must be non-negative");
        }
        target = value;
    };

    if (config.contains("severityWeights")) {
        const auto& section = config["severityWeights"];
        readWeight(section, "low", result.severityWeights.low);
        readWeight(section, "medium", result.severityWeights.medium);
        readWeight(section, "high", result.severityWeights.high);
        readWeight(section, "critical", result.severityWeights.critical);
    }
    if (config.contains("categoryWeights")) {
        const auto& section = config["categoryWeights"];
        readWeight(section, "performance", result.categoryWeights.performance);
        readWeight(section, "seo", result.categoryWeights.seo);
        readWeight(section, "ux", result.categoryWeights.ux);
        readWeight(section, "accessibility", result.categoryWeights.accessibility);
        readWeight(section, "conversion", result.categoryWeights.conversion);
    }
    if (config.contains("thresholds")) {
        const auto& section = config["thresholds"];
        result.thresholds.critical = section.value("critical", result.thresholds.critical);
        result.thresholds.attention = section.value("attention", result.thresholds.attention);
    }

    if (result.thresholds.critical > result.thresholds.attention ||
        result.thresholds.critical < kScoreMin || result.thresholds.attention > kScoreMax) {
        throw std::invalid_argument("scoring thresholds must satisfy 0 <= critical <= attention <= 100");
    }
    return result;
}

nlohmann::json ScoringConfig::toJson() const {
    return nlohmann::json{
        {"severityWeights", {
            {"low", severityWeights.low},
            {"medium", severityWeights.medium},
            {"high", severityWeights.high},
            {"critical", severityWeights.critical}
        }},
        {"categoryWeights", {
            {"performance", categoryWeights.performance},
            {"seo", categoryWeights.seo},
            {"ux", categoryWeights.ux},
            {"accessibility", categoryWeights.accessibility},
            {"conversion", categoryWeights.conversion}
        }},
        {"thresholds", {
            {"critical", thresholds.critical},
            {"attention", thresholds.attention}
        }}
    };
}

// ===== AuditScorer =====

AuditScorer::AuditScorer(std::shared_ptr<const RuleSet> rules, const ScoringConfig& config)
    : rules_(std::move(rules))
    , config_(config) {
    if (!rules_) {
        throw std::invalid_argument("AuditScorer requires a rule set");
    }
}

double AuditScorer::penaltyOf(const Finding& finding) const {
    return isPenalized(finding.kind) ? config_.penaltyFor(finding.severity) : 0.0;
}

ScoreStatus AuditScorer::statusFor(int value, bool hasCriticalFinding) const {
    if (hasCriticalFinding || value < config_.thresholds.critical) {
        return ScoreStatus::Critical;
    }
    if (value < config_.thresholds.attention) {
        return ScoreStatus::Attention;
    }
    return ScoreStatus::Ok;
}

ScoreCard AuditScorer::score(const std::vector<Finding>& findings, size_t evaluatedPages) const {
    ScoreCard card;
    bool anyCritical = false;
    double weightedSum = 0.0;
    double weightTotal = 0.0;

    for (AuditCategory category : kAllCategories) {
        CategoryScore score;
        score.category = category;

        bool criticalFinding = false;
        for (const auto& finding : findings) {
            if (finding.category != category) {
                continue;
            }
            ++score.findingCount;
            if (isPenalized(finding.kind)) {
                ++score.weaknessCount;
                score.penalty += config_.penaltyFor(finding.severity);
                if (finding.severity == Severity::Critical) {
                    criticalFinding = true;
                }
            }
        }

        if (evaluatedPages > 0) {
            score.capacity = static_cast<double>(evaluatedPages) * rules_->pageWeight(category, config_) +
                             rules_->siteWeight(category, config_);
        }

        if (score.capacity > 0.0) {
            const double raw = 100.0 * (1.0 - score.penalty / score.capacity);
            score.value = std::clamp(static_cast<int>(std::lround(raw)), kScoreMin, kScoreMax);
            score.status = statusFor(*score.value, criticalFinding);
            anyCritical = anyCritical || criticalFinding;

            const double weight = config_.weightFor(category);
            weightedSum += weight * *score.value;
            weightTotal += weight;
        }

        card.categories.push_back(score);
    }

    if (weightTotal > 0.0) {
        card.overall = std::clamp(static_cast<int>(std::lround(weightedSum / weightTotal)), kScoreMin, kScoreMax);
        card.overallStatus = statusFor(*card.overall, anyCritical);
    }

    LOG_DEBUG("Scored " + std::to_string(findings.size()) + " findings over " +
              std::to_string(evaluatedPages) + " pages, overall=" +
              (card.overall ? std::to_string(*card.overall) : std::string("n/a")));
    return card;
}

} // namespace site_audit::audit
