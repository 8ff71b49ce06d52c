#include "../../include/site_audit/audit/RuleSet.h"
#include "../../include/site_audit/audit/AuditScorer.h"
#include <stdexcept>

namespace site_audit::audit {

void RuleSet::addPageRule(std::unique_ptr<AuditRule> rule) {
    if (!rule) {
        throw std::invalid_argument("null page rule");
    }
    ensureUniqueId(rule->info().id);
    pageRules_.push_back(std::move(rule));
}

void RuleSet::addSiteRule(std::unique_ptr<SiteRule> rule) {
    if (!rule) {
        throw std::invalid_argument("null site rule");
    }
    ensureUniqueId(rule->info().id);
    siteRules_.push_back(std::move(rule));
}

double RuleSet::pageWeight(AuditCategory category, const ScoringConfig& config) const {
    double weight = 0.0;
    for (const auto& rule : pageRules_) {
        const RuleInfo& info = rule->info();
        if (info.category == category && isPenalized(info.kind)) {
            weight += config.penaltyFor(info.maxSeverity);
        }
    }
    return weight;
}

double RuleSet::siteWeight(AuditCategory category, const ScoringConfig& config) const {
    double weight = 0.0;
    for (const auto& rule : siteRules_) {
        const RuleInfo& info = rule->info();
        if (info.category == category && isPenalized(info.kind)) {
            weight += config.penaltyFor(info.maxSeverity);
        }
    }
    return weight;
}

void RuleSet::ensureUniqueId(const std::string& id) const {
    for (const auto& rule : pageRules_) {
        if (rule->info().id == id) throw std::invalid_argument("duplicate rule id: " + id);
    }
    for (const auto& rule : siteRules_) {
        if (rule->info().id == id) throw std::invalid_argument("duplicate rule id: " + id);
    }
}

} // namespace site_audit::audit
