#include "../../include/site_audit/audit/AuditRule.h"
#include <stdexcept>

namespace site_audit::audit {

Finding RuleBase::makeFinding(const RuleHit& hit) const {
    Finding finding;
    finding.ruleId = info_.id;
    finding.category = info_.category;
    finding.kind = info_.kind;
    // A rule never reports worse than it declared, capacity depends on it
    finding.severity = static_cast<int>(hit.severity) > static_cast<int>(info_.maxSeverity)
                           ? info_.maxSeverity
                           : hit.severity;
    finding.title = info_.title;
    finding.detail = hit.detail;
    finding.howToFix = info_.howToFix;
    finding.evidence.metric = hit.metric;
    return finding;
}

PageCheckRule::PageCheckRule(RuleInfo info, Check check)
    : AuditRule(std::move(info))
    , check_(std::move(check)) {
    if (!check_) {
        throw std::invalid_argument("rule " + this->info().id + " has no check");
    }
}

std::optional<Finding> PageCheckRule::evaluate(const PageSignals& signals) const {
    auto hit = check_(signals);
    if (!hit) {
        return std::nullopt;
    }
    return makeFinding(*hit);
}

SiteCheckRule::SiteCheckRule(RuleInfo info, Check check)
    : SiteRule(std::move(info))
    , check_(std::move(check)) {
    if (!check_) {
        throw std::invalid_argument("rule " + this->info().id + " has no check");
    }
}

std::optional<Finding> SiteCheckRule::evaluate(const CrawlResult& crawl) const {
    auto hit = check_(crawl);
    if (!hit) {
        return std::nullopt;
    }
    return makeFinding(*hit);
}

} // namespace site_audit::audit
