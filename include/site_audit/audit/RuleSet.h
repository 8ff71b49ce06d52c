#pragma once

#include <memory>
#include <string>
#include <vector>
#include "AuditRule.h"

namespace site_audit::audit {

struct ScoringConfig;

// Ordered, immutable-after-construction list of page and site rules.
// Rules run in insertion order; new rules are appended.
class RuleSet {
public:
    RuleSet() = default;

    void addPageRule(std::unique_ptr<AuditRule> rule);
    void addSiteRule(std::unique_ptr<SiteRule> rule);

    const std::vector<std::unique_ptr<AuditRule>>& pageRules() const { return pageRules_; }
    const std::vector<std::unique_ptr<SiteRule>>& siteRules() const { return siteRules_; }

    // Worst-case penalty one page can add to a category
    double pageWeight(AuditCategory category, const ScoringConfig& config) const;

    // Worst-case penalty the site-level rules can add to a category
    double siteWeight(AuditCategory category, const ScoringConfig& config) const;

    size_t size() const { return pageRules_.size() + siteRules_.size(); }

    // The built-in audit rules
    static std::shared_ptr<const RuleSet> createDefault();

private:
    void ensureUniqueId(const std::string& id) const;

    std::vector<std::unique_ptr<AuditRule>> pageRules_;
    std::vector<std::unique_ptr<SiteRule>> siteRules_;
};

} // namespace site_audit::audit
