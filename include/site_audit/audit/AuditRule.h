#pragma once

#include <functional>
#include <optional>
#include <string>
#include "../models/CrawlResult.h"
#include "../models/Finding.h"
#include "../models/PageSignals.h"

namespace site_audit::audit {

// Static description of a rule; the scorer derives category capacity from it
struct RuleInfo {
    std::string id;
    AuditCategory category = AuditCategory::Seo;
    FindingKind kind = FindingKind::Weakness;
    Severity maxSeverity = Severity::Low;   // worst severity the rule can emit
    std::string title;
    std::string howToFix;
};

// What a check reports when it fires
struct RuleHit {
    Severity severity = Severity::Low;
    std::string detail;
    std::string metric;
};

class RuleBase {
public:
    explicit RuleBase(RuleInfo info) : info_(std::move(info)) {}
    virtual ~RuleBase() = default;

    const RuleInfo& info() const { return info_; }

protected:
    // Evidence is left for the caller to stamp
    Finding makeFinding(const RuleHit& hit) const;

private:
    RuleInfo info_;
};

// Evaluated once per page with extracted signals
class AuditRule : public RuleBase {
public:
    using RuleBase::RuleBase;

    virtual std::optional<Finding> evaluate(const PageSignals& signals) const = 0;
};

// Evaluated once per crawl against site-wide facts
class SiteRule : public RuleBase {
public:
    using RuleBase::RuleBase;

    virtual std::optional<Finding> evaluate(const CrawlResult& crawl) const = 0;
};

// Page rule backed by a check function
class PageCheckRule : public AuditRule {
public:
    using Check = std::function<std::optional<RuleHit>(const PageSignals&)>;

    PageCheckRule(RuleInfo info, Check check);

    std::optional<Finding> evaluate(const PageSignals& signals) const override;

private:
    Check check_;
};

// Site rule backed by a check function
class SiteCheckRule : public SiteRule {
public:
    using Check = std::function<std::optional<RuleHit>(const CrawlResult&)>;

    SiteCheckRule(RuleInfo info, Check check);

    std::optional<Finding> evaluate(const CrawlResult& crawl) const override;

private:
    Check check_;
};

} // namespace site_audit::audit
