#pragma once

#include <memory>
#include <vector>
#include "RuleSet.h"
#include "../models/CrawlResult.h"
#include "../models/Finding.h"

namespace site_audit::audit {

// Runs the rule set over crawl output and stamps evidence on each finding
class Classifier {
public:
    explicit Classifier(std::shared_ptr<const RuleSet> rules);

    // Empty for records without signals
    std::vector<Finding> classify(const PageRecord& record) const;

    // Page findings in PageRecord order
    std::vector<Finding> classifyAll(const std::vector<PageRecord>& pages) const;

    // Site-wide findings; none when no page could be evaluated
    std::vector<Finding> classifySite(const CrawlResult& crawl) const;

    // classifyAll followed by classifySite
    std::vector<Finding> classifyCrawl(const CrawlResult& crawl) const;

    const RuleSet& rules() const { return *rules_; }

private:
    std::shared_ptr<const RuleSet> rules_;
};

} // namespace site_audit::audit
