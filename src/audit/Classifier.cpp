#include "../../include/site_audit/audit/Classifier.h"
#include "../../include/Logger.h"
#include <stdexcept>

namespace site_audit::audit {

Classifier::Classifier(std::shared_ptr<const RuleSet> rules)
    : rules_(std::move(rules)) {
    if (!rules_) {
        throw std::invalid_argument("Classifier requires a rule set");
    }
}

std::vector<Finding> Classifier::classify(const PageRecord& record) const {
    std::vector<Finding> findings;
    if (!record.signals) {
        return findings;
    }

    for (const auto& rule : rules_->pageRules()) {
        auto finding = rule->evaluate(*record.signals);
        if (!finding) {
            continue;
        }
        finding->evidence.pageIndex = record.index;
        finding->evidence.url = record.url;
        findings.push_back(std::move(*finding));
    }

    LOG_TRACE("Classified " + record.url + ": " + std::to_string(findings.size()) + " findings");
    return findings;
}

std::vector<Finding> Classifier::classifyAll(const std::vector<PageRecord>& pages) const {
    std::vector<Finding> findings;
    for (const auto& page : pages) {
        auto pageFindings = classify(page);
        findings.insert(findings.end(),
                        std::make_move_iterator(pageFindings.begin()),
                        std::make_move_iterator(pageFindings.end()));
    }
    return findings;
}

std::vector<Finding> Classifier::classifySite(const CrawlResult& crawl) const {
    std::vector<Finding> findings;
    if (crawl.evaluatedPageCount() == 0 || crawl.pages.empty()) {
        return findings;
    }

    const PageRecord& seed = crawl.pages.front();
    for (const auto& rule : rules_->siteRules()) {
        auto finding = rule->evaluate(crawl);
        if (!finding) {
            continue;
        }
        finding->evidence.pageIndex = seed.index;
        finding->evidence.url = seed.url;
        finding->siteWide = true;
        findings.push_back(std::move(*finding));
    }
    return findings;
}

std::vector<Finding> Classifier::classifyCrawl(const CrawlResult& crawl) const {
    std::vector<Finding> findings = classifyAll(crawl.pages);
    auto siteFindings = classifySite(crawl);
    findings.insert(findings.end(),
                    std::make_move_iterator(siteFindings.begin()),
                    std::make_move_iterator(siteFindings.end()));

    LOG_DEBUG("Classified crawl of " + crawl.request.targetUrl + ": " +
              std::to_string(findings.size()) + " findings (" +
              std::to_string(siteFindings.size()) + " site-wide)");
    return findings;
}

} // namespace site_audit::audit
