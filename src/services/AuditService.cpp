#include "../../include/site_audit/services/AuditService.h"
#include "../../include/site_audit/services/ExecutiveSummaryBuilder.h"
#include "../../include/site_audit/audit/Classifier.h"
#include "../../include/site_audit/audit/ReportAssembler.h"
#include "../../include/site_audit/common/Errors.h"
#include "../../include/site_audit/common/UrlUtils.h"
#include "../../include/Logger.h"
#include "../crawler/AuditCrawler.h"
#include <stdexcept>

namespace site_audit::services {

AuditService::AuditService(std::shared_ptr<cache::AuditCache> cache,
                           std::shared_ptr<crawler::FetchPort> pageFetcher,
                           std::shared_ptr<crawler::FetchPort> resourceFetcher,
                           std::string userAgent,
                           std::shared_ptr<SummaryRefiner> refiner,
                           std::shared_ptr<const audit::RuleSet> rules,
                           const audit::ScoringConfig& scoring)
    : cache_(std::move(cache))
    , pageFetcher_(std::move(pageFetcher))
    , resourceFetcher_(std::move(resourceFetcher))
    , userAgent_(std::move(userAgent))
    , refiner_(std::move(refiner))
    , rules_(std::move(rules))
    , scoring_(scoring) {
    if (!cache_ || !pageFetcher_ || !resourceFetcher_ || !rules_) {
        throw std::invalid_argument("AuditService requires a cache, both fetchers and a rule set");
    }
}

Report AuditService::runAudit(const CrawlRequest& request) const {
    crawler::AuditCrawler crawler(*pageFetcher_, *resourceFetcher_, userAgent_);
    const CrawlResult crawl = crawler.run(request);

    audit::Classifier classifier(rules_);
    const std::vector<Finding> findings = classifier.classifyCrawl(crawl);

    audit::AuditScorer scorer(rules_, scoring_);
    const ScoreCard scores = scorer.score(findings, crawl.evaluatedPageCount());

    audit::ReportAssembler assembler(scoring_);
    Report report = assembler.assemble(crawl, findings, scores);

    LOG_INFO("Audit of " + request.targetUrl + " (" + profileToString(request.profile) + "): " +
             std::to_string(findings.size()) + " findings, overall " +
             (scores.overall ? std::to_string(*scores.overall) : std::string("n/a")) +
             " [" + statusToString(scores.overallStatus) + "]");
    return report;
}

Report AuditService::cachedAudit(const std::string& normalizedUrl, AuditProfile profile) {
    const CrawlBudget budget = CrawlBudget::forProfile(profile);
    const cache::CacheKey key{normalizedUrl, profile};
    return cache_->getOrCompute(key, budget.cacheTtl, [this, &normalizedUrl, profile] {
        return runAudit(CrawlRequest{normalizedUrl, profile});
    });
}

Report AuditService::report(const std::string& url) {
    const std::string target = common::validateTargetUrl(url);
    LOG_DEBUG("Report requested for " + target);
    return cachedAudit(target, AuditProfile::Full);
}

ExecutiveSummary AuditService::analyzeSummary(const std::string& url) {
    const std::string target = common::validateTargetUrl(url);
    LOG_DEBUG("Executive summary requested for " + target);

    std::optional<Report> report = cache_->peek(cache::CacheKey{target, AuditProfile::Full});
    if (report) {
        LOG_DEBUG("Reusing cached full report for summary of " + target);
    } else {
        report = cachedAudit(target, AuditProfile::Summary);
    }

    ExecutiveSummary summary = ExecutiveSummaryBuilder::build(*report);
    if (!refiner_) {
        return summary;
    }

    try {
        const size_t changed = ExecutiveSummaryBuilder::applyRefinement(summary, refiner_->refine(summary));
        LOG_DEBUG("Refinement replaced " + std::to_string(changed) + " summary sentences for " + target);
    } catch (const std::exception& e) {
        LOG_WARNING("Summary refinement unavailable for " + target + ", keeping deterministic text: " + e.what());
    }
    return summary;
}

} // namespace site_audit::services
