#pragma once

#include <vector>
#include "AuditScorer.h"
#include "../models/CrawlResult.h"
#include "../models/Finding.h"
#include "../models/Report.h"
#include "../models/ScoreCard.h"

namespace site_audit::audit {

// Builds the fixed-shape report. Deterministic for identical inputs apart from
// the generation timestamp.
class ReportAssembler {
public:
    static constexpr size_t kMaxGroupsPerSection = 10;
    static constexpr size_t kMaxAffectedUrls = 25;
    static constexpr size_t kMaxWorstPages = 20;
    static constexpr size_t kMaxNextActions = 5;
    static constexpr size_t kMaxCoverHeadlines = 3;

    explicit ReportAssembler(const ScoringConfig& config = ScoringConfig::createDefault());

    Report assemble(const CrawlResult& crawl,
                    const std::vector<Finding>& findings,
                    const ScoreCard& scores) const;

    // Findings merged per rule, most severe first, then by title
    static std::vector<FindingGroup> groupFindings(const std::vector<const Finding*>& findings);

    std::vector<WorstPage> rankWorstPages(const CrawlResult& crawl, const std::vector<Finding>& findings) const;

    static CrawlStats collectStats(const CrawlResult& crawl);

private:
    ScoringConfig config_;
};

} // namespace site_audit::audit
