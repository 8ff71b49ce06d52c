#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CrawlBudget.h"
#include "Finding.h"
#include "ScoreCard.h"

namespace site_audit {

// Headline finding handed to the refinement collaborator
struct SummaryFinding {
    Severity severity = Severity::Low;
    std::string title;
    std::string howToFix;
};

// One executive sentence for one area of the report
struct SummaryLine {
    std::string key;                       // overall, performance, seo, ux, accessibility, conversion, critical_issues
    std::string title;
    ScoreStatus status = ScoreStatus::NotEvaluated;
    std::optional<int> score;
    std::string sentence;                  // always a single sentence ending with '.'
    bool refined = false;
    std::vector<SummaryFinding> topFindings;
    std::vector<std::string> nextActions;
};

struct ExecutiveSummary {
    std::string targetUrl;
    AuditProfile profile = AuditProfile::Summary;   // profile of the report it was derived from
    std::string generatedAt;
    std::optional<int> overallScore;
    ScoreStatus overallStatus = ScoreStatus::NotEvaluated;
    std::vector<SummaryLine> lines;
    std::vector<std::string> priorities;
    bool partial = false;
    std::string source = "rules";          // "rules" or "llm"

    const SummaryLine* find(const std::string& key) const {
        for (const auto& line : lines) {
            if (line.key == key) {
                return &line;
            }
        }
        return nullptr;
    }
};

} // namespace site_audit
