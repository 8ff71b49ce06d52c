#pragma once

#include <array>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "../models/ExecutiveSummary.h"
#include "../models/Report.h"

namespace site_audit::services {

// Derives the executive summary from a report using fixed sentence templates.
// The result never depends on any external service.
class ExecutiveSummaryBuilder {
public:
    static constexpr size_t kTopFindings = 3;
    static constexpr size_t kNextActions = 3;
    static constexpr size_t kPriorities = 5;

    static const std::array<std::string, 7>& lineKeys();

    static ExecutiveSummary build(const Report& report);

    // Replaces sentences for the keys present in `refined`; unknown keys and
    // values that clean up to nothing are ignored. Returns how many lines changed.
    static size_t applyRefinement(ExecutiveSummary& summary, const std::map<std::string, std::string>& refined);

    // Drops URLs, markup and numbers, keeps the first sentence and ends it with '.'
    static std::string singleSentence(const std::string& text, const std::string& fallback);

    static std::string fallbackFocus(const std::string& key);

    static nlohmann::json toJson(const ExecutiveSummary& summary);
    static std::string toText(const ExecutiveSummary& summary);

private:
    static std::string ruleSentence(const std::string& key, ScoreStatus status, const std::vector<FindingGroup>& findings);
};

} // namespace site_audit::services
