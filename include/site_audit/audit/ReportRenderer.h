#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "../models/Report.h"

namespace site_audit::audit {

// Serializes a Report for the HTTP surface (JSON) and for logs or terminals (text)
class ReportRenderer {
public:
    static nlohmann::json toJson(const Report& report);
    static nlohmann::json toJson(const ScoreCard& scores);
    static nlohmann::json toJson(const CrawlStats& stats);
    static nlohmann::json toJson(const ReportSection& section);
    static nlohmann::json toJson(const FindingGroup& group);

    static std::string toText(const Report& report);
};

} // namespace site_audit::audit
