#include "../../include/site_audit/services/ExecutiveSummaryBuilder.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace site_audit::services {

namespace {

const std::string kSentenceFallback =
    "The next step is to apply objective improvements in this area to lift commercial results";

struct LineSource {
    const char* key;
    const char* title;
    SectionId section;
    std::optional<AuditCategory> category;
};

const std::array<LineSource, 7> kLineSources = {{
    {"overall", "Overall", SectionId::ConsolidatedDiagnosis, std::nullopt},
    {"performance", "Technical Performance", SectionId::TechnicalPerformance, AuditCategory::Performance},
    {"seo", "On-Page SEO", SectionId::OnPageSeo, AuditCategory::Seo},
    {"ux", "User Experience", SectionId::Ux, AuditCategory::Ux},
    {"accessibility", "Accessibility", SectionId::Accessibility, AuditCategory::Accessibility},
    {"conversion", "Conversion & Communication", SectionId::ConversionCommunication, AuditCategory::Conversion},
    {"critical_issues", "Critical Issues", SectionId::CriticalBottlenecks, std::nullopt},
}};

std::string collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

// URLs, tags and numeric metrics removed, whitespace collapsed
std::string stripUrlsAndMetrics(const std::string& text) {
    static const std::regex urls(R"((https?://|www\.)\S+)", std::regex::icase);
    static const std::regex tags(R"(<[^>]+>)");
    static const std::regex numbers(R"(\b\d+([.,]\d+)?%?)");
    static const std::regex emptyParens(R"(\(\s*\))");

    std::string cleaned = std::regex_replace(text, urls, "");
    cleaned = std::regex_replace(cleaned, tags, "");
    cleaned = std::regex_replace(cleaned, numbers, "");
    cleaned = std::regex_replace(cleaned, emptyParens, "");
    return collapseWhitespace(cleaned);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimTerminalPunctuation(std::string value) {
    while (!value.empty() && (value.back() == '.' || value.back() == '!' || value.back() == '?' ||
                              value.back() == ' ' || value.back() == ':' || value.back() == ';')) {
        value.pop_back();
    }
    return value;
}

} // namespace

const std::array<std::string, 7>& ExecutiveSummaryBuilder::lineKeys() {
    static const std::array<std::string, 7> keys = {
        "overall", "performance", "seo", "ux", "accessibility", "conversion", "critical_issues"
    };
    return keys;
}

std::string ExecutiveSummaryBuilder::fallbackFocus(const std::string& key) {
    static const std::map<std::string, std::string> focus = {
        {"overall", "digital performance and growth potential"},
        {"performance", "journey fluidity and perceived response time"},
        {"seo", "organic visibility and demand generation"},
        {"ux", "navigation experience on every device"},
        {"accessibility", "inclusive navigation and brand trust"},
        {"conversion", "value proposition clarity and conversion capacity"},
        {"critical_issues", "technical risks with direct impact on results"},
    };
    auto it = focus.find(key);
    return it != focus.end() ? it->second : "digital performance";
}

std::string ExecutiveSummaryBuilder::singleSentence(const std::string& text, const std::string& fallback) {
    std::string cleaned = stripUrlsAndMetrics(text);
    if (cleaned.empty()) {
        cleaned = fallback;
    }

    // First sentence: up to the first terminator followed by a space
    std::string sentence = cleaned;
    for (size_t i = 0; i + 1 < cleaned.size(); ++i) {
        const char c = cleaned[i];
        if ((c == '.' || c == '!' || c == '?') && cleaned[i + 1] == ' ') {
            sentence = cleaned.substr(0, i);
            break;
        }
    }

    sentence = trimTerminalPunctuation(sentence);
    if (sentence.empty()) {
        sentence = trimTerminalPunctuation(fallback);
    }
    if (!sentence.empty()) {
        sentence[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(sentence[0])));
    }
    return sentence + ".";
}

std::string ExecutiveSummaryBuilder::ruleSentence(const std::string& key,
                                                  ScoreStatus status,
                                                  const std::vector<FindingGroup>& findings) {
    std::string focus = fallbackFocus(key);
    if (!findings.empty()) {
        std::string candidate = toLower(trimTerminalPunctuation(stripUrlsAndMetrics(findings.front().title)));
        if (!candidate.empty()) {
            focus = candidate;
        }
    }

    std::string base;
    if (status == ScoreStatus::NotEvaluated) {
        base = "It was not possible to evaluate " + focus +
               " in this crawl and the next step is to make the affected pages reachable for a new audit";
    } else if (findings.empty()) {
        base = "In this first reading " + focus +
               " looks stable and the next step is to refine it to grow results predictably";
    } else if (status == ScoreStatus::Critical) {
        base = "Relevant risks were found in " + focus +
               " and the next step is to prioritize the highest-impact fixes to protect conversion and revenue";
    } else if (status == ScoreStatus::Attention) {
        base = "There are clear opportunities in " + focus +
               " and the next step is to execute prioritized improvements that turn potential into commercial gain";
    } else {
        base = "There are occasional opportunities in " + focus +
               " and the next step is to capture additional gains with high-return adjustments";
    }
    return singleSentence(base, kSentenceFallback);
}

ExecutiveSummary ExecutiveSummaryBuilder::build(const Report& report) {
    ExecutiveSummary summary;
    summary.targetUrl = report.targetUrl;
    summary.profile = report.profile;
    summary.generatedAt = report.generatedAt;
    summary.overallScore = report.scores.overall;
    summary.overallStatus = report.scores.overallStatus;
    summary.partial = report.partial;

    for (const auto& source : kLineSources) {
        const ReportSection& section = report.section(source.section);

        SummaryLine line;
        line.key = source.key;
        line.title = source.title;
        if (source.category) {
            const CategoryScore& score = report.scores.forCategory(*source.category);
            line.status = score.status;
            line.score = score.value;
        } else if (source.section == SectionId::CriticalBottlenecks) {
            if (!section.findings.empty()) {
                line.status = ScoreStatus::Critical;
            } else {
                line.status = report.scores.overallStatus == ScoreStatus::NotEvaluated
                    ? ScoreStatus::NotEvaluated : ScoreStatus::Ok;
            }
        } else {
            line.status = report.scores.overallStatus;
            line.score = report.scores.overall;
        }

        for (size_t i = 0; i < section.findings.size() && i < kTopFindings; ++i) {
            const FindingGroup& group = section.findings[i];
            line.topFindings.push_back(SummaryFinding{group.severity, group.title, group.howToFix});
        }
        for (size_t i = 0; i < section.nextActions.size() && i < kNextActions; ++i) {
            line.nextActions.push_back(section.nextActions[i]);
        }

        line.sentence = ruleSentence(line.key, line.status, section.findings);
        summary.lines.push_back(std::move(line));
    }

    const ReportSection& diagnosis = report.section(SectionId::ConsolidatedDiagnosis);
    for (const auto& action : diagnosis.nextActions) {
        if (summary.priorities.size() >= kPriorities) {
            break;
        }
        summary.priorities.push_back(action);
    }

    LOG_DEBUG("Built executive summary for " + summary.targetUrl + " from " +
              profileToString(summary.profile) + " report");
    return summary;
}

size_t ExecutiveSummaryBuilder::applyRefinement(ExecutiveSummary& summary,
                                                const std::map<std::string, std::string>& refined) {
    size_t changed = 0;
    for (auto& line : summary.lines) {
        auto it = refined.find(line.key);
        if (it == refined.end()) {
            continue;
        }
        if (stripUrlsAndMetrics(it->second).empty()) {
            LOG_DEBUG("Ignoring empty refined sentence for " + line.key);
            continue;
        }
        line.sentence = singleSentence(it->second, line.sentence);
        line.refined = true;
        ++changed;
    }
    if (changed > 0) {
        summary.source = "llm";
    }
    return changed;
}

nlohmann::json ExecutiveSummaryBuilder::toJson(const ExecutiveSummary& summary) {
    nlohmann::json sentences = nlohmann::json::object();
    nlohmann::json lines = nlohmann::json::array();
    for (const auto& line : summary.lines) {
        sentences[line.key] = line.sentence;
        lines.push_back({
            {"key", line.key},
            {"title", line.title},
            {"status", statusToString(line.status)},
            {"score", line.score ? nlohmann::json(*line.score) : nlohmann::json(nullptr)},
            {"sentence", line.sentence},
            {"refined", line.refined}
        });
    }

    return {
        {"url", summary.targetUrl},
        {"profile", profileToString(summary.profile)},
        {"generated_at", summary.generatedAt},
        {"overall_score", summary.overallScore ? nlohmann::json(*summary.overallScore) : nlohmann::json(nullptr)},
        {"overall_status", statusToString(summary.overallStatus)},
        {"partial", summary.partial},
        {"source", summary.source},
        {"summary", sentences},
        {"lines", lines},
        {"priorities", summary.priorities}
    };
}

std::string ExecutiveSummaryBuilder::toText(const ExecutiveSummary& summary) {
    std::ostringstream out;
    out << "Executive summary for " << summary.targetUrl << "\n";
    out << "Overall: " << (summary.overallScore ? std::to_string(*summary.overallScore) : "n/a")
        << " (" << statusToString(summary.overallStatus) << ")\n\n";
    for (const auto& line : summary.lines) {
        out << line.title << " [" << statusToString(line.status) << "]: " << line.sentence << "\n";
    }
    if (!summary.priorities.empty()) {
        out << "\nPriorities:\n";
        for (size_t i = 0; i < summary.priorities.size(); ++i) {
            out << "  " << (i + 1) << ". " << summary.priorities[i] << "\n";
        }
    }
    return out.str();
}

} // namespace site_audit::services
