#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../include/site_audit/services/SummaryRefiner.h"

namespace site_audit::services {

struct LlmSettings {
    std::string apiKey;
    std::string model;
    std::string baseUrl;
    std::chrono::milliseconds timeout{30000};

    bool isConfigured() const { return !apiKey.empty(); }

    // Keys starting with "gsk_" select Groq, anything else OpenAI. Empty model or
    // base URL fall back to the provider default.
    static LlmSettings resolve(const std::string& apiKey,
                               const std::string& model = "",
                               const std::string& baseUrl = "");
};

// Rewrites summary sentences through an OpenAI-compatible chat completions endpoint.
// Every failure surfaces as SummaryRefinementError.
class LlmSummaryRefiner : public SummaryRefiner {
public:
    explicit LlmSummaryRefiner(LlmSettings settings);

    std::map<std::string, std::string> refine(const ExecutiveSummary& summary) override;

    nlohmann::json buildRequest(const ExecutiveSummary& summary) const;

    // Reads choices[0].message.content as a JSON object of string sentences.
    // Keys that are missing or not strings are left out of the result.
    static std::map<std::string, std::string> parseResponse(const std::string& body,
                                                            const std::vector<std::string>& keys);

    const LlmSettings& settings() const { return settings_; }

    static const std::string kSystemPrompt;

private:
    std::string post(const std::string& url, const std::string& body) const;
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    LlmSettings settings_;
};

} // namespace site_audit::services
