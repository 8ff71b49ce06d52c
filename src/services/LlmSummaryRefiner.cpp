#include "LlmSummaryRefiner.h"
#include "../crawler/PageFetcher.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/Errors.h"
#include "../../include/site_audit/services/ExecutiveSummaryBuilder.h"
#include <curl/curl.h>
#include <algorithm>

using json = nlohmann::json;

namespace site_audit::services {

namespace {

const std::string kGroqBaseUrl = "https://api.groq.com/openai/v1";
const std::string kGroqModel = "llama-3.1-8b-instant";
const std::string kOpenAiBaseUrl = "https://api.openai.com/v1";
const std::string kOpenAiModel = "gpt-4o-mini";

constexpr size_t kMaxResponseBytes = 1024 * 1024;

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

const std::string LlmSummaryRefiner::kSystemPrompt =
    "Write one executive sentence per section in English. "
    "Return a JSON object with exactly these keys: overall, performance, seo, ux, accessibility, "
    "conversion, critical_issues. "
    "Rules: one sentence only per key; no URLs; no numeric metrics; no bullet or list formatting; "
    "be actionable and grounded only on the provided findings; use a consultative commercial tone "
    "that highlights risk or opportunity.";

LlmSettings LlmSettings::resolve(const std::string& apiKey, const std::string& model, const std::string& baseUrl) {
    LlmSettings settings;
    settings.apiKey = trim(apiKey);

    const bool groq = settings.apiKey.rfind("gsk_", 0) == 0;
    settings.model = trim(model);
    if (settings.model.empty()) {
        settings.model = groq ? kGroqModel : kOpenAiModel;
    }
    settings.baseUrl = trim(baseUrl);
    if (settings.baseUrl.empty()) {
        settings.baseUrl = groq ? kGroqBaseUrl : kOpenAiBaseUrl;
    }
    while (!settings.baseUrl.empty() && settings.baseUrl.back() == '/') {
        settings.baseUrl.pop_back();
    }
    return settings;
}

LlmSummaryRefiner::LlmSummaryRefiner(LlmSettings settings)
    : settings_(std::move(settings)) {
    crawler::ensureCurlGlobalInit();
}

json LlmSummaryRefiner::buildRequest(const ExecutiveSummary& summary) const {
    json sections = json::object();
    for (const auto& line : summary.lines) {
        json findings = json::array();
        for (const auto& finding : line.topFindings) {
            findings.push_back({
                {"severity", severityToString(finding.severity)},
                {"title", finding.title},
                {"how_to_fix", finding.howToFix}
            });
        }
        sections[line.key] = {
            {"status", statusToString(line.status)},
            {"summary", line.sentence},
            {"findings", findings},
            {"next_actions", line.nextActions}
        };
    }

    return {
        {"model", settings_.model},
        {"temperature", 0},
        {"response_format", {{"type", "json_object"}}},
        {"messages", json::array({
            {{"role", "system"}, {"content", kSystemPrompt}},
            {{"role", "user"}, {"content", sections.dump()}}
        })}
    };
}

std::map<std::string, std::string> LlmSummaryRefiner::parseResponse(const std::string& body,
                                                                    const std::vector<std::string>& keys) {
    json parsed;
    try {
        json envelope = json::parse(body);
        const std::string content = envelope.at("choices").at(0).at("message").at("content").get<std::string>();
        parsed = json::parse(content);
    } catch (const json::exception& e) {
        throw SummaryRefinementError(std::string("LLM response parsing failed: ") + e.what());
    }

    if (!parsed.is_object()) {
        throw SummaryRefinementError("LLM response format is invalid");
    }

    std::map<std::string, std::string> sentences;
    for (const auto& key : keys) {
        auto it = parsed.find(key);
        if (it != parsed.end() && it->is_string()) {
            sentences[key] = it->get<std::string>();
        } else {
            LOG_DEBUG("LLM response has no sentence for " + key);
        }
    }
    return sentences;
}

std::map<std::string, std::string> LlmSummaryRefiner::refine(const ExecutiveSummary& summary) {
    if (!settings_.isConfigured()) {
        throw SummaryRefinementError("LLM_API_KEY is missing");
    }

    const std::string endpoint = settings_.baseUrl + "/chat/completions";
    LOG_DEBUG("Refining executive summary for " + summary.targetUrl + " with " + settings_.model);
    const std::string response = post(endpoint, buildRequest(summary).dump());

    const auto& keys = ExecutiveSummaryBuilder::lineKeys();
    auto sentences = parseResponse(response, std::vector<std::string>(keys.begin(), keys.end()));
    LOG_INFO("LLM refined " + std::to_string(sentences.size()) + " summary sentences for " + summary.targetUrl);
    return sentences;
}

size_t LlmSummaryRefiner::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* response = static_cast<std::string*>(userp);
    const size_t totalSize = size * nmemb;
    if (response->size() < kMaxResponseBytes) {
        response->append(static_cast<char*>(contents), std::min(totalSize, kMaxResponseBytes - response->size()));
    }
    return totalSize;
}

std::string LlmSummaryRefiner::post(const std::string& url, const std::string& body) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw SummaryRefinementError("Failed to create CURL handle");
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    std::string response;
    const std::string authorization = "Authorization: Bearer " + settings_.apiKey;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, authorization.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(settings_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        throw SummaryRefinementError("LLM request failed: " + std::string(curl_easy_strerror(res)) +
                                     (errbuf[0] ? " | " + std::string(errbuf) : ""));
    }

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_easy_cleanup(curl);

    if (httpCode < 200 || httpCode >= 300) {
        throw SummaryRefinementError("LLM request returned status " + std::to_string(httpCode));
    }
    return response;
}

} // namespace site_audit::services
