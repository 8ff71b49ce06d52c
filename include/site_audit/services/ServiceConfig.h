#pragma once

#include <string>
#include "../../Logger.h"

namespace site_audit::services {

// Process settings read once at startup. Crawl budgets, cache TTLs and the
// worker pool width are fixed in code and not configurable here.
struct ServiceConfig {
    int port = 3000;
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    std::string userAgent = "SiteAuditBot/1.0 (+https://github.com/site-audit)";
    std::string browserlessUrl;   // empty: pages are fetched without rendering
    std::string llmApiKey;        // empty: summaries stay deterministic
    std::string llmModel;
    std::string llmBaseUrl;

    bool renderPages() const { return !browserlessUrl.empty(); }
    bool refineSummaries() const { return !llmApiKey.empty(); }

    // Reads PORT, LOG_LEVEL, LOG_FILE, AUDIT_USER_AGENT, BROWSERLESS_URL,
    // LLM_API_KEY, LLM_MODEL and LLM_BASE_URL. Throws std::invalid_argument
    // for a PORT outside 1..65535.
    static ServiceConfig fromEnvironment();
};

} // namespace site_audit::services
