#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "RobotsTxtParser.h"
#include "../../include/site_audit/crawler/FetchPort.h"

namespace site_audit::crawler {

// Answers allow/deny per URL. robots.txt is fetched lazily, once per origin, for the
// lifetime of one gate (one crawl). An unreachable or non-2xx robots.txt allows everything.
// Not thread-safe: owned by the crawl coordinator.
class RobotsGate {
public:
    RobotsGate(FetchPort& fetcher, std::string userAgent, std::chrono::milliseconds timeout);

    bool isAllowed(const std::string& url);

    // Loads the policy for url's origin if needed
    bool robotsPresent(const std::string& url);
    std::vector<std::string> declaredSitemaps(const std::string& url);

    size_t robotsFetchCount() const { return fetchCount_; }

private:
    struct OriginPolicy {
        bool present = false;
        int statusCode = 0;
        std::optional<RobotsTxtParser> parser;
    };

    OriginPolicy& policyFor(const std::string& url);

    FetchPort& fetcher_;
    std::string userAgent_;
    std::chrono::milliseconds timeout_;
    std::unordered_map<std::string, OriginPolicy> policies_;
    size_t fetchCount_ = 0;
};

} // namespace site_audit::crawler
