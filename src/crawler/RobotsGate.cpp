#include "RobotsGate.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/UrlUtils.h"

namespace site_audit::crawler {

RobotsGate::RobotsGate(FetchPort& fetcher, std::string userAgent, std::chrono::milliseconds timeout)
    : fetcher_(fetcher)
    , userAgent_(std::move(userAgent))
    , timeout_(timeout) {
}

bool RobotsGate::isAllowed(const std::string& url) {
    OriginPolicy& policy = policyFor(url);
    if (!policy.parser) {
        return true;
    }
    const bool allowed = policy.parser->isAllowed(url, userAgent_);
    if (!allowed) {
        LOG_DEBUG("robots.txt disallows " + url);
    }
    return allowed;
}

bool RobotsGate::robotsPresent(const std::string& url) {
    return policyFor(url).present;
}

std::vector<std::string> RobotsGate::declaredSitemaps(const std::string& url) {
    OriginPolicy& policy = policyFor(url);
    return policy.parser ? policy.parser->getSitemaps() : std::vector<std::string>{};
}

RobotsGate::OriginPolicy& RobotsGate::policyFor(const std::string& url) {
    const std::string origin = common::originOf(url);
    auto it = policies_.find(origin);
    if (it != policies_.end()) {
        return it->second;
    }

    OriginPolicy policy;
    if (!origin.empty()) {
        const std::string robotsUrl = origin + "/robots.txt";
        ++fetchCount_;
        FetchResult result = fetcher_.fetch(robotsUrl, timeout_);
        policy.statusCode = result.statusCode;

        if (result.success) {
            policy.present = true;
            RobotsTxtParser parser;
            parser.parse(result.html);
            policy.parser = std::move(parser);
            LOG_INFO("Loaded robots.txt for " + origin);
        } else {
            LOG_INFO("No usable robots.txt for " + origin + " (" +
                     (result.statusCode ? "HTTP " + std::to_string(result.statusCode)
                                        : fetchErrorKindToString(result.errorKind)) +
                     "), allowing all");
        }
    }

    return policies_.emplace(origin, std::move(policy)).first->second;
}

} // namespace site_audit::crawler
