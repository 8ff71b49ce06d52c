#include "URLFrontier.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/UrlUtils.h"

namespace site_audit::crawler {

bool URLFrontier::addURL(const std::string& url, size_t depth) {
    const std::string normalizedURL = normalizeURL(url);
    if (normalizedURL.empty()) {
        LOG_DEBUG("URLFrontier: rejecting unparsable URL: " + url);
        return false;
    }

    if (!seen_.insert(normalizedURL).second) {
        LOG_TRACE("URL already seen, skipping: " + normalizedURL);
        return false;
    }

    queue_.push_back(FrontierEntry{normalizedURL, depth});
    LOG_DEBUG("Queued " + normalizedURL + " at depth " + std::to_string(depth) +
              ", frontier size: " + std::to_string(queue_.size()));
    return true;
}

std::optional<FrontierEntry> URLFrontier::next() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    FrontierEntry entry = std::move(queue_.front());
    queue_.pop_front();
    return entry;
}

bool URLFrontier::markSeen(const std::string& url) {
    const std::string normalizedURL = normalizeURL(url);
    return !normalizedURL.empty() && seen_.insert(normalizedURL).second;
}

std::string URLFrontier::normalizeURL(const std::string& url) {
    const std::string cleaned = common::sanitizeUrl(url);
    if (!common::parseUrl(cleaned)) {
        return "";
    }
    return common::normalizeUrl(cleaned);
}

} // namespace site_audit::crawler
