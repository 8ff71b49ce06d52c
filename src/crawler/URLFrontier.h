#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>

namespace site_audit::crawler {

struct FrontierEntry {
    std::string url;     // normalized
    size_t depth = 0;    // 0 = seed
};

// Breadth-first queue of URLs waiting to be fetched. Every URL is admitted at most
// once per crawl, whether it is still queued or already taken.
// Not thread-safe: only the crawl coordinator touches it.
class URLFrontier {
public:
    URLFrontier() = default;

    // Returns false when the URL was already seen or cannot be normalized
    bool addURL(const std::string& url, size_t depth);

    std::optional<FrontierEntry> next();

    // Records a URL reached some other way (a redirect target) so it is never queued.
    // Returns false when it was already seen or cannot be normalized.
    bool markSeen(const std::string& url);

    bool isEmpty() const { return queue_.empty(); }
    size_t size() const { return queue_.size(); }

private:
    static std::string normalizeURL(const std::string& url);

    std::deque<FrontierEntry> queue_;
    std::unordered_set<std::string> seen_;
};

} // namespace site_audit::crawler
