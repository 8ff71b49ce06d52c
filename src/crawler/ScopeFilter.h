#pragma once

#include <string>

namespace site_audit::crawler {

enum class ScopeDecision {
    Accepted,
    WrongScheme,
    CrossOrigin,
    NonHtml,
    Invalid
};

std::string scopeDecisionToString(ScopeDecision decision);

// Keeps a crawl on the target's origin (scheme + host + port) and away from
// URLs that obviously name non-HTML resources.
class ScopeFilter {
public:
    explicit ScopeFilter(const std::string& targetUrl);

    ScopeDecision checkLink(const std::string& absoluteUrl) const;

    bool inScope(const std::string& absoluteUrl) const {
        return checkLink(absoluteUrl) == ScopeDecision::Accepted;
    }

    const std::string& origin() const { return origin_; }

    // text/html, application/xhtml+xml, or a missing header
    static bool isHtmlContentType(const std::string& contentType);

private:
    std::string scheme_;
    std::string host_;
    std::string origin_;
};

} // namespace site_audit::crawler
