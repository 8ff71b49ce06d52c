#include "ScopeFilter.h"
#include "../../include/site_audit/common/UrlUtils.h"
#include "../../include/site_audit/common/Errors.h"
#include <algorithm>
#include <cctype>

namespace site_audit::crawler {

std::string scopeDecisionToString(ScopeDecision decision) {
    switch (decision) {
        case ScopeDecision::Accepted: return "accepted";
        case ScopeDecision::WrongScheme: return "wrong-scheme";
        case ScopeDecision::CrossOrigin: return "cross-origin";
        case ScopeDecision::NonHtml: return "non-html";
        case ScopeDecision::Invalid: return "invalid";
    }
    return "unknown";
}

ScopeFilter::ScopeFilter(const std::string& targetUrl) {
    auto parsed = common::parseUrl(targetUrl);
    if (!parsed) {
        throw InvalidUrlError("Cannot scope crawl to invalid URL: " + targetUrl);
    }
    scheme_ = parsed->scheme;
    host_ = parsed->host;
    origin_ = parsed->origin();
}

ScopeDecision ScopeFilter::checkLink(const std::string& absoluteUrl) const {
    auto parsed = common::parseUrl(absoluteUrl);
    if (!parsed) {
        return ScopeDecision::Invalid;
    }
    if (parsed->origin() != origin_) {
        // Same host reached over the other scheme is a scheme problem, not a foreign site
        if (parsed->host == host_ && parsed->scheme != scheme_) {
            return ScopeDecision::WrongScheme;
        }
        return ScopeDecision::CrossOrigin;
    }
    if (!common::looksLikeHtmlPath(parsed->path)) {
        return ScopeDecision::NonHtml;
    }
    return ScopeDecision::Accepted;
}

bool ScopeFilter::isHtmlContentType(const std::string& contentType) {
    if (contentType.empty()) {
        return true;
    }
    std::string mime = contentType.substr(0, contentType.find(';'));
    mime.erase(0, mime.find_first_not_of(" \t"));
    mime.erase(mime.find_last_not_of(" \t") + 1);
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return mime == "text/html" || mime == "application/xhtml+xml";
}

} // namespace site_audit::crawler
