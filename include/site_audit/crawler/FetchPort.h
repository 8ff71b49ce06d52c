#pragma once

#include <chrono>
#include <string>

namespace site_audit::crawler {

enum class FetchErrorKind {
    None,
    Timeout,
    Network,
    Http
};

inline std::string fetchErrorKindToString(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::None: return "none";
        case FetchErrorKind::Timeout: return "timeout";
        case FetchErrorKind::Network: return "network";
        case FetchErrorKind::Http: return "http";
    }
    return "unknown";
}

struct FetchResult {
    bool success = false;          // transport ok and 2xx status
    int statusCode = 0;
    std::string contentType;
    std::string html;
    std::string finalUrl;          // after redirects
    int redirectCount = 0;
    FetchErrorKind errorKind = FetchErrorKind::None;
    std::string errorMessage;
    std::chrono::milliseconds elapsed{0};
};

// Capability that retrieves one URL. Implementations must return within
// roughly `timeout` and never retry on their own.
class FetchPort {
public:
    virtual ~FetchPort() = default;

    virtual FetchResult fetch(const std::string& url, std::chrono::milliseconds timeout) = 0;

    // Status of a URL when the body is not needed. Same contract as fetch;
    // implementations may answer from a HEAD request.
    virtual FetchResult checkStatus(const std::string& url, std::chrono::milliseconds timeout) {
        return fetch(url, timeout);
    }
};

} // namespace site_audit::crawler
