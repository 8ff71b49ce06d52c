#pragma once

#include <chrono>
#include <string>
#include <curl/curl.h>
#include "../../include/site_audit/crawler/FetchPort.h"

namespace site_audit::crawler {

// Plain HTTP fetch over libcurl. One easy handle per request so a single
// instance can serve every worker thread.
class PageFetcher : public FetchPort {
public:
    explicit PageFetcher(const std::string& userAgent,
                         bool followRedirects = true,
                         size_t maxRedirects = 5);
    ~PageFetcher() override;

    FetchResult fetch(const std::string& url, std::chrono::milliseconds timeout) override;

    // HEAD request; servers that refuse HEAD (405, 501) are asked again with GET
    FetchResult checkStatus(const std::string& url, std::chrono::milliseconds timeout) override;

    // Bodies beyond this size are truncated
    static constexpr size_t kMaxBodyBytes = 8 * 1024 * 1024;

private:
    FetchResult perform(const std::string& url, std::chrono::milliseconds timeout, bool headOnly);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static FetchErrorKind classifyCurlError(CURLcode code);

    std::string userAgent;
    bool followRedirects;
    size_t maxRedirects;
};

// curl_global_init exactly once per process
void ensureCurlGlobalInit();

} // namespace site_audit::crawler
