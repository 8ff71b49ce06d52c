#include "PageFetcher.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/UrlUtils.h"
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace site_audit::crawler {

void ensureCurlGlobalInit() {
    static std::once_flag curlInitFlag;
    std::call_once(curlInitFlag, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
        }
        LOG_DEBUG("libcurl initialized: " + std::string(curl_version()));
    });
}

PageFetcher::PageFetcher(const std::string& userAgent,
                         bool followRedirects,
                         size_t maxRedirects)
    : userAgent(userAgent)
    , followRedirects(followRedirects)
    , maxRedirects(maxRedirects) {
    ensureCurlGlobalInit();
    LOG_DEBUG("PageFetcher created with userAgent: " + userAgent);
}

PageFetcher::~PageFetcher() = default;

FetchResult PageFetcher::fetch(const std::string& url, std::chrono::milliseconds timeout) {
    return perform(url, timeout, false);
}

FetchResult PageFetcher::checkStatus(const std::string& url, std::chrono::milliseconds timeout) {
    FetchResult head = perform(url, timeout, true);
    if (head.statusCode == 405 || head.statusCode == 501) {
        LOG_DEBUG("HEAD refused (" + std::to_string(head.statusCode) + ") for " + url + ", retrying with GET");
        return perform(url, timeout, false);
    }
    return head;
}

FetchResult PageFetcher::perform(const std::string& url, std::chrono::milliseconds timeout, bool headOnly) {
    using namespace site_audit::common;
    const std::string cleanedUrl = sanitizeUrl(url);
    LOG_DEBUG(std::string(headOnly ? "PageFetcher HEAD " : "PageFetcher GET ") + cleanedUrl +
              " (timeout " + std::to_string(timeout.count()) + "ms)");

    FetchResult result;
    result.finalUrl = cleanedUrl;
    const auto startedAt = std::chrono::steady_clock::now();

    // Local handle per request, easy handles must not be shared across threads
    CURL* curl = curl_easy_init();
    if (!curl) {
        result.errorKind = FetchErrorKind::Network;
        result.errorMessage = "Failed to create CURL handle";
        LOG_ERROR(result.errorMessage);
        return result;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    std::string responseData;

    curl_easy_setopt(curl, CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(std::min<long long>(timeout.count(), 10000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects));
    if (headOnly) {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: text/html,application/xhtml+xml;q=0.9,*/*;q=0.5");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseData);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt);

    if (res != CURLE_OK) {
        result.errorKind = classifyCurlError(res);
        result.errorMessage = std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf +
                              " | url_hex=" + hexDump(cleanedUrl);
        LOG_WARNING("Fetch failed (" + fetchErrorKindToString(result.errorKind) + ") for " +
                    cleanedUrl + ": " + curl_easy_strerror(res));
        curl_easy_cleanup(curl);
        return result;
    }

    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    result.statusCode = static_cast<int>(statusCode);

    char* contentType = nullptr;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        result.contentType = contentType;
    }

    char* effectiveUrl = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effectiveUrl);
    if (effectiveUrl) {
        result.finalUrl = effectiveUrl;
    }

    long redirects = 0;
    curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirects);
    result.redirectCount = static_cast<int>(redirects);

    curl_easy_cleanup(curl);

    result.html = std::move(responseData);
    result.success = result.statusCode >= 200 && result.statusCode < 300;
    if (!result.success) {
        result.errorKind = FetchErrorKind::Http;
        result.errorMessage = "HTTP " + std::to_string(result.statusCode);
        LOG_WARNING("HTTP " + std::to_string(result.statusCode) + " for " + cleanedUrl);
    } else {
        LOG_DEBUG("Fetched " + cleanedUrl + " status=" + std::to_string(result.statusCode) +
                  " bytes=" + std::to_string(result.html.size()) +
                  " elapsed=" + std::to_string(result.elapsed.count()) + "ms");
    }

    return result;
}

size_t PageFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* responseData = static_cast<std::string*>(userp);
    const size_t totalSize = size * nmemb;
    if (responseData->size() < kMaxBodyBytes) {
        const size_t room = kMaxBodyBytes - responseData->size();
        responseData->append(static_cast<char*>(contents), std::min(totalSize, room));
    }
    return totalSize;
}

FetchErrorKind PageFetcher::classifyCurlError(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return FetchErrorKind::Timeout;
        case CURLE_TOO_MANY_REDIRECTS:
            return FetchErrorKind::Http;
        default:
            return FetchErrorKind::Network;
    }
}

} // namespace site_audit::crawler
