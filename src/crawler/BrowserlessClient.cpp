#include "BrowserlessClient.h"
#include "PageFetcher.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/UrlUtils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace site_audit::crawler {

class BrowserlessClient::Impl {
public:
    explicit Impl(const std::string& browserlessUrl)
        : browserlessUrl_(browserlessUrl) {
        while (!browserlessUrl_.empty() && browserlessUrl_.back() == '/') {
            browserlessUrl_.pop_back();
        }
        ensureCurlGlobalInit();
    }

    FetchResult fetch(const std::string& url, std::chrono::milliseconds timeout) {
        using namespace site_audit::common;
        const std::string cleanedUrl = sanitizeUrl(url);

        FetchResult result;
        result.finalUrl = cleanedUrl;
        const auto startedAt = std::chrono::steady_clock::now();

        CURL* curl = curl_easy_init();
        if (!curl) {
            result.errorKind = FetchErrorKind::Network;
            result.errorMessage = "Failed to create CURL handle";
            LOG_ERROR("BrowserlessClient: " + result.errorMessage);
            return result;
        }

        // Leave part of the budget for navigation itself
        const long long navigationTimeout = std::max<long long>(timeout.count() - 500, 1000);
        const long long settleWait = std::min<long long>(2000, timeout.count() / 4);

        json payload = {
            {"url", cleanedUrl},
            {"gotoOptions", {{"timeout", navigationTimeout}, {"waitUntil", "networkidle2"}}},
            {"waitFor", settleWait},
            {"rejectResourceTypes", json::array({"image", "media", "font"})}
        };
        if (!userAgent_.empty()) {
            payload["userAgent"] = userAgent_;
        }

        const std::string endpoint = browserlessUrl_ + "/content";
        const std::string body = payload.dump();
        LOG_DEBUG("Browserless render request for " + cleanedUrl + " -> " + endpoint);

        char errbuf[CURL_ERROR_SIZE] = {0};
        std::string response;
        ResponseHeaders responseHeaders;

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);

        CURLcode res = curl_easy_perform(curl);
        curl_slist_free_all(headers);
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startedAt);

        if (res != CURLE_OK) {
            result.errorKind = res == CURLE_OPERATION_TIMEDOUT ? FetchErrorKind::Timeout : FetchErrorKind::Network;
            result.errorMessage = "Browserless request failed: " + std::string(curl_easy_strerror(res)) +
                                  " | errbuf=" + errbuf + " | url_hex=" + hexDump(cleanedUrl);
            LOG_WARNING("Browserless render failed for " + cleanedUrl + ": " + curl_easy_strerror(res));
            curl_easy_cleanup(curl);
            return result;
        }

        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        curl_easy_cleanup(curl);

        if (httpCode != 200) {
            // The renderer itself failed, not the audited page
            result.errorKind = FetchErrorKind::Network;
            result.errorMessage = "Browserless returned HTTP " + std::to_string(httpCode);
            LOG_ERROR("Browserless error for " + cleanedUrl + ": " + result.errorMessage);
            return result;
        }

        result.statusCode = responseHeaders.targetStatus > 0 ? responseHeaders.targetStatus : 200;
        result.contentType = responseHeaders.contentType.empty() ? "text/html" : responseHeaders.contentType;
        result.html = std::move(response);
        result.success = result.statusCode >= 200 && result.statusCode < 300;
        if (!result.success) {
            result.errorKind = FetchErrorKind::Http;
            result.errorMessage = "HTTP " + std::to_string(result.statusCode);
        }

        LOG_DEBUG("Rendered " + cleanedUrl + " status=" + std::to_string(result.statusCode) +
                  " bytes=" + std::to_string(result.html.size()) +
                  " elapsed=" + std::to_string(result.elapsed.count()) + "ms");
        return result;
    }

    bool isAvailable() {
        CURL* curl = curl_easy_init();
        if (!curl) return false;

        const std::string healthUrl = browserlessUrl_ + "/health";
        curl_easy_setopt(curl, CURLOPT_URL, healthUrl.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 5000L);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));

        CURLcode res = curl_easy_perform(curl);
        long httpCode = 0;
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        }
        curl_easy_cleanup(curl);
        return res == CURLE_OK && httpCode == 200;
    }

    void setUserAgent(const std::string& userAgent) {
        userAgent_ = userAgent;
    }

private:
    struct ResponseHeaders {
        int targetStatus = 0;
        std::string contentType;
    };

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        auto* response = static_cast<std::string*>(userp);
        const size_t totalSize = size * nmemb;
        if (response->size() < PageFetcher::kMaxBodyBytes) {
            response->append(static_cast<char*>(contents),
                             std::min(totalSize, PageFetcher::kMaxBodyBytes - response->size()));
        }
        return totalSize;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* headers = static_cast<ResponseHeaders*>(userdata);
        const size_t totalSize = size * nitems;
        std::string line(buffer, totalSize);
        const size_t colon = line.find(':');
        if (colon == std::string::npos) {
            return totalSize;
        }

        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        if (name == "x-response-code") {
            try {
                headers->targetStatus = std::stoi(value);
            } catch (const std::exception&) {
                headers->targetStatus = 0;
            }
        } else if (name == "content-type") {
            headers->contentType = value;
        }
        return totalSize;
    }

    std::string browserlessUrl_;
    std::string userAgent_;
};

BrowserlessClient::BrowserlessClient(const std::string& browserlessUrl)
    : pImpl(std::make_unique<Impl>(browserlessUrl)) {}

BrowserlessClient::~BrowserlessClient() = default;

FetchResult BrowserlessClient::fetch(const std::string& url, std::chrono::milliseconds timeout) {
    return pImpl->fetch(url, timeout);
}

bool BrowserlessClient::isAvailable() {
    return pImpl->isAvailable();
}

void BrowserlessClient::setUserAgent(const std::string& userAgent) {
    pImpl->setUserAgent(userAgent);
}

} // namespace site_audit::crawler
