#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "../../include/site_audit/crawler/FetchPort.h"

namespace site_audit::crawler {

// Fetches fully rendered HTML through a browserless instance (POST /content).
// The target's own status code is read from the X-Response-Code header.
class BrowserlessClient : public FetchPort {
public:
    explicit BrowserlessClient(const std::string& browserlessUrl);
    ~BrowserlessClient() override;

    FetchResult fetch(const std::string& url, std::chrono::milliseconds timeout) override;

    // GET /health on the browserless instance
    bool isAvailable();

    void setUserAgent(const std::string& userAgent);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace site_audit::crawler
