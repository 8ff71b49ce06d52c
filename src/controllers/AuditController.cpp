#include "AuditController.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/audit/ReportRenderer.h"
#include "../../include/site_audit/common/Errors.h"
#include "../../include/site_audit/services/ExecutiveSummaryBuilder.h"
#include <chrono>
#include <exception>
#include <mutex>

using site_audit::services::AuditService;

namespace {

std::mutex serviceMutex;

// Non-string values read as empty so they fail validation like missing ones
std::string stringField(const nlohmann::json& body, const char* key, const std::string& fallback = "") {
    auto it = body.find(key);
    if (it == body.end()) {
        return fallback;
    }
    return it->is_string() ? it->get<std::string>() : std::string();
}

long long millisecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

std::shared_ptr<AuditService>& AuditController::serviceSlot() {
    static std::shared_ptr<AuditService> instance;
    return instance;
}

void AuditController::setService(std::shared_ptr<AuditService> service) {
    std::lock_guard<std::mutex> lock(serviceMutex);
    serviceSlot() = std::move(service);
}

std::shared_ptr<AuditService> AuditController::service() {
    std::lock_guard<std::mutex> lock(serviceMutex);
    return serviceSlot();
}

routing::Reply AuditController::failureReply(const std::string& url) {
    try {
        throw;
    } catch (const site_audit::InvalidUrlError& e) {
        LOG_WARNING("Rejected target '" + url + "': " + e.what());
        return routing::Reply::fromJson(errorBody("INVALID_URL", e.what()), "400 Bad Request");
    } catch (const site_audit::SeedUnreachableError& e) {
        LOG_ERROR(std::string("Audit failed: ") + e.what());
        return routing::Reply::fromJson(errorBody("TARGET_UNREACHABLE", e.what()), "502 Bad Gateway");
    } catch (const site_audit::AuditError& e) {
        LOG_ERROR("Audit of " + url + " failed: " + e.what());
        return routing::Reply::fromJson(errorBody("AUDIT_FAILED", e.what()), "500 Internal Server Error");
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error auditing " + url + ": " + e.what());
        return routing::Reply::fromJson(errorBody("INTERNAL_ERROR", e.what()), "500 Internal Server Error");
    }
}

void AuditController::report(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    auto aborted = trackAbort(res, "report");
    readJsonBody(res, aborted, [this, res, aborted](const nlohmann::json& body) {
        const std::string url = stringField(body, "url");
        const std::string format = stringField(body, "format", "json");
        if (url.empty()) {
            badRequest(res, "url is required");
            return;
        }
        if (format != "json" && format != "text") {
            badRequest(res, "format must be json or text");
            return;
        }

        auto service = AuditController::service();
        if (!service) {
            serverError(res, "Audit service is not initialized");
            return;
        }

        respondAsync(res, aborted, [service, url, format]() -> routing::Reply {
            const auto start = std::chrono::steady_clock::now();
            try {
                site_audit::Report report = service->report(url);
                LOG_INFO("POST /report " + report.targetUrl + " answered in " +
                         std::to_string(millisecondsSince(start)) + "ms");
                if (format == "text") {
                    return routing::Reply{"200 OK", "text/plain; charset=utf-8",
                                          site_audit::audit::ReportRenderer::toText(report)};
                }
                return routing::Reply::fromJson(site_audit::audit::ReportRenderer::toJson(report));
            } catch (const std::exception&) {
                return failureReply(url);
            }
        });
    });
}

void AuditController::analyzeSummary(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    auto aborted = trackAbort(res, "analyze_summary");
    readJsonBody(res, aborted, [this, res, aborted](const nlohmann::json& body) {
        const std::string url = stringField(body, "url");
        if (url.empty()) {
            badRequest(res, "url is required");
            return;
        }

        auto service = AuditController::service();
        if (!service) {
            serverError(res, "Audit service is not initialized");
            return;
        }

        respondAsync(res, aborted, [service, url]() -> routing::Reply {
            const auto start = std::chrono::steady_clock::now();
            try {
                site_audit::ExecutiveSummary summary = service->analyzeSummary(url);
                LOG_INFO("POST /analyze_summary " + summary.targetUrl + " answered in " +
                         std::to_string(millisecondsSince(start)) + "ms (" + summary.source + ")");
                return routing::Reply::fromJson(site_audit::services::ExecutiveSummaryBuilder::toJson(summary));
            } catch (const std::exception&) {
                return failureReply(url);
            }
        });
    });
}

void AuditController::health(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    auto service = AuditController::service();
    nlohmann::json response = {
        {"status", service ? "ok" : "starting"},
        {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count()}
    };
    json(res, response, service ? "200 OK" : "503 Service Unavailable");
}

ROUTE_CONTROLLER(AuditController) {
    using namespace routing;
    REGISTER_ROUTE(HttpMethod::POST, "/report", report, AuditController);
    REGISTER_ROUTE(HttpMethod::POST, "/analyze_summary", analyzeSummary, AuditController);
    REGISTER_ROUTE(HttpMethod::GET, "/health", health, AuditController);
}
