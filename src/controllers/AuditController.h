#pragma once

#include "../../include/routing/Controller.h"
#include "../../include/site_audit/services/AuditService.h"
#include <memory>

class AuditController : public routing::Controller {
public:
    // POST /report {"url": "...", "format": "json" | "text"}
    void report(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    // POST /analyze_summary {"url": "..."}
    void analyzeSummary(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    void health(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    // Set once in main() before the app starts listening
    static void setService(std::shared_ptr<site_audit::services::AuditService> service);
    static std::shared_ptr<site_audit::services::AuditService> service();

    // Maps an audit failure to its HTTP reply; call from a catch block
    static routing::Reply failureReply(const std::string& url);

private:
    static std::shared_ptr<site_audit::services::AuditService>& serviceSlot();
};
