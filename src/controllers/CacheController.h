#pragma once

#include "../../include/routing/Controller.h"
#include "../../include/site_audit/cache/AuditCache.h"
#include <memory>

class CacheController : public routing::Controller {
public:
    // Audit cache counters and occupancy
    void getCacheStats(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    // Drops expired entries now instead of on their next lookup
    void purgeExpired(uWS::HttpResponse<false>* res, uWS::HttpRequest* req);

    static void setCache(std::shared_ptr<site_audit::cache::AuditCache> cache);

    static nlohmann::json statsToJson(const site_audit::cache::AuditCache::Stats& stats);

    static double getCacheHitRate(const site_audit::cache::AuditCache::Stats& stats);

private:
    static std::shared_ptr<site_audit::cache::AuditCache> cache();
};
