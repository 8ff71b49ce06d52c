#include "CacheController.h"
#include "../../include/Logger.h"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <mutex>

namespace {

std::mutex cacheMutex;
std::shared_ptr<site_audit::cache::AuditCache> sharedCache;

} // namespace

void CacheController::setCache(std::shared_ptr<site_audit::cache::AuditCache> cache) {
    std::lock_guard<std::mutex> lock(cacheMutex);
    sharedCache = std::move(cache);
}

std::shared_ptr<site_audit::cache::AuditCache> CacheController::cache() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return sharedCache;
}

double CacheController::getCacheHitRate(const site_audit::cache::AuditCache::Stats& stats) {
    // Coalesced waiters reused someone else's crawl, so they count as hits
    const uint64_t served = stats.hits + stats.coalesced;
    const uint64_t total = served + stats.misses;
    return total > 0 ? static_cast<double>(served) / static_cast<double>(total) : 0.0;
}

nlohmann::json CacheController::statsToJson(const site_audit::cache::AuditCache::Stats& stats) {
    return {
        {"cache_hit_rate", std::round(getCacheHitRate(stats) * 1000.0) / 1000.0},
        {"cache_hits", stats.hits},
        {"cache_misses", stats.misses},
        {"coalesced_waits", stats.coalesced},
        {"computations", stats.computations},
        {"failures", stats.failures},
        {"entries", stats.entries},
        {"in_flight", stats.inFlight},
        {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count()}
    };
}

void CacheController::getCacheStats(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    auto auditCache = cache();
    if (!auditCache) {
        serverError(res, "Audit cache is not initialized");
        return;
    }

    const auto stats = auditCache->stats();
    res->writeStatus("200 OK")
       ->writeHeader("Content-Type", "application/json")
       ->writeHeader("Cache-Control", "no-cache")
       ->end(statsToJson(stats).dump());

    LOG_DEBUG("Cache stats requested - Hit rate: " + std::to_string(getCacheHitRate(stats) * 100) + "%");
}

void CacheController::purgeExpired(uWS::HttpResponse<false>* res, uWS::HttpRequest* req) {
    auto auditCache = cache();
    if (!auditCache) {
        serverError(res, "Audit cache is not initialized");
        return;
    }

    const size_t removed = auditCache->purgeExpired();
    json(res, {{"status", "success"}, {"removed", removed}});
    LOG_INFO("Purged " + std::to_string(removed) + " expired audit cache entries");
}

ROUTE_CONTROLLER(CacheController) {
    using namespace routing;
    REGISTER_ROUTE(HttpMethod::GET, "/api/cache/stats", getCacheStats, CacheController);
    REGISTER_ROUTE(HttpMethod::POST, "/api/cache/purge", purgeExpired, CacheController);
}
