#pragma once
#include "Route.h"
#include "../Logger.h"
#include <vector>
#include <mutex>
#include <unordered_set>

namespace routing {

// Routes collected from controller static initializers, applied to the app in main()
class RouteRegistry {
public:
    static RouteRegistry& getInstance() {
        static RouteRegistry instance;
        return instance;
    }

    void registerRoute(const Route& route);

    std::vector<Route> getRoutes() const;

    // Later registrations of the same method + path are ignored
    template<bool SSL>
    void applyRoutes(uWS::TemplatedApp<SSL>& app);

private:
    RouteRegistry() = default;
    ~RouteRegistry() = default;
    RouteRegistry(const RouteRegistry&) = delete;
    RouteRegistry& operator=(const RouteRegistry&) = delete;

    std::vector<Route> routes;
    mutable std::mutex mutex;
};

template<bool SSL>
std::function<void(uWS::HttpResponse<SSL>*, uWS::HttpRequest*)> wrapHandler(
    const std::function<void(uWS::HttpResponse<SSL>*, uWS::HttpRequest*)>& handler,
    const std::string& method,
    const std::string& path) {

    return [handler, method, path](uWS::HttpResponse<SSL>* res, uWS::HttpRequest* req) {
        // Handlers write their own status line, nothing is written here
        if (Logger::getInstance().isEnabled(LogLevel::DEBUG)) {
            std::string_view queryString = req->getQuery();
            std::string logMessage = "[" + method + "] " + path;
            if (!queryString.empty()) {
                logMessage += "?" + std::string(queryString);
            }
            logMessage += " ua=" + std::string(req->getHeader("user-agent"));
            LOG_DEBUG(logMessage);
        }
        handler(res, req);
    };
}

template<bool SSL>
void RouteRegistry::applyRoutes(uWS::TemplatedApp<SSL>& app) {
    std::lock_guard<std::mutex> lock(mutex);

    // uWebSockets rejects duplicate method + path pairs
    std::unordered_set<std::string> registered;
    registered.reserve(routes.size());

    for (const auto& route : routes) {
        const std::string dedupeKey = methodToString(route.method) + " " + route.path;
        if (!registered.insert(dedupeKey).second) {
            LOG_WARNING("Skipping duplicate route " + dedupeKey + " from " + route.controllerName);
            continue;
        }
        auto wrappedHandler = wrapHandler<SSL>(
            route.handler,
            methodToString(route.method),
            route.path
        );

        switch (route.method) {
            case HttpMethod::GET:
                app.get(route.path, wrappedHandler);
                break;
            case HttpMethod::POST:
                app.post(route.path, wrappedHandler);
                break;
            case HttpMethod::OPTIONS:
                app.options(route.path, wrappedHandler);
                break;
        }
    }
}

} // namespace routing
