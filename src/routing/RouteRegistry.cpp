#include "../../include/routing/RouteRegistry.h"

namespace routing {

void RouteRegistry::registerRoute(const Route& route) {
    std::lock_guard<std::mutex> lock(mutex);
    routes.push_back(route);
    LOG_DEBUG("Registered route: " + methodToString(route.method) + " " + route.path +
              " -> " + route.controllerName + "::" + route.actionName);
}

std::vector<Route> RouteRegistry::getRoutes() const {
    std::lock_guard<std::mutex> lock(mutex);
    return routes;
}

} // namespace routing
