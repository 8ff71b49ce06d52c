#include <uwebsockets/App.h>
#include "../include/routing/RouteRegistry.h"
#include "../include/Logger.h"
#include "../include/site_audit/cache/AuditCache.h"
#include "../include/site_audit/services/AuditService.h"
#include "../include/site_audit/services/ServiceConfig.h"

// Controllers register their routes from static initializers in their own translation units
#include "controllers/AuditController.h"
#include "controllers/CacheController.h"

#include "crawler/BrowserlessClient.h"
#include "crawler/PageFetcher.h"
#include "services/LlmSummaryRefiner.h"

#include <csignal>
#include <execinfo.h>
#include <iostream>
#include <memory>
#include <unistd.h>

using namespace site_audit;

// Crash handler to log a backtrace on segfaults
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        char** messages = backtrace_symbols(array, size);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        if (messages) {
            for (int i = 0; i < size; ++i) {
                std::cerr << messages[i] << "\n";
            }
        }
        std::cerr.flush();
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

int main() {
    installCrashHandler();

    services::ServiceConfig config;
    try {
        config = services::ServiceConfig::fromEnvironment();
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().init(config.logLevel, true, config.logFile);
    LOG_INFO("============== SITE AUDIT STARTING ==============");

    // Plain fetcher for robots.txt and sitemap probes, and for pages when no renderer is configured
    auto resourceFetcher = std::make_shared<crawler::PageFetcher>(config.userAgent);
    std::shared_ptr<crawler::FetchPort> pageFetcher = resourceFetcher;
    if (config.renderPages()) {
        auto browserless = std::make_shared<crawler::BrowserlessClient>(config.browserlessUrl);
        browserless->setUserAgent(config.userAgent);
        if (!browserless->isAvailable()) {
            LOG_WARNING("Browserless at " + config.browserlessUrl + " did not answer its health check yet");
        }
        pageFetcher = browserless;
        LOG_INFO("Rendering pages through browserless at " + config.browserlessUrl);
    } else {
        LOG_INFO("BROWSERLESS_URL not set, fetching raw HTML");
    }

    std::shared_ptr<services::SummaryRefiner> refiner;
    if (config.refineSummaries()) {
        const auto settings = services::LlmSettings::resolve(config.llmApiKey, config.llmModel, config.llmBaseUrl);
        refiner = std::make_shared<services::LlmSummaryRefiner>(settings);
        LOG_INFO("Executive summaries refined with " + settings.model + " via " + settings.baseUrl);
    } else {
        LOG_INFO("LLM_API_KEY not set, executive summaries stay rule-based");
    }

    // The one cache shared by every request for the lifetime of the process
    auto auditCache = std::make_shared<cache::AuditCache>();
    auto auditService = std::make_shared<services::AuditService>(
        auditCache, pageFetcher, resourceFetcher, config.userAgent, refiner);

    AuditController::setService(auditService);
    CacheController::setCache(auditCache);

    LOG_INFO("=== Registered Routes ===");
    for (const auto& route : routing::RouteRegistry::getInstance().getRoutes()) {
        LOG_INFO(routing::methodToString(route.method) + " " + route.path +
                 " -> " + route.controllerName + "::" + route.actionName);
    }
    LOG_INFO("========================");

    auto app = uWS::App();
    routing::RouteRegistry::getInstance().applyRoutes(app);

    const int port = config.port;
    app.listen(port, [port](auto* listen_socket) {
        if (listen_socket) {
            LOG_INFO("Server listening on port " + std::to_string(port));
        } else {
            LOG_ERROR("Failed to listen on port " + std::to_string(port));
        }
    }).run();

    LOG_INFO("============== SITE AUDIT STOPPED ==============");
    Logger::getInstance().close();
    return 0;
}
