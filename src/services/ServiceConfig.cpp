#include "../../include/site_audit/services/ServiceConfig.h"
#include <cstdlib>
#include <stdexcept>

namespace site_audit::services {

namespace {

std::string readEnv(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    return value;
}

int parsePort(const std::string& value) {
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("PORT is not a number: " + value);
    }
    if (consumed != value.size() || port < 1 || port > 65535) {
        throw std::invalid_argument("PORT must be between 1 and 65535: " + value);
    }
    return port;
}

} // namespace

ServiceConfig ServiceConfig::fromEnvironment() {
    ServiceConfig config;

    const std::string port = readEnv("PORT");
    if (!port.empty()) {
        config.port = parsePort(port);
    }
    config.logLevel = parseLogLevel(readEnv("LOG_LEVEL"), config.logLevel);
    config.logFile = readEnv("LOG_FILE");
    config.userAgent = readEnv("AUDIT_USER_AGENT", config.userAgent);
    config.browserlessUrl = readEnv("BROWSERLESS_URL");
    config.llmApiKey = readEnv("LLM_API_KEY");
    config.llmModel = readEnv("LLM_MODEL");
    config.llmBaseUrl = readEnv("LLM_BASE_URL");
    return config;
}

} // namespace site_audit::services
