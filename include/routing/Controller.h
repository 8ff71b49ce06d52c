#pragma once
#include "AdmissionGate.h"
#include "Route.h"
#include "RouteRegistry.h"
#include <atomic>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace routing {

// Response produced away from the event loop
struct Reply {
    std::string status = "200 OK";
    std::string contentType = "application/json";
    std::string body;

    static Reply fromJson(const nlohmann::json& data, const std::string& status = "200 OK") {
        return Reply{status, "application/json", data.dump()};
    }
};

// Base controller class
class Controller {
public:
    Controller() = default;
    virtual ~Controller() = default;

    // Request bodies above this size are rejected with 413
    static constexpr size_t kMaxBodyBytes = 64 * 1024;

    // Work started through respondAsync across all controllers; beyond it requests get 503
    static constexpr size_t kMaxConcurrentWork = 8;

    static nlohmann::json errorBody(const std::string& code, const std::string& message);

protected:
    using AbortFlag = std::shared_ptr<std::atomic<bool>>;
    using BodyHandler = std::function<void(const nlohmann::json& body)>;
    using Work = std::function<Reply()>;

    void json(uWS::HttpResponse<false>* res, const nlohmann::json& data, const std::string& status = "200 OK");
    void text(uWS::HttpResponse<false>* res, const std::string& content, const std::string& status = "200 OK");
    void error(uWS::HttpResponse<false>* res, const std::string& status,
               const std::string& code, const std::string& message);
    void notFound(uWS::HttpResponse<false>* res, const std::string& message = "Not Found");
    void badRequest(uWS::HttpResponse<false>* res, const std::string& message = "Bad Request");
    void serverError(uWS::HttpResponse<false>* res, const std::string& message = "Internal Server Error");

    // Installs the abort handler; the flag flips when the client goes away
    AbortFlag trackAbort(uWS::HttpResponse<false>* res, const std::string& action);

    // Buffers the body and hands it over parsed. Malformed JSON answers 400 and
    // oversized bodies 413 without calling onBody.
    void readJsonBody(uWS::HttpResponse<false>* res, AbortFlag aborted, BodyHandler onBody);

    // Runs work on its own thread and writes the reply back on the event loop,
    // unless the client aborted in the meantime. Answers 503 BUSY right away when
    // kMaxConcurrentWork jobs are already running. Must be called on the loop thread.
    void respondAsync(uWS::HttpResponse<false>* res, AbortFlag aborted, Work work);

private:
    static AdmissionGate& workGate();
};

// Macro for defining controller routes
#define ROUTE_CONTROLLER(ControllerClass) \
    namespace { \
        struct ControllerClass##Routes { \
            ControllerClass##Routes() { \
                registerRoutes(); \
            } \
            void registerRoutes(); \
        }; \
        static ControllerClass##Routes _##ControllerClass##_routes; \
    } \
    void ControllerClass##Routes::registerRoutes()

// Helper macro to register a route
#define REGISTER_ROUTE(method, path, handler, controllerClass) \
    RouteRegistry::getInstance().registerRoute({ \
        method, path, \
        [](uWS::HttpResponse<false>* res, uWS::HttpRequest* req) { \
            static controllerClass controller; \
            controller.handler(res, req); \
        }, \
        #controllerClass, #handler \
    });

} // namespace routing
