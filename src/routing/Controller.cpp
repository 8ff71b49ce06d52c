#include "../../include/routing/Controller.h"
#include "../../include/Logger.h"
#include <optional>
#include <thread>

namespace routing {

nlohmann::json Controller::errorBody(const std::string& code, const std::string& message) {
    return {
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

void Controller::json(uWS::HttpResponse<false>* res, const nlohmann::json& data, const std::string& status) {
    res->writeStatus(status)
       ->writeHeader("Content-Type", "application/json")
       ->writeHeader("Access-Control-Allow-Origin", "*")
       ->end(data.dump());
}

void Controller::text(uWS::HttpResponse<false>* res, const std::string& content, const std::string& status) {
    res->writeStatus(status)
       ->writeHeader("Content-Type", "text/plain; charset=utf-8")
       ->end(content);
}

void Controller::error(uWS::HttpResponse<false>* res, const std::string& status,
                       const std::string& code, const std::string& message) {
    json(res, errorBody(code, message), status);
}

void Controller::notFound(uWS::HttpResponse<false>* res, const std::string& message) {
    error(res, "404 Not Found", "NOT_FOUND", message);
}

void Controller::badRequest(uWS::HttpResponse<false>* res, const std::string& message) {
    error(res, "400 Bad Request", "BAD_REQUEST", message);
}

void Controller::serverError(uWS::HttpResponse<false>* res, const std::string& message) {
    error(res, "500 Internal Server Error", "INTERNAL_ERROR", message);
}

Controller::AbortFlag Controller::trackAbort(uWS::HttpResponse<false>* res, const std::string& action) {
    auto aborted = std::make_shared<std::atomic<bool>>(false);
    // Every handler that answers later needs onAborted, or uWebSockets terminates
    res->onAborted([aborted, action]() {
        aborted->store(true);
        LOG_WARNING("Client disconnected during " + action);
    });
    return aborted;
}

void Controller::readJsonBody(uWS::HttpResponse<false>* res, AbortFlag aborted, BodyHandler onBody) {
    res->onData([this, res, aborted, onBody = std::move(onBody), buffer = std::string(), oversized = false]
                (std::string_view data, bool last) mutable {
        if (!oversized) {
            if (buffer.size() + data.size() > kMaxBodyBytes) {
                oversized = true;
                buffer.clear();
            } else {
                buffer.append(data.data(), data.size());
            }
        }
        if (!last || aborted->load()) {
            return;
        }

        if (oversized) {
            error(res, "413 Payload Too Large", "PAYLOAD_TOO_LARGE",
                  "Request body exceeds " + std::to_string(kMaxBodyBytes) + " bytes");
            return;
        }

        nlohmann::json body;
        try {
            body = buffer.empty() ? nlohmann::json::object() : nlohmann::json::parse(buffer);
        } catch (const nlohmann::json::exception& e) {
            badRequest(res, "Invalid JSON format: " + std::string(e.what()));
            return;
        }
        if (!body.is_object()) {
            badRequest(res, "Request body must be a JSON object");
            return;
        }
        onBody(body);
    });
}

AdmissionGate& Controller::workGate() {
    static AdmissionGate gate(kMaxConcurrentWork);
    return gate;
}

void Controller::respondAsync(uWS::HttpResponse<false>* res, AbortFlag aborted, Work work) {
    std::optional<AdmissionGate::Ticket> ticket = workGate().tryAcquire();
    if (!ticket) {
        LOG_WARNING("Refusing request: " + std::to_string(kMaxConcurrentWork) + " jobs already running");
        error(res, "503 Service Unavailable", "BUSY", "Too many audits in progress, retry shortly");
        return;
    }

    uWS::Loop* loop = uWS::Loop::get();
    std::thread([loop, res, aborted, work = std::move(work), ticket = std::move(*ticket)]() {
        Reply reply;
        try {
            reply = work();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Unhandled error in request worker: ") + e.what());
            reply = Reply::fromJson(errorBody("INTERNAL_ERROR", e.what()), "500 Internal Server Error");
        }

        // uWebSockets objects may only be touched on the loop thread
        loop->defer([res, aborted, reply = std::move(reply)]() {
            if (aborted->load()) {
                LOG_DEBUG("Dropping reply for aborted request (" + reply.status + ")");
                return;
            }
            res->cork([res, &reply]() {
                res->writeStatus(reply.status)
                   ->writeHeader("Content-Type", reply.contentType)
                   ->writeHeader("Access-Control-Allow-Origin", "*")
                   ->end(reply.body);
            });
        });
    }).detach();
}

} // namespace routing
