#pragma once
#include <string>
#include <functional>
#include <uwebsockets/App.h>

namespace routing {

enum class HttpMethod {
    GET,
    POST,
    OPTIONS
};

using Handler = std::function<void(uWS::HttpResponse<false>*, uWS::HttpRequest*)>;

struct Route {
    HttpMethod method;
    std::string path;
    Handler handler;
    std::string controllerName;
    std::string actionName;
};

inline std::string methodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::OPTIONS: return "OPTIONS";
    }
    return "UNKNOWN";
}

} // namespace routing
