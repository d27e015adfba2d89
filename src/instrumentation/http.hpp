/**
 * @file http.hpp
 * @brief Minimal request/response vocabulary for the instrumented handler chain.
 *
 * The host's web stack owns routing and parsing; these types only carry what
 * the instrumentation needs to observe.
 */

#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

namespace telemetry_hub {

class MemoryCache;

struct HttpRequest {
    std::string method = "GET";
    std::string path = "/";
    std::map<std::string, std::string> headers;
    MemoryCache* cache = nullptr;     ///< attached by CacheAttachMiddleware
};

struct HttpResponse {
    int status_code = 200;
    std::string body;
    std::map<std::string, std::string> headers;

    [[nodiscard]] bool has_header(const std::string& name) const {
        return headers.count(name) > 0;
    }
};

using Handler = std::function<HttpResponse(const HttpRequest&)>;

/// A middleware turns the next handler in the chain into a new handler.
using Middleware = std::function<Handler(Handler)>;

/**
 * @brief Build a handler chain.
 *
 * The first middleware is outermost: it sees the request first and the
 * response last.
 */
inline Handler compose(Handler handler, std::initializer_list<Middleware> middlewares) {
    std::vector<Middleware> chain(middlewares);
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        handler = (*it)(std::move(handler));
    }
    return handler;
}

}  // namespace telemetry_hub
