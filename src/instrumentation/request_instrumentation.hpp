/**
 * @file request_instrumentation.hpp
 * @brief Middlewares that instrument inbound request handling.
 */

#pragma once

#include "core/config.hpp"
#include "instrumentation/http.hpp"
#include "telemetry/observability_client.hpp"

#include <chrono>
#include <cstdint>

namespace telemetry_hub {

/**
 * @brief Opens one "http.request" span per request.
 *
 * The span is tagged with method and path, then with the response status
 * code. Status is "error" for 5xx responses and "ok" otherwise. A handler
 * exception completes the span with status "error" and is rethrown.
 */
class RequestSpanMiddleware {
public:
    RequestSpanMiddleware(ObservabilityClient& client, Handler next);

    HttpResponse operator()(const HttpRequest& request) const;

private:
    ObservabilityClient& client_;
    Handler next_;
};

/**
 * @brief Records handler latency as "http.response_time_ms".
 *
 * Also sets the X-Response-Time-ms header when absent and emits a
 * "http.request.slow" warning event above the threshold.
 */
class ResponseTimeMiddleware {
public:
    ResponseTimeMiddleware(ObservabilityClient& client, Handler next,
                           std::chrono::milliseconds slow_threshold = std::chrono::milliseconds{1500});

    HttpResponse operator()(const HttpRequest& request) const;

private:
    ObservabilityClient& client_;
    Handler next_;
    std::chrono::milliseconds slow_threshold_;
};

/**
 * @brief Attaches a cache to each request and counts the attachment.
 */
class CacheAttachMiddleware {
public:
    CacheAttachMiddleware(ObservabilityClient& client, MemoryCache& cache, Handler next);

    HttpResponse operator()(const HttpRequest& request) const;

private:
    ObservabilityClient& client_;
    MemoryCache& cache_;
    Handler next_;
};

// ── Middleware factories for compose() ───────

Middleware request_span_middleware(ObservabilityClient& client);
Middleware response_time_middleware(ObservabilityClient& client,
                                    std::chrono::milliseconds slow_threshold = std::chrono::milliseconds{1500});
/// Slow-request threshold taken from the [http] config table.
Middleware response_time_middleware(ObservabilityClient& client, const HttpConfig& http);
Middleware cache_attach_middleware(ObservabilityClient& client, MemoryCache& cache);

}  // namespace telemetry_hub
