/**
 * @file request_instrumentation.cpp
 * @brief Request middleware implementations.
 */

#include "instrumentation/request_instrumentation.hpp"
#include "cache/memory_cache.hpp"

#include <cstdio>
#include <string>

namespace telemetry_hub {

namespace {

std::string format_ms(double ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", ms);
    return buf;
}

}  // namespace

// ── RequestSpanMiddleware ────────────────────

RequestSpanMiddleware::RequestSpanMiddleware(ObservabilityClient& client, Handler next)
    : client_(client), next_(std::move(next)) {}

HttpResponse RequestSpanMiddleware::operator()(const HttpRequest& request) const {
    client_.logger().debug("Request received", {{"method", request.method}, {"path", request.path}});

    return client_.run_in_span("http.request",
                               {{"method", request.method}, {"path", request.path}},
                               [&](ScopedSpan& span) {
        HttpResponse response = next_(request);
        span.add_tag("status_code", response.status_code);
        span.set_status(response.status_code >= 500 ? span_status::kError : span_status::kOk);
        return response;
    });
}

// ── ResponseTimeMiddleware ───────────────────

ResponseTimeMiddleware::ResponseTimeMiddleware(ObservabilityClient& client, Handler next,
                                               std::chrono::milliseconds slow_threshold)
    : client_(client), next_(std::move(next)), slow_threshold_(slow_threshold) {}

HttpResponse ResponseTimeMiddleware::operator()(const HttpRequest& request) const {
    auto start = std::chrono::steady_clock::now();
    HttpResponse response = next_(request);
    double duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (!response.has_header("X-Response-Time-ms")) {
        response.headers["X-Response-Time-ms"] = format_ms(duration_ms);
    }

    (void)client_.record_metric("http.response_time_ms", duration_ms,
                                {{"path", request.path},
                                 {"method", request.method},
                                 {"status", response.status_code}});

    if (duration_ms > static_cast<double>(slow_threshold_.count())) {
        client_.record_event("http.request.slow", "Slow request detected: " + request.path,
                             Severity::Warning,
                             {{"path", request.path},
                              {"method", request.method},
                              {"duration_ms", format_ms(duration_ms)},
                              {"threshold_ms", static_cast<int64_t>(slow_threshold_.count())}});
    }
    return response;
}

// ── CacheAttachMiddleware ────────────────────

CacheAttachMiddleware::CacheAttachMiddleware(ObservabilityClient& client, MemoryCache& cache, Handler next)
    : client_(client), cache_(cache), next_(std::move(next)) {}

HttpResponse CacheAttachMiddleware::operator()(const HttpRequest& request) const {
    HttpRequest attached = request;
    attached.cache = &cache_;
    (void)client_.record_metric("cache.backend.attached", 1,
                                {{"backend", cache_.backend_name()}, {"path", request.path}});
    return next_(attached);
}

// ── Factories ────────────────────────────────

Middleware request_span_middleware(ObservabilityClient& client) {
    return [&client](Handler next) -> Handler {
        return RequestSpanMiddleware(client, std::move(next));
    };
}

Middleware response_time_middleware(ObservabilityClient& client, std::chrono::milliseconds slow_threshold) {
    return [&client, slow_threshold](Handler next) -> Handler {
        return ResponseTimeMiddleware(client, std::move(next), slow_threshold);
    };
}

Middleware response_time_middleware(ObservabilityClient& client, const HttpConfig& http) {
    return response_time_middleware(client,
                                    std::chrono::milliseconds{http.slow_request_threshold_ms});
}

Middleware cache_attach_middleware(ObservabilityClient& client, MemoryCache& cache) {
    return [&client, &cache](Handler next) -> Handler {
        return CacheAttachMiddleware(client, cache, std::move(next));
    };
}

}  // namespace telemetry_hub
