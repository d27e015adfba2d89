/**
 * @file verify.cpp
 * @brief Verification routine behind the telemetry_verify tool.
 */

#include "app/verify.hpp"

#include <chrono>
#include <cstdio>
#include <exception>

namespace telemetry_hub {

namespace {

constexpr const char* kVerificationKey = "observability:verification";

bool cache_roundtrip(MemoryCache& cache, std::ostream& out) {
    try {
        cache.set(kVerificationKey, "ok", std::chrono::seconds{30});
        return cache.get(kVerificationKey) == "ok";
    } catch (const std::exception& e) {
        out << "Cache error: " << e.what() << '\n';
        return false;
    }
}

std::string format_ms(double ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", ms);
    return buf;
}

}  // namespace

VerifyReport run_verification(ObservabilityClient& client,
                              MemoryCache& cache,
                              TaskQueue& queue,
                              std::ostream& out) {
    VerifyReport report;
    client.reset();

    // ── Cache round trip ─────────────────────
    out << "Checking cache backend roundtrip ...\n";
    report.cache_hit = cache_roundtrip(cache, out);
    (void)client.record_metric("cache.roundtrip", 1,
                               {{"backend", cache.backend_name()},
                                {"result", report.cache_hit ? "hit" : "miss"}});
    if (report.cache_hit) {
        out << "Cache roundtrip succeeded using " << cache.backend_name() << '\n';
    } else {
        out << "WARNING: Cache roundtrip failed using " << cache.backend_name() << '\n';
    }

    // ── Instrumented test task ───────────────
    out << "Executing test task via in-process runner ...\n";
    try {
        report.task_result = queue.apply("verify.test_task", [] {
            return std::string{kTestTaskResult};
        });
        report.task_succeeded = true;
        out << "Test task completed with result: " << report.task_result << '\n';
    } catch (const std::exception& e) {
        out << "WARNING: Test task failed: " << e.what() << '\n';
    }

    client.record_event("observability.check", "Observability verification completed",
                        Severity::Info,
                        {{"metrics", client.get_metrics().size()},
                         {"spans", client.get_completed_spans().size()}});

    // ── Summary ──────────────────────────────
    auto spans = client.get_completed_spans();
    auto metrics = client.get_metrics();
    auto events = client.get_events();
    report.spans = spans.size();
    report.metrics = metrics.size();
    report.events = events.size();

    out << "\nCaptured instrumentation summary:\n"
        << "  * " << spans.size() << " spans\n"
        << "  * " << metrics.size() << " metrics\n"
        << "  * " << events.size() << " events\n";
    for (const auto& span : spans) {
        out << "    - span=" << span.tag_or("task_name", span.name)
            << " status=" << span.status
            << " duration=" << format_ms(span.duration_ms) << "ms\n";
    }
    return report;
}

}  // namespace telemetry_hub
