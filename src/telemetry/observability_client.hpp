/**
 * @file observability_client.hpp
 * @brief The in-process telemetry collector.
 *
 * ObservabilityClient is the single rendezvous point for metrics, events and
 * spans. It is constructed once at startup and passed by reference to the
 * request pipeline and the task queue instrumentation.
 *
 * Concurrency: every table mutation happens under one recursive mutex and
 * is O(1). Exporters are notified after the lock is released, on a copy of
 * the exporter list, so a slow exporter never blocks other producers.
 *
 * Failure policy: only record_metric() can reject a call. Unknown span or
 * task ids are silent no-ops, and exporter failures are logged and dropped.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "core/value.hpp"
#include "telemetry/exporter.hpp"
#include "telemetry/records.hpp"
#include "telemetry/scoped_span.hpp"

#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace telemetry_hub {

class ObservabilityClient {
public:
    struct Options {
        CollectorConfig retention;
        std::shared_ptr<Logger> logger;    ///< null = discard collector logs
    };

    ObservabilityClient();
    explicit ObservabilityClient(Options opts);

    // Non-copyable, non-movable: handles and adapters hold references to it
    ObservabilityClient(const ObservabilityClient&) = delete;
    ObservabilityClient& operator=(const ObservabilityClient&) = delete;

    // ── Metrics ──────────────────────────────

    /**
     * @brief Record a numeric metric.
     *
     * Fails with ErrorKind::InvalidType when @p value is not numeric and
     * with ErrorKind::InvalidArgument when @p name is empty. Nothing is
     * stored or exported on failure.
     */
    Result<MetricRecord> record_metric(std::string name, const Value& value,
                                       const TagValues& tags = {});

    [[nodiscard]] std::vector<MetricRecord> get_metrics(
        std::optional<std::string_view> name = std::nullopt) const;

    // ── Events ───────────────────────────────

    EventRecord record_event(std::string name, std::string message,
                             Severity severity = Severity::Info,
                             const TagValues& tags = {});

    [[nodiscard]] std::vector<EventRecord> get_events(
        std::optional<std::string_view> name = std::nullopt) const;

    // ── Spans ────────────────────────────────

    SpanId start_span(std::string name, const TagValues& tags = {});

    /// Open a span owned by the returned RAII handle.
    [[nodiscard]] ScopedSpan span(std::string name, const TagValues& tags = {});

    /**
     * @brief Run @p fn inside a scoped span.
     *
     * A std::exception escaping @p fn is recorded as the span error (status
     * "error") and rethrown unchanged.
     */
    template <typename F>
    auto run_in_span(std::string name, const TagValues& tags, F&& fn)
        -> std::invoke_result_t<F, ScopedSpan&>;

    void add_span_tag(const SpanId& span_id, std::string key, const Value& value);
    void set_span_status(const SpanId& span_id, std::string_view status);
    void set_span_error(const SpanId& span_id, std::string error);
    [[nodiscard]] std::optional<std::string> get_span_status(const SpanId& span_id) const;

    /**
     * @brief Complete an active span.
     *
     * Returns std::nullopt when the id is unknown or already completed.
     */
    std::optional<SpanRecord> complete_span(const SpanId& span_id,
                                            std::optional<std::string> status = std::nullopt,
                                            std::optional<std::string> error = std::nullopt);

    [[nodiscard]] std::vector<SpanRecord> get_completed_spans(
        std::optional<std::string_view> name = std::nullopt) const;

    [[nodiscard]] size_t active_span_count() const;

    // ── Tasks ────────────────────────────────

    SpanId begin_task(std::optional<TaskId> task_id, std::string task_name,
                      std::optional<std::string> queue = std::nullopt);

    std::optional<SpanRecord> complete_task(std::optional<TaskId> task_id,
                                            std::string_view status = "success",
                                            const Value& result = {},
                                            std::optional<std::string> error = std::nullopt);

    std::optional<SpanRecord> fail_task(std::optional<TaskId> task_id, const std::exception& exception);
    std::optional<SpanRecord> fail_task(std::optional<TaskId> task_id, std::string error);

    [[nodiscard]] size_t in_flight_task_count() const;

    // ── Lifecycle / exporters ────────────────

    /// Clear all records, active spans and task mappings. Exporters stay.
    void reset();

    /// Identity-based idempotent registration. Null is ignored.
    void register_exporter(std::shared_ptr<IExporter> exporter);
    void clear_exporters();
    [[nodiscard]] size_t exporter_count() const;

    [[nodiscard]] Logger& logger() noexcept { return *logger_; }

private:
    struct ActiveSpan {
        SpanId span_id;
        std::string name;
        Timestamp start_time;
        SteadyTime start_instant;
        Tags tags;
        std::string status{span_status::kInProgress};
        std::optional<std::string> error;
    };

    template <typename Record>
    void notify_exporters(ExporterCapability capability, std::string_view hook,
                          void (IExporter::*method)(const Record&), const Record& record);

    template <typename Record>
    static void append_bounded(std::deque<Record>& records, Record record, size_t max_size);

    CollectorConfig retention_;
    std::shared_ptr<Logger> logger_;

    std::deque<MetricRecord> metrics_;
    std::deque<EventRecord> events_;
    std::deque<SpanRecord> completed_spans_;
    std::unordered_map<SpanId, ActiveSpan> active_spans_;
    std::unordered_map<TaskId, SpanId> task_spans_;
    std::vector<std::shared_ptr<IExporter>> exporters_;

    mutable std::recursive_mutex mutex_;
};

// ── Template implementations ─────────────────

template <typename F>
auto ObservabilityClient::run_in_span(std::string name, const TagValues& tags, F&& fn)
    -> std::invoke_result_t<F, ScopedSpan&> {
    ScopedSpan scope = span(std::move(name), tags);
    try {
        return std::invoke(std::forward<F>(fn), scope);
    } catch (const std::exception& e) {
        scope.record_exception(e.what());
        throw;
    }
}

}  // namespace telemetry_hub
