/**
 * @file observability_client.cpp
 * @brief ObservabilityClient implementation.
 */

#include "telemetry/observability_client.hpp"
#include "core/id_generator.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>

namespace telemetry_hub {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string format_ms(double ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", ms);
    return buf;
}

std::string tags_to_string(const Tags& tags) {
    std::string out;
    for (const auto& [key, value] : tags) {
        if (!out.empty()) out += ',';
        out += key + '=' + value;
    }
    return out;
}

template <typename Record>
std::vector<Record> filter_by_name(const std::deque<Record>& records,
                                   std::optional<std::string_view> name) {
    std::vector<Record> out;
    out.reserve(records.size());
    for (const auto& record : records) {
        if (!name || record.name == *name) out.push_back(record);
    }
    return out;
}

}  // namespace

ObservabilityClient::ObservabilityClient() : ObservabilityClient(Options{}) {}

ObservabilityClient::ObservabilityClient(Options opts)
    : retention_(opts.retention)
    , logger_(std::move(opts.logger)) {
    if (!logger_) {
        logger_ = std::make_shared<Logger>(std::make_unique<NullSink>(), LogLevel::Error);
    }
}

// ── Metrics ──────────────────────────────────

Result<MetricRecord> ObservabilityClient::record_metric(std::string name, const Value& value,
                                                        const TagValues& tags) {
    auto numeric = coerce_numeric(value);
    if (!numeric) {
        return numeric.error();
    }
    if (name.empty()) {
        return Error{ErrorKind::InvalidArgument, "Metric name must not be empty"};
    }

    MetricRecord record{
        .name = std::move(name),
        .value = *numeric,
        .tags = normalize_tags(tags),
        .timestamp = std::chrono::system_clock::now()
    };

    {
        std::lock_guard lock(mutex_);
        append_bounded(metrics_, record, retention_.max_metrics);
    }

    if (logger_->enabled(LogLevel::Debug)) {
        logger_->debug("Metric recorded", {{"metric_name", record.name},
                                           {"metric_value", Value{record.value}.to_string()},
                                           {"metric_tags", tags_to_string(record.tags)}});
    }
    notify_exporters(ExporterCapability::Metrics, "export_metric",
                     &IExporter::export_metric, record);
    return record;
}

std::vector<MetricRecord> ObservabilityClient::get_metrics(std::optional<std::string_view> name) const {
    std::lock_guard lock(mutex_);
    return filter_by_name(metrics_, name);
}

// ── Events ───────────────────────────────────

EventRecord ObservabilityClient::record_event(std::string name, std::string message,
                                              Severity severity, const TagValues& tags) {
    EventRecord record{
        .name = std::move(name),
        .message = std::move(message),
        .severity = severity,
        .tags = normalize_tags(tags),
        .timestamp = std::chrono::system_clock::now()
    };

    {
        std::lock_guard lock(mutex_);
        append_bounded(events_, record, retention_.max_events);
    }

    LogLevel level = LogLevel::Info;
    if (severity == Severity::Warning) level = LogLevel::Warn;
    if (severity == Severity::Error || severity == Severity::Critical) level = LogLevel::Error;
    logger_->log(level, "Observability event",
                 {{"event_name", record.name},
                  {"event_severity", std::string{to_string(severity)}},
                  {"event_tags", tags_to_string(record.tags)}});

    notify_exporters(ExporterCapability::Events, "export_event",
                     &IExporter::export_event, record);
    return record;
}

std::vector<EventRecord> ObservabilityClient::get_events(std::optional<std::string_view> name) const {
    std::lock_guard lock(mutex_);
    return filter_by_name(events_, name);
}

// ── Spans ────────────────────────────────────

SpanId ObservabilityClient::start_span(std::string name, const TagValues& tags) {
    ActiveSpan active{
        .span_id = generate_id(),
        .name = std::move(name),
        .start_time = std::chrono::system_clock::now(),
        .start_instant = std::chrono::steady_clock::now(),
        .tags = normalize_tags(tags),
    };
    SpanId span_id = active.span_id;

    if (logger_->enabled(LogLevel::Debug)) {
        logger_->debug("Span started", {{"span_name", active.name},
                                        {"span_id", span_id},
                                        {"span_tags", tags_to_string(active.tags)}});
    }

    std::lock_guard lock(mutex_);
    active_spans_.emplace(span_id, std::move(active));
    return span_id;
}

ScopedSpan ObservabilityClient::span(std::string name, const TagValues& tags) {
    return ScopedSpan(*this, start_span(std::move(name), tags));
}

void ObservabilityClient::add_span_tag(const SpanId& span_id, std::string key, const Value& value) {
    std::string text = value.to_string();
    std::lock_guard lock(mutex_);
    auto it = active_spans_.find(span_id);
    if (it != active_spans_.end()) {
        it->second.tags[std::move(key)] = std::move(text);
    }
}

void ObservabilityClient::set_span_status(const SpanId& span_id, std::string_view status) {
    std::string normalized = lowercase(status);
    std::lock_guard lock(mutex_);
    auto it = active_spans_.find(span_id);
    if (it != active_spans_.end()) {
        it->second.status = std::move(normalized);
    }
}

void ObservabilityClient::set_span_error(const SpanId& span_id, std::string error) {
    std::lock_guard lock(mutex_);
    auto it = active_spans_.find(span_id);
    if (it != active_spans_.end()) {
        it->second.error = std::move(error);
    }
}

std::optional<std::string> ObservabilityClient::get_span_status(const SpanId& span_id) const {
    std::lock_guard lock(mutex_);
    auto it = active_spans_.find(span_id);
    if (it == active_spans_.end()) return std::nullopt;
    return it->second.status;
}

std::optional<SpanRecord> ObservabilityClient::complete_span(const SpanId& span_id,
                                                             std::optional<std::string> status,
                                                             std::optional<std::string> error) {
    std::optional<ActiveSpan> active;
    {
        std::lock_guard lock(mutex_);
        auto node = active_spans_.extract(span_id);
        if (node.empty()) return std::nullopt;
        active = std::move(node.mapped());
    }

    auto end_instant = std::chrono::steady_clock::now();
    auto end_time = std::chrono::system_clock::now();
    double duration_ms = std::chrono::duration<double, std::milli>(
        end_instant - active->start_instant).count();

    std::string final_status = status ? lowercase(*status) : active->status;
    if (final_status.empty() || final_status == span_status::kInProgress) {
        final_status = std::string{span_status::kOk};
    }

    SpanRecord record{
        .span_id = span_id,
        .name = std::move(active->name),
        .status = std::move(final_status),
        .duration_ms = duration_ms,
        .start_time = active->start_time,
        .end_time = end_time,
        .tags = std::move(active->tags),
        .error = error ? std::move(error) : std::move(active->error)
    };

    {
        std::lock_guard lock(mutex_);
        append_bounded(completed_spans_, record, retention_.max_spans);
    }

    LogFields fields{{"span_id", span_id},
                     {"span_name", record.name},
                     {"span_status", record.status},
                     {"span_duration_ms", format_ms(duration_ms)},
                     {"span_tags", tags_to_string(record.tags)}};
    if (record.error) {
        fields.emplace_back("error", *record.error);
        logger_->error("Span completed with error", fields);
    } else {
        logger_->debug("Span completed", fields);
    }

    notify_exporters(ExporterCapability::Spans, "export_span",
                     &IExporter::export_span, record);
    return record;
}

std::vector<SpanRecord> ObservabilityClient::get_completed_spans(std::optional<std::string_view> name) const {
    std::lock_guard lock(mutex_);
    return filter_by_name(completed_spans_, name);
}

size_t ObservabilityClient::active_span_count() const {
    std::lock_guard lock(mutex_);
    return active_spans_.size();
}

// ── Tasks ────────────────────────────────────

SpanId ObservabilityClient::begin_task(std::optional<TaskId> task_id, std::string task_name,
                                       std::optional<std::string> queue) {
    TaskId task_identifier = (task_id && !task_id->empty()) ? std::move(*task_id) : generate_id();

    TagValues tags{{"task_name", task_name}};
    if (queue && !queue->empty()) {
        tags.emplace("queue", *queue);
    }
    SpanId span_id = start_span("task.run", tags);

    {
        std::lock_guard lock(mutex_);
        task_spans_[task_identifier] = span_id;
    }

    record_event("task.started", "Task " + task_name + " started", Severity::Info,
                 {{"task_id", task_identifier}});
    return span_id;
}

std::optional<SpanRecord> ObservabilityClient::complete_task(std::optional<TaskId> task_id,
                                                             std::string_view status,
                                                             const Value& result,
                                                             std::optional<std::string> error) {
    TaskId task_identifier = (task_id && !task_id->empty()) ? std::move(*task_id) : TaskId{"unknown"};
    std::string status_normalized = lowercase(status);

    SpanId span_id;
    {
        std::lock_guard lock(mutex_);
        auto node = task_spans_.extract(task_identifier);
        if (node.empty()) return std::nullopt;
        span_id = std::move(node.mapped());
    }

    if (!result.is_none()) {
        add_span_tag(span_id, "result", result);
    }
    set_span_status(span_id, status_normalized);
    auto record = complete_span(span_id, status_normalized, error);
    if (!record) return record;

    static const std::string kUnknown{"unknown"};
    const std::string& task_name = record->tag_or("task_name", kUnknown);

    // Numeric by construction, so this cannot be rejected.
    (void)record_metric("task.runtime_ms", record->duration_ms,
                        {{"task_name", task_name}, {"status", status_normalized}});

    if (error) {
        record_event("task.failed", "Task " + task_name + " failed", Severity::Error,
                     {{"task_id", task_identifier}, {"error", *error}});
    } else {
        record_event("task.completed", "Task " + task_name + " completed", Severity::Info,
                     {{"task_id", task_identifier}, {"status", status_normalized}});
    }
    return record;
}

std::optional<SpanRecord> ObservabilityClient::fail_task(std::optional<TaskId> task_id,
                                                         const std::exception& exception) {
    return fail_task(std::move(task_id), std::string{exception.what()});
}

std::optional<SpanRecord> ObservabilityClient::fail_task(std::optional<TaskId> task_id,
                                                         std::string error) {
    return complete_task(std::move(task_id), "failure", Value{}, std::move(error));
}

size_t ObservabilityClient::in_flight_task_count() const {
    std::lock_guard lock(mutex_);
    return task_spans_.size();
}

// ── Lifecycle / exporters ────────────────────

void ObservabilityClient::reset() {
    std::lock_guard lock(mutex_);
    metrics_.clear();
    events_.clear();
    completed_spans_.clear();
    active_spans_.clear();
    task_spans_.clear();
}

void ObservabilityClient::register_exporter(std::shared_ptr<IExporter> exporter) {
    if (!exporter) return;

    std::lock_guard lock(mutex_);
    const void* identity = exporter->identity();
    auto it = std::find_if(exporters_.begin(), exporters_.end(),
                           [identity](const auto& e) { return e->identity() == identity; });
    if (it != exporters_.end()) return;
    exporters_.push_back(std::move(exporter));
}

void ObservabilityClient::clear_exporters() {
    std::lock_guard lock(mutex_);
    exporters_.clear();
}

size_t ObservabilityClient::exporter_count() const {
    std::lock_guard lock(mutex_);
    return exporters_.size();
}

// ── Private helpers ──────────────────────────

template <typename Record>
void ObservabilityClient::notify_exporters(ExporterCapability capability, std::string_view hook,
                                           void (IExporter::*method)(const Record&),
                                           const Record& record) {
    std::vector<std::shared_ptr<IExporter>> exporters;
    {
        std::lock_guard lock(mutex_);
        exporters = exporters_;
    }

    for (const auto& exporter : exporters) {
        if (!has_capability(exporter->capabilities(), capability)) continue;
        try {
            ((*exporter).*method)(record);
        } catch (const std::exception& e) {
            logger_->error("Observability exporter failed",
                           {{"exporter", exporter->name()},
                            {"hook", std::string{hook}},
                            {"error", e.what()}});
        } catch (...) {
            logger_->error("Observability exporter failed",
                           {{"exporter", exporter->name()},
                            {"hook", std::string{hook}},
                            {"error", "non-standard exception"}});
        }
    }
}

template <typename Record>
void ObservabilityClient::append_bounded(std::deque<Record>& records, Record record, size_t max_size) {
    records.push_back(std::move(record));
    if (max_size > 0) {
        while (records.size() > max_size) records.pop_front();
    }
}

}  // namespace telemetry_hub
