/**
 * @file ndjson_exporter.cpp
 * @brief NdjsonExporter implementation.
 */

#include "telemetry/ndjson_exporter.hpp"
#include "core/value.hpp"

#include <cmath>
#include <sstream>

namespace telemetry_hub {

namespace {

void write_tags(std::ostringstream& oss, const Tags& tags) {
    oss << R"(,"tags":{)";
    bool first = true;
    for (const auto& [key, value] : tags) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << json_escape(key) << R"(":")" << json_escape(value) << '"';
    }
    oss << '}';
}

// JSON has no token for NaN or infinity.
std::string json_number(double v) {
    return std::isfinite(v) ? Value{v}.to_string() : std::string{"null"};
}

}  // namespace

NdjsonExporter::NdjsonExporter(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

std::string NdjsonExporter::to_json(const MetricRecord& metric) {
    std::ostringstream oss;
    oss << R"({"type":"metric")"
        << R"(,"name":")" << json_escape(metric.name) << '"'
        << R"(,"value":)" << json_number(metric.value)
        << R"(,"ts":")" << format_timestamp(metric.timestamp) << '"';
    write_tags(oss, metric.tags);
    oss << '}';
    return oss.str();
}

std::string NdjsonExporter::to_json(const EventRecord& event) {
    std::ostringstream oss;
    oss << R"({"type":"event")"
        << R"(,"name":")" << json_escape(event.name) << '"'
        << R"(,"message":")" << json_escape(event.message) << '"'
        << R"(,"severity":")" << to_string(event.severity) << '"'
        << R"(,"ts":")" << format_timestamp(event.timestamp) << '"';
    write_tags(oss, event.tags);
    oss << '}';
    return oss.str();
}

std::string NdjsonExporter::to_json(const SpanRecord& span) {
    std::ostringstream oss;
    oss << R"({"type":"span")"
        << R"(,"span_id":")" << span.span_id << '"'
        << R"(,"name":")" << json_escape(span.name) << '"'
        << R"(,"status":")" << json_escape(span.status) << '"'
        << R"(,"duration_ms":)" << json_number(span.duration_ms)
        << R"(,"start":")" << format_timestamp(span.start_time) << '"'
        << R"(,"end":")" << format_timestamp(span.end_time) << '"';
    write_tags(oss, span.tags);
    if (span.error) {
        oss << R"(,"error":")" << json_escape(*span.error) << '"';
    }
    oss << '}';
    return oss.str();
}

void NdjsonExporter::export_metric(const MetricRecord& metric) { emit(to_json(metric)); }
void NdjsonExporter::export_event(const EventRecord& event)    { emit(to_json(event)); }
void NdjsonExporter::export_span(const SpanRecord& span)       { emit(to_json(span)); }

void NdjsonExporter::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void NdjsonExporter::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace telemetry_hub
