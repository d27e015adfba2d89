/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for TelemetryHub extension points.
 *
 * An exporter may care about only one payload type. These concepts let
 * make_exporter() discover at compile time which hooks a type provides, so
 * narrow exporters need no boilerplate.
 */

#pragma once

#include <concepts>
#include <string_view>

namespace telemetry_hub {

// Forward declarations
struct MetricRecord;
struct EventRecord;
struct SpanRecord;

template <typename T>
concept MetricExporterLike = requires(T exporter, const MetricRecord& metric) {
    exporter.export_metric(metric);
};

template <typename T>
concept EventExporterLike = requires(T exporter, const EventRecord& event) {
    exporter.export_event(event);
};

template <typename T>
concept SpanExporterLike = requires(T exporter, const SpanRecord& span) {
    exporter.export_span(span);
};

/// A type usable as an exporter must provide at least one hook.
template <typename T>
concept ExporterLike = MetricExporterLike<T> || EventExporterLike<T> || SpanExporterLike<T>;

/// Optional: a human-readable name used in failure logs.
template <typename T>
concept NamedExporter = requires(const T exporter) {
    { exporter.name() } -> std::convertible_to<std::string_view>;
};

}  // namespace telemetry_hub
