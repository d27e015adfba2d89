/**
 * @file ndjson_exporter.hpp
 * @brief Exporter that writes every captured record as one NDJSON line.
 */

#pragma once

#include "core/logger.hpp"
#include "telemetry/exporter.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace telemetry_hub {

/**
 * @brief Serializes metrics, events and spans to an ILogSink.
 *
 * Line shapes:
 *   {"type":"metric","name":...,"value":...,"ts":...,"tags":{...}}
 *   {"type":"event","name":...,"message":...,"severity":...,"ts":...,"tags":{...}}
 *   {"type":"span","span_id":...,"name":...,"status":...,"duration_ms":...,
 *    "start":...,"end":...,"tags":{...},"error":...}
 */
class NdjsonExporter : public IExporter {
public:
    explicit NdjsonExporter(std::unique_ptr<ILogSink> sink);

    [[nodiscard]] std::string name() const override { return "ndjson"; }

    void export_metric(const MetricRecord& metric) override;
    void export_event(const EventRecord& event) override;
    void export_span(const SpanRecord& span) override;

    void flush();

    static std::string to_json(const MetricRecord& metric);
    static std::string to_json(const EventRecord& event);
    static std::string to_json(const SpanRecord& span);

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
};

}  // namespace telemetry_hub
