/**
 * @file monitoring_exporter.cpp
 * @brief MonitoringExporter and default exporter wiring.
 */

#include "telemetry/monitoring_exporter.hpp"
#include "telemetry/observability_client.hpp"

namespace telemetry_hub {

MonitoringExporter::MonitoringExporter(std::shared_ptr<MonitoringEngine> engine)
    : engine_(std::move(engine)) {}

void MonitoringExporter::export_metric(const MetricRecord& metric) { engine_->ingest_metric(metric); }
void MonitoringExporter::export_event(const EventRecord& event)    { engine_->ingest_event(event); }
void MonitoringExporter::export_span(const SpanRecord& span)       { engine_->ingest_span(span); }

Result<void> register_default_exporters(ObservabilityClient& client,
                                        std::shared_ptr<MonitoringEngine> engine) {
    if (!engine) {
        return Error{ErrorKind::NotFound, "Monitoring engine unavailable"};
    }
    client.register_exporter(std::make_shared<MonitoringExporter>(std::move(engine)));
    return {};
}

}  // namespace telemetry_hub
