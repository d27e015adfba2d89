/**
 * @file monitoring_exporter.hpp
 * @brief Default exporter forwarding to a downstream monitoring engine.
 */

#pragma once

#include "core/result.hpp"
#include "telemetry/exporter.hpp"

#include <memory>
#include <string>

namespace telemetry_hub {

class ObservabilityClient;

/**
 * @brief Contract of the downstream monitoring/alerting engine.
 *
 * The engine owns its own aggregation and alerting; the collector only
 * hands it copies of captured records.
 */
class MonitoringEngine {
public:
    virtual ~MonitoringEngine() = default;

    virtual void ingest_metric(const MetricRecord& metric) = 0;
    virtual void ingest_event(const EventRecord& event) = 0;
    virtual void ingest_span(const SpanRecord& span) = 0;
};

/**
 * @brief Forwards every record to a MonitoringEngine.
 *
 * Engine failures propagate to the collector, which logs them per hook.
 */
class MonitoringExporter : public IExporter {
public:
    explicit MonitoringExporter(std::shared_ptr<MonitoringEngine> engine);

    [[nodiscard]] std::string name() const override { return "monitoring"; }
    [[nodiscard]] const void* identity() const noexcept override { return engine_.get(); }

    void export_metric(const MetricRecord& metric) override;
    void export_event(const EventRecord& event) override;
    void export_span(const SpanRecord& span) override;

private:
    std::shared_ptr<MonitoringEngine> engine_;
};

/**
 * @brief Register the default monitoring exporter at bootstrap.
 *
 * Fails with ErrorKind::NotFound when no engine is available. The caller
 * may log and ignore the error; the client keeps working without exporters.
 * Registering the same engine twice is a no-op.
 */
Result<void> register_default_exporters(ObservabilityClient& client,
                                        std::shared_ptr<MonitoringEngine> engine);

}  // namespace telemetry_hub
