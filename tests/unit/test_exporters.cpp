/**
 * @file test_exporters.cpp
 * @brief Unit tests for exporter fan-out, capability adapters and built-in exporters.
 */

#include "telemetry/monitoring_exporter.hpp"
#include "telemetry/ndjson_exporter.hpp"
#include "telemetry/observability_client.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace telemetry_hub;

namespace {

class RecordingExporter : public IExporter {
public:
    std::string name() const override { return "recording"; }

    void export_metric(const MetricRecord& metric) override { metrics.push_back(metric); }
    void export_event(const EventRecord& event) override { events.push_back(event); }
    void export_span(const SpanRecord& span) override { spans.push_back(span); }

    std::vector<MetricRecord> metrics;
    std::vector<EventRecord> events;
    std::vector<SpanRecord> spans;
};

class ThrowingExporter : public IExporter {
public:
    std::string name() const override { return "throwing"; }

    void export_metric(const MetricRecord&) override { throw std::runtime_error("metric sink down"); }
    void export_event(const EventRecord&) override { throw std::runtime_error("event sink down"); }
    void export_span(const SpanRecord&) override { throw std::runtime_error("span sink down"); }
};

// Duck-typed: metrics only, no IExporter base
struct MetricsOnly {
    std::string_view name() const { return "metrics-only"; }
    void export_metric(const MetricRecord& metric) { names.push_back(metric.name); }
    std::vector<std::string> names;
};

struct SpansOnly {
    void export_span(const SpanRecord& span) { names.push_back(span.name); }
    std::vector<std::string> names;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

class FakeEngine : public MonitoringEngine {
public:
    void ingest_metric(const MetricRecord&) override { ++metrics; }
    void ingest_event(const EventRecord&) override { ++events; }
    void ingest_span(const SpanRecord&) override { ++spans; }

    int metrics = 0;
    int events = 0;
    int spans = 0;
};

}  // namespace

// ═══════════════════════════════════════════════
// Fan-out
// ═══════════════════════════════════════════════

TEST(ExporterFanOutTest, ExporterSeesEveryRecordKind) {
    ObservabilityClient client;
    auto exporter = std::make_shared<RecordingExporter>();
    client.register_exporter(exporter);

    (void)client.record_metric("m", 1);
    client.record_event("e", "msg");
    client.complete_span(client.start_span("s"));

    ASSERT_EQ(exporter->metrics.size(), 1u);
    ASSERT_EQ(exporter->events.size(), 1u);
    ASSERT_EQ(exporter->spans.size(), 1u);
    EXPECT_EQ(exporter->metrics[0].name, "m");
    EXPECT_EQ(exporter->spans[0].name, "s");
}

TEST(ExporterFanOutTest, RejectedMetricIsNotExported) {
    ObservabilityClient client;
    auto exporter = std::make_shared<RecordingExporter>();
    client.register_exporter(exporter);

    EXPECT_FALSE(client.record_metric("m", "not a number"));
    EXPECT_TRUE(exporter->metrics.empty());
}

TEST(ExporterFanOutTest, RegistrationIsIdempotent) {
    ObservabilityClient client;
    auto exporter = std::make_shared<RecordingExporter>();
    client.register_exporter(exporter);
    client.register_exporter(exporter);
    client.register_exporter(nullptr);
    EXPECT_EQ(client.exporter_count(), 1u);

    (void)client.record_metric("m", 1);
    EXPECT_EQ(exporter->metrics.size(), 1u);
}

TEST(ExporterFanOutTest, FailingExporterDoesNotAffectOthers) {
    ObservabilityClient client;
    auto good = std::make_shared<RecordingExporter>();
    client.register_exporter(std::make_shared<ThrowingExporter>());
    client.register_exporter(good);

    auto result = client.record_metric("m", 1);
    EXPECT_TRUE(result.has_value());
    client.record_event("e", "msg");
    client.complete_span(client.start_span("s"));

    EXPECT_EQ(good->metrics.size(), 1u);
    EXPECT_EQ(good->events.size(), 1u);
    EXPECT_EQ(good->spans.size(), 1u);
    EXPECT_EQ(client.get_metrics().size(), 1u);
    EXPECT_EQ(client.get_completed_spans().size(), 1u);
}

TEST(ExporterFanOutTest, FailureIsLoggedWithExporterAndHook) {
    auto lines = std::make_shared<std::vector<std::string>>();
    ObservabilityClient::Options opts{
        .logger = std::make_shared<Logger>(std::make_unique<CaptureSink>(lines), LogLevel::Error)};
    ObservabilityClient client(opts);
    client.register_exporter(std::make_shared<ThrowingExporter>());

    (void)client.record_metric("m", 1);

    ASSERT_EQ(lines->size(), 1u);
    EXPECT_NE(lines->front().find(R"("exporter":"throwing")"), std::string::npos);
    EXPECT_NE(lines->front().find(R"("hook":"export_metric")"), std::string::npos);
    EXPECT_NE(lines->front().find("metric sink down"), std::string::npos);
}

TEST(ExporterFanOutTest, ClearExporters) {
    ObservabilityClient client;
    auto exporter = std::make_shared<RecordingExporter>();
    client.register_exporter(exporter);
    client.clear_exporters();
    EXPECT_EQ(client.exporter_count(), 0u);

    (void)client.record_metric("m", 1);
    EXPECT_TRUE(exporter->metrics.empty());
}

TEST(ExporterFanOutTest, ResetKeepsExporters) {
    ObservabilityClient client;
    client.register_exporter(std::make_shared<RecordingExporter>());
    client.reset();
    EXPECT_EQ(client.exporter_count(), 1u);
}

// ═══════════════════════════════════════════════
// Capability adapters
// ═══════════════════════════════════════════════

TEST(CapabilityExporterTest, CapabilitiesDerivedFromHooks) {
    auto metrics_only = make_exporter(std::make_shared<MetricsOnly>());
    auto spans_only = make_exporter(std::make_shared<SpansOnly>());

    EXPECT_EQ(metrics_only->capabilities(), ExporterCapability::Metrics);
    EXPECT_EQ(metrics_only->name(), "metrics-only");
    EXPECT_EQ(spans_only->capabilities(), ExporterCapability::Spans);
}

TEST(CapabilityExporterTest, NarrowExporterOnlyReceivesItsKind) {
    ObservabilityClient client;
    auto metrics_only = std::make_shared<MetricsOnly>();
    auto spans_only = std::make_shared<SpansOnly>();
    client.register_exporter(make_exporter(metrics_only));
    client.register_exporter(make_exporter(spans_only));

    (void)client.record_metric("requests", 1);
    client.record_event("ignored", "msg");
    client.complete_span(client.start_span("handler"));

    ASSERT_EQ(metrics_only->names.size(), 1u);
    EXPECT_EQ(metrics_only->names[0], "requests");
    ASSERT_EQ(spans_only->names.size(), 1u);
    EXPECT_EQ(spans_only->names[0], "handler");
}

TEST(CapabilityExporterTest, WrappingSameObjectTwiceRegistersOnce) {
    ObservabilityClient client;
    auto metrics_only = std::make_shared<MetricsOnly>();
    client.register_exporter(make_exporter(metrics_only));
    client.register_exporter(make_exporter(metrics_only));
    EXPECT_EQ(client.exporter_count(), 1u);
}

TEST(CapabilityExporterTest, IExporterPassesThrough) {
    auto exporter = std::make_shared<RecordingExporter>();
    std::shared_ptr<IExporter> wrapped = make_exporter(exporter);
    EXPECT_EQ(wrapped.get(), exporter.get());
}

// ═══════════════════════════════════════════════
// NdjsonExporter
// ═══════════════════════════════════════════════

TEST(NdjsonExporterTest, WritesOneLinePerRecord) {
    auto lines = std::make_shared<std::vector<std::string>>();
    ObservabilityClient client;
    client.register_exporter(std::make_shared<NdjsonExporter>(std::make_unique<CaptureSink>(lines)));

    (void)client.record_metric("latency", 2.5, {{"path", "/a"}});
    client.record_event("deploy", "He said \"go\"", Severity::Critical);
    client.complete_span(client.start_span("op"), "error", "boom");

    ASSERT_EQ(lines->size(), 3u);
    EXPECT_EQ((*lines)[0].rfind(R"({"type":"metric","name":"latency","value":2.5,)", 0), 0u);
    EXPECT_NE((*lines)[0].find(R"("tags":{"path":"/a"})"), std::string::npos);
    EXPECT_NE((*lines)[1].find(R"("message":"He said \"go\"")"), std::string::npos);
    EXPECT_NE((*lines)[1].find(R"("severity":"critical")"), std::string::npos);
    EXPECT_NE((*lines)[2].find(R"("status":"error")"), std::string::npos);
    EXPECT_NE((*lines)[2].find(R"("error":"boom")"), std::string::npos);
}

TEST(NdjsonExporterTest, SpanWithoutErrorOmitsField) {
    SpanRecord span{.span_id = "abc", .name = "op", .status = "ok", .duration_ms = 1.0};
    auto json = NdjsonExporter::to_json(span);
    EXPECT_EQ(json.find("\"error\""), std::string::npos);
    EXPECT_NE(json.find(R"("span_id":"abc")"), std::string::npos);
    EXPECT_EQ(json.back(), '}');
}

TEST(NdjsonExporterTest, NonFiniteNumbersBecomeNull) {
    auto lines = std::make_shared<std::vector<std::string>>();
    ObservabilityClient client;
    client.register_exporter(std::make_shared<NdjsonExporter>(std::make_unique<CaptureSink>(lines)));

    ASSERT_TRUE(client.record_metric("m", std::numeric_limits<double>::quiet_NaN()));
    ASSERT_TRUE(client.record_metric("m", std::numeric_limits<double>::infinity()));
    ASSERT_TRUE(client.record_metric("m", -std::numeric_limits<double>::infinity()));

    ASSERT_EQ(lines->size(), 3u);
    for (const auto& line : *lines) {
        EXPECT_NE(line.find(R"("value":null,)"), std::string::npos) << line;
        EXPECT_EQ(line.find("nan"), std::string::npos) << line;
        EXPECT_EQ(line.find("inf"), std::string::npos) << line;
    }

    SpanRecord span{.span_id = "abc", .name = "op", .status = "ok",
                    .duration_ms = std::numeric_limits<double>::infinity()};
    EXPECT_NE(NdjsonExporter::to_json(span).find(R"("duration_ms":null,)"), std::string::npos);
}

// ═══════════════════════════════════════════════
// Default monitoring exporter
// ═══════════════════════════════════════════════

TEST(MonitoringExporterTest, ForwardsToEngine) {
    ObservabilityClient client;
    auto engine = std::make_shared<FakeEngine>();
    auto registered = register_default_exporters(client, engine);
    ASSERT_TRUE(registered.has_value());

    (void)client.record_metric("m", 1);
    client.record_event("e", "msg");
    client.complete_span(client.start_span("s"));

    EXPECT_EQ(engine->metrics, 1);
    EXPECT_EQ(engine->events, 1);
    EXPECT_EQ(engine->spans, 1);
}

TEST(MonitoringExporterTest, SameEngineRegisteredOnce) {
    ObservabilityClient client;
    auto engine = std::make_shared<FakeEngine>();
    ASSERT_TRUE(register_default_exporters(client, engine).has_value());
    ASSERT_TRUE(register_default_exporters(client, engine).has_value());
    EXPECT_EQ(client.exporter_count(), 1u);
}

TEST(MonitoringExporterTest, MissingEngineIsReportedNotThrown) {
    ObservabilityClient client;
    auto registered = register_default_exporters(client, nullptr);
    ASSERT_FALSE(registered.has_value());
    EXPECT_EQ(registered.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(client.exporter_count(), 0u);

    // The client keeps working without exporters
    EXPECT_TRUE(client.record_metric("m", 1).has_value());
}
