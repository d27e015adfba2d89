/**
 * @file exporter.hpp
 * @brief Exporter interface for forwarding captured telemetry.
 *
 * IExporter uses virtual dispatch: exporters are registered once at startup
 * and are invoked outside the collector lock. Every hook has a no-op default
 * and the client only calls hooks whose capability bit is set.
 */

#pragma once

#include "core/concepts.hpp"
#include "telemetry/records.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace telemetry_hub {

// ─────────────────────────────────────────────
// Capabilities
// ─────────────────────────────────────────────

enum class ExporterCapability : uint8_t {
    None    = 0,
    Metrics = 1 << 0,
    Events  = 1 << 1,
    Spans   = 1 << 2,
    All     = Metrics | Events | Spans
};

[[nodiscard]] constexpr ExporterCapability operator|(ExporterCapability a, ExporterCapability b) noexcept {
    return static_cast<ExporterCapability>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr bool has_capability(ExporterCapability set, ExporterCapability bit) noexcept {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(bit)) != 0;
}

// ─────────────────────────────────────────────
// IExporter
// ─────────────────────────────────────────────

class IExporter {
public:
    virtual ~IExporter() = default;

    [[nodiscard]] virtual std::string name() const { return "exporter"; }
    [[nodiscard]] virtual ExporterCapability capabilities() const { return ExporterCapability::All; }

    /// Object whose address identifies this exporter for de-duplication.
    [[nodiscard]] virtual const void* identity() const noexcept { return this; }

    virtual void export_metric(const MetricRecord& /*metric*/) {}
    virtual void export_event(const EventRecord& /*event*/) {}
    virtual void export_span(const SpanRecord& /*span*/) {}
};

// ─────────────────────────────────────────────
// CapabilityExporter<T>
// ─────────────────────────────────────────────

/**
 * @brief Adapts any type providing a subset of the export hooks.
 *
 * Capabilities are derived from which hooks T actually has.
 */
template <ExporterLike T>
class CapabilityExporter final : public IExporter {
public:
    explicit CapabilityExporter(std::shared_ptr<T> inner) : inner_(std::move(inner)) {}

    [[nodiscard]] std::string name() const override {
        if constexpr (NamedExporter<T>) {
            return std::string{inner_->name()};
        } else {
            return typeid(T).name();
        }
    }

    [[nodiscard]] ExporterCapability capabilities() const override {
        auto caps = ExporterCapability::None;
        if constexpr (MetricExporterLike<T>) caps = caps | ExporterCapability::Metrics;
        if constexpr (EventExporterLike<T>)  caps = caps | ExporterCapability::Events;
        if constexpr (SpanExporterLike<T>)   caps = caps | ExporterCapability::Spans;
        return caps;
    }

    [[nodiscard]] const void* identity() const noexcept override { return inner_.get(); }

    void export_metric(const MetricRecord& metric) override {
        if constexpr (MetricExporterLike<T>) inner_->export_metric(metric);
    }

    void export_event(const EventRecord& event) override {
        if constexpr (EventExporterLike<T>) inner_->export_event(event);
    }

    void export_span(const SpanRecord& span) override {
        if constexpr (SpanExporterLike<T>) inner_->export_span(span);
    }

private:
    std::shared_ptr<T> inner_;
};

/// Wrap a duck-typed exporter. IExporter subclasses are passed through.
template <typename T>
std::shared_ptr<IExporter> make_exporter(std::shared_ptr<T> exporter) {
    if constexpr (std::is_base_of_v<IExporter, T>) {
        return exporter;
    } else {
        static_assert(ExporterLike<T>, "exporter must provide at least one export hook");
        if (!exporter) return nullptr;
        return std::make_shared<CapabilityExporter<T>>(std::move(exporter));
    }
}

}  // namespace telemetry_hub
