/**
 * @file records.hpp
 * @brief Immutable telemetry records produced by the ObservabilityClient.
 *
 * Records are plain values: once handed out they are copies, so callers and
 * exporters can hold them without synchronization.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace telemetry_hub {

/**
 * @brief A named numeric observation.
 */
struct MetricRecord {
    std::string name;
    double value{0.0};
    Tags tags;
    Timestamp timestamp;
};

/**
 * @brief A discrete, named occurrence with a message and severity.
 */
struct EventRecord {
    std::string name;
    std::string message;
    Severity severity{Severity::Info};
    Tags tags;
    Timestamp timestamp;
};

/**
 * @brief A completed span.
 *
 * duration_ms comes from the steady clock; start_time and end_time are
 * independent wall-clock reads and are for display only.
 */
struct SpanRecord {
    SpanId span_id;
    std::string name;
    std::string status;
    double duration_ms{0.0};
    Timestamp start_time;
    Timestamp end_time;
    Tags tags;
    std::optional<std::string> error;

    [[nodiscard]] const std::string& tag_or(const std::string& key,
                                            const std::string& fallback) const {
        auto it = tags.find(key);
        return it == tags.end() ? fallback : it->second;
    }
};

}  // namespace telemetry_hub
