/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout TelemetryHub.
 *
 * Identity aliases, clocks, tag maps and event severity. Wall-clock
 * timestamps are for human display; durations are always measured on the
 * steady clock.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace telemetry_hub {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using SpanId = std::string;
using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Normalized tag map. Ordered so that serialized output is deterministic.
using Tags = std::map<std::string, std::string>;

// ─────────────────────────────────────────────
// Severity
// ─────────────────────────────────────────────

enum class Severity : uint8_t {
    Info,
    Warning,
    Error,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Error:    return "error";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Span status vocabulary
// ─────────────────────────────────────────────

namespace span_status {
inline constexpr std::string_view kInProgress = "in_progress";
inline constexpr std::string_view kOk = "ok";
inline constexpr std::string_view kError = "error";
}  // namespace span_status

/// ISO 8601 UTC rendering with millisecond precision, e.g. 2026-01-02T03:04:05.678Z
std::string format_timestamp(Timestamp ts);

}  // namespace telemetry_hub
