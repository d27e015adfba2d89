/**
 * @file scoped_span.hpp
 * @brief RAII handle that completes a span exactly once.
 */

#pragma once

#include "core/types.hpp"
#include "core/value.hpp"
#include "telemetry/records.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace telemetry_hub {

class ObservabilityClient;

/**
 * @brief Owns one active span for the duration of a scope.
 *
 * On scope exit the span is completed with the last status set ("ok" when
 * none was). When the scope is left by an exception, the span is completed
 * with status "error" and the text passed to record_exception() (or
 * "unhandled exception"); the exception keeps propagating.
 */
class ScopedSpan {
public:
    ~ScopedSpan();

    ScopedSpan(ScopedSpan&& other) noexcept;
    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;
    ScopedSpan& operator=(ScopedSpan&&) = delete;

    [[nodiscard]] const SpanId& span_id() const noexcept { return span_id_; }

    void add_tag(std::string key, const Value& value);
    void set_status(std::string_view status);

    /// Remember the error text of an exception about to leave the scope.
    /// Used only when the scope is actually left by an exception.
    void record_exception(std::string what);

    /// Complete now instead of at scope exit. Later calls return nullopt.
    std::optional<SpanRecord> finish();

private:
    friend class ObservabilityClient;
    ScopedSpan(ObservabilityClient& client, SpanId span_id);

    ObservabilityClient* client_;
    SpanId span_id_;
    int uncaught_on_enter_;
    std::optional<std::string> exception_text_;
};

}  // namespace telemetry_hub
