/**
 * @file scoped_span.cpp
 * @brief ScopedSpan implementation.
 */

#include "telemetry/scoped_span.hpp"
#include "telemetry/observability_client.hpp"

#include <exception>
#include <utility>

namespace telemetry_hub {

ScopedSpan::ScopedSpan(ObservabilityClient& client, SpanId span_id)
    : client_(&client)
    , span_id_(std::move(span_id))
    , uncaught_on_enter_(std::uncaught_exceptions()) {}

ScopedSpan::ScopedSpan(ScopedSpan&& other) noexcept
    : client_(std::exchange(other.client_, nullptr))
    , span_id_(std::move(other.span_id_))
    , uncaught_on_enter_(other.uncaught_on_enter_)
    , exception_text_(std::move(other.exception_text_)) {}

ScopedSpan::~ScopedSpan() {
    if (!client_) return;

    try {
        if (std::uncaught_exceptions() > uncaught_on_enter_) {
            client_->complete_span(span_id_, std::string{span_status::kError},
                                   exception_text_.value_or("unhandled exception"));
        } else {
            client_->complete_span(span_id_);
        }
    } catch (...) {
        // May run during unwinding; a failing sink must not escape, so no logging here.
    }
}

void ScopedSpan::add_tag(std::string key, const Value& value) {
    if (client_) client_->add_span_tag(span_id_, std::move(key), value);
}

void ScopedSpan::set_status(std::string_view status) {
    if (client_) client_->set_span_status(span_id_, status);
}

void ScopedSpan::record_exception(std::string what) {
    exception_text_ = std::move(what);
}

std::optional<SpanRecord> ScopedSpan::finish() {
    if (!client_) return std::nullopt;
    auto* client = std::exchange(client_, nullptr);
    return client->complete_span(span_id_);
}

}  // namespace telemetry_hub
