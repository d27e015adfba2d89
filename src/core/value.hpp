/**
 * @file value.hpp
 * @brief Loosely typed values accepted at the collector's API boundary.
 *
 * Callers hand the collector tag values, metric values and task results of
 * whatever type they have at hand. Value captures them without loss;
 * tags are then normalized to strings and metric values coerced to double.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace telemetry_hub {

/**
 * @brief Fixed-point decimal: unscaled * 10^-scale.
 *
 * Decimal{1250, 2} is 12.50.
 */
struct Decimal {
    int64_t unscaled{0};
    uint8_t scale{0};

    [[nodiscard]] double to_double() const noexcept;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Decimal&) const = default;
};

class Value {
public:
    using Storage = std::variant<std::monostate, bool, int64_t, uint64_t, double, Decimal, std::string>;

    Value() = default;
    Value(bool v) : storage_(v) {}  // NOLINT(implicit)

    template <std::signed_integral I>
    Value(I v) : storage_(static_cast<int64_t>(v)) {}  // NOLINT(implicit)

    template <std::unsigned_integral U>
        requires (!std::same_as<U, bool>)
    Value(U v) : storage_(static_cast<uint64_t>(v)) {}  // NOLINT(implicit)

    template <std::floating_point F>
    Value(F v) : storage_(static_cast<double>(v)) {}  // NOLINT(implicit)

    Value(Decimal v) : storage_(v) {}  // NOLINT(implicit)
    Value(const char* v) : storage_(std::string{v}) {}  // NOLINT(implicit)
    Value(std::string v) : storage_(std::move(v)) {}  // NOLINT(implicit)
    Value(std::string_view v) : storage_(std::string{v}) {}  // NOLINT(implicit)

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }
    [[nodiscard]] bool is_none() const noexcept {
        return std::holds_alternative<std::monostate>(storage_);
    }

    /// Human-readable rendering used for tag normalization.
    [[nodiscard]] std::string to_string() const;

    /// Name of the held alternative, for diagnostics.
    [[nodiscard]] std::string_view type_name() const noexcept;

private:
    Storage storage_;
};

/// Tag input as supplied by callers, before normalization.
using TagValues = std::map<std::string, Value>;

/**
 * @brief Coerce a value to double for metric storage.
 *
 * bool maps to 1.0/0.0, integers and decimals convert, doubles pass
 * through. Anything else yields ErrorKind::InvalidType.
 */
[[nodiscard]] Result<double> coerce_numeric(const Value& value);

/// Normalize caller-supplied tags to string -> string.
[[nodiscard]] Tags normalize_tags(const TagValues& tags);

}  // namespace telemetry_hub
