/**
 * @file value.cpp
 * @brief Value rendering, numeric coercion and tag normalization.
 */

#include "core/value.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <type_traits>

namespace telemetry_hub {

namespace {

std::string format_double(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{}) return std::to_string(v);
    return std::string(buf, end);
}

}  // namespace

// ── Decimal ──────────────────────────────────

double Decimal::to_double() const noexcept {
    return static_cast<double>(unscaled) / std::pow(10.0, scale);
}

std::string Decimal::to_string() const {
    uint64_t magnitude = unscaled < 0 ? 0 - static_cast<uint64_t>(unscaled)
                                      : static_cast<uint64_t>(unscaled);
    std::string digits = std::to_string(magnitude);
    if (scale > 0) {
        if (digits.size() <= scale) {
            digits.insert(0, scale - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - scale, 1, '.');
    }
    return unscaled < 0 ? "-" + digits : digits;
}

// ── Value ────────────────────────────────────

std::string Value::to_string() const {
    return std::visit([](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
            return "none";
        } else if constexpr (std::is_same_v<V, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<V, int64_t> || std::is_same_v<V, uint64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<V, double>) {
            return format_double(v);
        } else if constexpr (std::is_same_v<V, Decimal>) {
            return v.to_string();
        } else {
            return v;
        }
    }, storage_);
}

std::string_view Value::type_name() const noexcept {
    switch (storage_.index()) {
        case 0: return "none";
        case 1: return "bool";
        case 2: return "int64";
        case 3: return "uint64";
        case 4: return "double";
        case 5: return "decimal";
        case 6: return "string";
    }
    return "unknown";
}

// ── Coercion ─────────────────────────────────

Result<double> coerce_numeric(const Value& value) {
    return std::visit([&value](const auto& v) -> Result<double> {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
            return v ? 1.0 : 0.0;
        } else if constexpr (std::is_same_v<V, int64_t> || std::is_same_v<V, uint64_t>
                             || std::is_same_v<V, double>) {
            return static_cast<double>(v);
        } else if constexpr (std::is_same_v<V, Decimal>) {
            return v.to_double();
        } else {
            return Error{ErrorKind::InvalidType,
                         "Metric value must be numeric, got " + std::string{value.type_name()}};
        }
    }, value.storage());
}

Tags normalize_tags(const TagValues& tags) {
    Tags normalized;
    for (const auto& [key, value] : tags) {
        normalized.emplace(key, value.to_string());
    }
    return normalized;
}

}  // namespace telemetry_hub
