/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>

namespace telemetry_hub {

namespace {

size_t read_size(toml::node_view<toml::node> node, int64_t fallback) {
    auto v = node.value_or(fallback);
    return v < 0 ? 0 : static_cast<size_t>(v);
}

// Negative values clamp to 0, oversized ones to the type's maximum.
uint32_t read_u32(toml::node_view<toml::node> node, int64_t fallback) {
    auto v = node.value_or(fallback);
    if (v < 0) return 0;
    if (v > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(v);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [collector]
        if (auto collector = tbl["collector"]; collector.is_table()) {
            config.collector.max_metrics = read_size(collector["max_metrics"], 0);
            config.collector.max_events = read_size(collector["max_events"], 0);
            config.collector.max_spans = read_size(collector["max_spans"], 0);
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.log_dir = logging["log_dir"].value_or(std::string{"./logs"});
            config.logging.log_level = logging["log_level"].value_or(std::string{"info"});
            config.logging.max_file_size_mb = read_u32(logging["max_file_size_mb"], 50);
            config.logging.rotate_count = read_u32(logging["rotate_count"], 5);
        }

        // [http]
        if (auto http = tbl["http"]; http.is_table()) {
            config.http.slow_request_threshold_ms =
                read_u32(http["slow_request_threshold_ms"], 1500);
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.thread_count = read_u32(executor["thread_count"], 0);
        }

        // [exporters]
        if (auto exporters = tbl["exporters"]; exporters.is_table()) {
            config.exporters.ndjson = exporters["ndjson"].value_or(false);
            config.exporters.ndjson_path =
                exporters["ndjson_path"].value_or(std::string{"./logs"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace telemetry_hub
