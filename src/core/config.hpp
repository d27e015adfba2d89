/**
 * @file config.hpp
 * @brief Collector configuration with TOML deserialization.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace telemetry_hub {

/// Retention bounds for the in-memory record buffers. 0 = unbounded.
struct CollectorConfig {
    size_t max_metrics = 0;
    size_t max_events = 0;
    size_t max_spans = 0;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "./logs";   ///< empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

struct HttpConfig {
    uint32_t slow_request_threshold_ms = 1500;
};

struct ExecutorConfig {
    uint32_t thread_count = 0;          ///< 0 = hardware_concurrency
};

struct ExportersConfig {
    bool ndjson = false;
    std::filesystem::path ndjson_path = "./logs";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    CollectorConfig collector;
    LoggingConfig logging;
    HttpConfig http;
    ExecutorConfig executor;
    ExportersConfig exporters;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace telemetry_hub
