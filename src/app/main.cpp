/**
 * @file main.cpp
 * @brief telemetry_verify entry point.
 *
 * Wires the collector into a local cache and task queue, runs one
 * verification pass and prints what was captured:
 *   Config → Logger → Collector → Exporters → Cache/TaskQueue → Verify
 */

#include "app/verify.hpp"
#include "cache/memory_cache.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "executor/task_queue.hpp"
#include "instrumentation/task_instrumentation.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/monitoring_exporter.hpp"
#include "telemetry/ndjson_exporter.hpp"
#include "telemetry/observability_client.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace telemetry_hub;

namespace {

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║          TelemetryHub verify              ║
  ║   In-process metrics, events and spans    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool ndjson = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--ndjson") {
            args.ndjson = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: telemetry_verify [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>   Log output directory (empty = stdout)\n"
                      << "  --ndjson           Also export captured records as NDJSON\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

std::shared_ptr<Logger> make_logger(const LoggingConfig& logging) {
    std::unique_ptr<ILogSink> log_sink;
    if (!logging.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(logging.log_dir, "telemetry_hub",
                                                  logging.max_file_size_mb, logging.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    auto level = parse_log_level(logging.log_level);
    if (!level) {
        std::cerr << "Invalid log level: " << level.error().message
                  << ", falling back to info" << std::endl;
    }
    return std::make_shared<Logger>(std::move(log_sink), level.value_or(LogLevel::Info));
}

// A thread count the system cannot honour falls back to a single worker.
std::unique_ptr<TaskQueue> make_task_queue(const ExecutorConfig& executor, Logger& logger) {
    try {
        return std::make_unique<TaskQueue>(executor.thread_count, "verification");
    } catch (const std::exception& e) {
        logger.warn("Task queue fallback to one worker",
                    {{"thread_count", std::to_string(executor.thread_count)},
                     {"error", e.what()}});
        return std::make_unique<TaskQueue>(1, "verification");
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.logging.log_dir = args.log_dir;
    if (args.ndjson) config.exporters.ndjson = true;

    // ── Initialize Logger ────────────────────
    auto logger = make_logger(config.logging);
    logger->info("telemetry_verify starting", {{"config", args.config_path.string()}});

    // ── Initialize Collector ─────────────────
    ObservabilityClient::Options client_opts{.retention = config.collector, .logger = logger};
    ObservabilityClient client(client_opts);

    // No monitoring engine is linked into this tool
    auto registered = register_default_exporters(client, nullptr);
    if (!registered) {
        logger->warn("Default exporters not registered",
                     {{"error", registered.error().message}});
    }

    std::shared_ptr<NdjsonExporter> ndjson;
    if (config.exporters.ndjson) {
        ndjson = std::make_shared<NdjsonExporter>(
            std::make_unique<JsonFileSink>(config.exporters.ndjson_path, "telemetry_records"));
        client.register_exporter(ndjson);
        logger->info("NDJSON exporter enabled",
                     {{"path", config.exporters.ndjson_path.string()}});
    }

    // ── Initialize Cache and Task Queue ──────
    MemoryCache cache;
    TaskInstrumentation instrumentation(client);
    auto queue = make_task_queue(config.executor, *logger);
    instrumentation.attach(*queue);

    // ── Verify ───────────────────────────────
    auto report = run_verification(client, cache, *queue, std::cout);
    logger->info("Verification finished",
                 {{"cache_hit", report.cache_hit ? "true" : "false"},
                  {"task_succeeded", report.task_succeeded ? "true" : "false"},
                  {"spans", std::to_string(report.spans)},
                  {"metrics", std::to_string(report.metrics)},
                  {"events", std::to_string(report.events)}});

    if (ndjson) ndjson->flush();
    logger->flush();
    return 0;
}
