/**
 * @file verify.hpp
 * @brief End-to-end verification of cache, task and collector wiring.
 */

#pragma once

#include "cache/memory_cache.hpp"
#include "executor/task_queue.hpp"
#include "telemetry/observability_client.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace telemetry_hub {

struct VerifyReport {
    bool cache_hit = false;
    bool task_succeeded = false;
    std::string task_result;
    size_t spans = 0;
    size_t metrics = 0;
    size_t events = 0;
};

/// Result string returned by the built-in test task.
inline constexpr std::string_view kTestTaskResult = "Test task completed successfully";

/**
 * @brief Exercise the cache and the task queue once and print a summary.
 *
 * Resets @p client first. @p queue is expected to have TaskInstrumentation
 * attached. Dependency failures are reported in the output and the report,
 * never thrown.
 */
VerifyReport run_verification(ObservabilityClient& client,
                              MemoryCache& cache,
                              TaskQueue& queue,
                              std::ostream& out);

}  // namespace telemetry_hub
