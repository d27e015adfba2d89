/**
 * @file task_instrumentation.hpp
 * @brief Maps task lifecycle signals onto collector spans.
 *
 * Per task id: NONE -> STARTED (prerun) -> COMPLETED | FAILED -> removed.
 * A completion for a task that never started is a no-op, so the adapter can
 * be connected while tasks are already in flight.
 */

#pragma once

#include "executor/task_queue.hpp"
#include "telemetry/observability_client.hpp"

#include <exception>
#include <string_view>

namespace telemetry_hub {

class TaskInstrumentation {
public:
    explicit TaskInstrumentation(ObservabilityClient& client);

    /// Connect prerun/postrun/failure handlers to @p queue.
    void attach(TaskQueue& queue);

    // Hook entry points, usable directly by other task frameworks
    void on_prerun(const TaskContext& ctx);
    void on_postrun(const TaskContext& ctx, std::string_view state, const Value& result);
    void on_failure(const TaskContext& ctx, std::exception_ptr error);

private:
    ObservabilityClient& client_;
};

/// Text of an exception held in an exception_ptr ("unknown error" for non-std types).
std::string describe_exception(std::exception_ptr error);

}  // namespace telemetry_hub
