/**
 * @file task_instrumentation.cpp
 * @brief TaskInstrumentation implementation.
 */

#include "instrumentation/task_instrumentation.hpp"

namespace telemetry_hub {

std::string describe_exception(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

TaskInstrumentation::TaskInstrumentation(ObservabilityClient& client)
    : client_(client) {}

void TaskInstrumentation::attach(TaskQueue& queue) {
    queue.on_prerun([this](const TaskContext& ctx) { on_prerun(ctx); });
    queue.on_postrun([this](const TaskContext& ctx, std::string_view state, const Value& result) {
        on_postrun(ctx, state, result);
    });
    queue.on_failure([this](const TaskContext& ctx, std::exception_ptr error) {
        on_failure(ctx, error);
    });
}

void TaskInstrumentation::on_prerun(const TaskContext& ctx) {
    client_.begin_task(ctx.task_id, ctx.task_name,
                       ctx.queue.empty() ? std::nullopt : std::optional<std::string>{ctx.queue});
}

void TaskInstrumentation::on_postrun(const TaskContext& ctx, std::string_view state, const Value& result) {
    std::string_view status = state.empty() ? std::string_view{"SUCCESS"} : state;
    const Value& reported = result.is_none() ? Value{ctx.task_name} : result;
    client_.complete_task(ctx.task_id, status, reported);
}

void TaskInstrumentation::on_failure(const TaskContext& ctx, std::exception_ptr error) {
    if (!error) return;
    client_.fail_task(ctx.task_id, describe_exception(error));
}

}  // namespace telemetry_hub
