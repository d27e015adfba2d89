/**
 * @file task_queue.hpp
 * @brief std::jthread-based worker pool running named tasks with lifecycle signals.
 *
 * Every task gets a stable task id. Connected handlers are fired around the
 * task body:
 *   prerun:  before the body runs
 *   postrun: after the body returns normally (state "SUCCESS")
 *   failure: when the body throws; the exception still reaches the caller
 */

#pragma once

#include "core/id_generator.hpp"
#include "core/types.hpp"
#include "core/value.hpp"

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace telemetry_hub {

struct TaskContext {
    TaskId task_id;
    std::string task_name;
    std::string queue;
};

using PrerunHandler = std::function<void(const TaskContext&)>;
using PostrunHandler = std::function<void(const TaskContext&, std::string_view state, const Value& result)>;
using FailureHandler = std::function<void(const TaskContext&, std::exception_ptr)>;

class TaskQueue {
public:
    explicit TaskQueue(size_t num_threads = 0, std::string queue_name = "default");
    ~TaskQueue();

    // Non-copyable, non-movable
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // ── Signals ──────────────────────────────
    void on_prerun(PrerunHandler handler);
    void on_postrun(PostrunHandler handler);
    void on_failure(FailureHandler handler);

    /// Queue a named task on the worker threads.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(std::string task_name, F&& func,
                                                std::optional<TaskId> task_id = std::nullopt);

    /// Run a named task synchronously on the calling thread, firing the same signals.
    template <std::invocable F>
    std::invoke_result_t<F> apply(std::string task_name, F&& func,
                                  std::optional<TaskId> task_id = std::nullopt);

    [[nodiscard]] const std::string& name() const noexcept { return queue_name_; }
    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    TaskContext make_context(std::string task_name, std::optional<TaskId> task_id) const;

    template <typename F>
    std::invoke_result_t<F> run_with_signals(const TaskContext& ctx, F& func);

    void fire_prerun(const TaskContext& ctx);
    void fire_postrun(const TaskContext& ctx, const Value& result);
    void fire_failure(const TaskContext& ctx, std::exception_ptr error);

    template <typename R>
    static Value to_result_value(const R& result);

    std::string queue_name_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};

    mutable std::mutex signals_mutex_;
    std::vector<PrerunHandler> prerun_handlers_;
    std::vector<PostrunHandler> postrun_handlers_;
    std::vector<FailureHandler> failure_handlers_;

    // Last member: if the constructor throws, started workers are stopped and
    // joined before the state they use is destroyed.
    std::vector<std::jthread> workers_;
};

// ── Template implementations ─────────────────

template <typename R>
Value TaskQueue::to_result_value(const R& result) {
    if constexpr (std::is_constructible_v<Value, const R&>) {
        return Value{result};
    } else {
        return Value{};
    }
}

template <typename F>
std::invoke_result_t<F> TaskQueue::run_with_signals(const TaskContext& ctx, F& func) {
    using ReturnType = std::invoke_result_t<F>;

    fire_prerun(ctx);
    if constexpr (std::is_void_v<ReturnType>) {
        try {
            func();
        } catch (...) {
            fire_failure(ctx, std::current_exception());
            throw;
        }
        fire_postrun(ctx, Value{});
    } else {
        std::optional<ReturnType> result;
        try {
            result.emplace(func());
        } catch (...) {
            fire_failure(ctx, std::current_exception());
            throw;
        }
        fire_postrun(ctx, to_result_value(*result));
        return std::move(*result);
    }
}

template <std::invocable F>
std::future<std::invoke_result_t<F>> TaskQueue::submit(std::string task_name, F&& func,
                                                       std::optional<TaskId> task_id) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([this, p = std::move(promise), f = std::forward<F>(func),
                          ctx = make_context(std::move(task_name), std::move(task_id))]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    run_with_signals(ctx, f);
                    p->set_value();
                } else {
                    p->set_value(run_with_signals(ctx, f));
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return future;
}

template <std::invocable F>
std::invoke_result_t<F> TaskQueue::apply(std::string task_name, F&& func,
                                         std::optional<TaskId> task_id) {
    auto ctx = make_context(std::move(task_name), std::move(task_id));
    return run_with_signals(ctx, func);
}

}  // namespace telemetry_hub
