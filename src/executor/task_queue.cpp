/**
 * @file task_queue.cpp
 * @brief TaskQueue implementation.
 */

#include "executor/task_queue.hpp"

namespace telemetry_hub {

TaskQueue::TaskQueue(size_t num_threads, std::string queue_name)
    : queue_name_(std::move(queue_name)) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

TaskQueue::~TaskQueue() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // Join before the queue and signal handlers are destroyed; queued tasks are drained first
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void TaskQueue::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            if (task_queue_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task();
        --active_tasks_;
    }
}

TaskContext TaskQueue::make_context(std::string task_name, std::optional<TaskId> task_id) const {
    return TaskContext{
        .task_id = (task_id && !task_id->empty()) ? std::move(*task_id) : generate_id(),
        .task_name = std::move(task_name),
        .queue = queue_name_
    };
}

// ── Signals ──────────────────────────────────

void TaskQueue::on_prerun(PrerunHandler handler) {
    std::lock_guard lock(signals_mutex_);
    prerun_handlers_.push_back(std::move(handler));
}

void TaskQueue::on_postrun(PostrunHandler handler) {
    std::lock_guard lock(signals_mutex_);
    postrun_handlers_.push_back(std::move(handler));
}

void TaskQueue::on_failure(FailureHandler handler) {
    std::lock_guard lock(signals_mutex_);
    failure_handlers_.push_back(std::move(handler));
}

void TaskQueue::fire_prerun(const TaskContext& ctx) {
    std::vector<PrerunHandler> handlers;
    {
        std::lock_guard lock(signals_mutex_);
        handlers = prerun_handlers_;
    }
    for (const auto& handler : handlers) handler(ctx);
}

void TaskQueue::fire_postrun(const TaskContext& ctx, const Value& result) {
    std::vector<PostrunHandler> handlers;
    {
        std::lock_guard lock(signals_mutex_);
        handlers = postrun_handlers_;
    }
    for (const auto& handler : handlers) handler(ctx, "SUCCESS", result);
}

void TaskQueue::fire_failure(const TaskContext& ctx, std::exception_ptr error) {
    std::vector<FailureHandler> handlers;
    {
        std::lock_guard lock(signals_mutex_);
        handlers = failure_handlers_;
    }
    for (const auto& handler : handlers) handler(ctx, error);
}

// ── Introspection ────────────────────────────

size_t TaskQueue::active_count() const noexcept {
    return active_tasks_.load();
}

size_t TaskQueue::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t TaskQueue::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace telemetry_hub
