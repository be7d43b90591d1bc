#include "ingestion/thread_pool.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

ThreadPool::ThreadPool(size_t num_threads, size_t capacity,
                       OverflowPolicy policy, std::chrono::milliseconds block_timeout)
    : max_queued(capacity), policy(policy), block_timeout(block_timeout)
{
    if (num_threads == 0 || capacity == 0) {
        throw ConfigError("ThreadPool needs at least one worker and one queue slot");
    }

    spdlog::info("🔧 Initializing ThreadPool with {} threads", num_threads);
    spdlog::info("   Queue capacity: {} ({})", capacity, to_string(policy));

    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::worker_thread, this);
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::worker_thread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);

            condition.wait(lock, [this] {
                return stop_flag || !tasks.empty();
            });

            if (stop_flag && tasks.empty()) {
                return;
            }

            task = std::move(tasks.front());
            tasks.pop();
            active_count++;
        }

        space_condition.notify_one();

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Task exception: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active_count--;
        }
        idle_condition.notify_all();
    }
}

void ThreadPool::submit(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            throw BackpressureError("ThreadPool is stopped");
        }

        if (tasks.size() >= max_queued) {
            if (policy == OverflowPolicy::Reject) {
                throw BackpressureError("Ingestion queue full (" + std::to_string(max_queued) + ")");
            }

            bool has_space = space_condition.wait_for(lock, block_timeout, [this] {
                return stop_flag || tasks.size() < max_queued;
            });
            if (stop_flag) {
                throw BackpressureError("ThreadPool is stopped");
            }
            if (!has_space) {
                throw BackpressureError("Ingestion queue still full after " +
                                        std::to_string(block_timeout.count()) + " ms");
            }
        }

        tasks.push(std::move(task));
    }

    condition.notify_one();
}

size_t ThreadPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return tasks.size();
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock, [this] {
        return tasks.empty() && active_count == 0;
    });
}

void ThreadPool::stop() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop_flag = true;
    }

    condition.notify_all();
    space_condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers.clear();
}
