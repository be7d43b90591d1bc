/*
 * Bounded Thread Pool
 *
 * FEATURES:
 * - Fixed number of workers, FIFO queue with a hard capacity
 * - Explicit overflow policy: Reject (fail fast) or Block (bounded wait)
 * - Exception safe: a throwing task is logged, the worker keeps running
 * - stop() refuses new work, drains what is queued, joins workers
 */

#pragma once
#include "config.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

class ThreadPool {
public:
    ThreadPool(size_t num_threads, size_t capacity,
               OverflowPolicy policy = OverflowPolicy::Reject,
               std::chrono::milliseconds block_timeout = std::chrono::milliseconds(250));
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws BackpressureError when the queue is full (after block_timeout
    // under Block) or the pool is stopped
    void submit(std::function<void()> task);

    // Stats
    size_t pending_tasks() const;
    size_t running_tasks() const { return active_count; }
    size_t active_threads() const { return workers.size(); }
    size_t capacity() const { return max_queued; }

    // Control
    void wait_all();
    void stop();
    bool is_stopped() const { return stop_flag; }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    size_t max_queued;
    OverflowPolicy policy;
    std::chrono::milliseconds block_timeout;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;       // workers: task available / stop
    std::condition_variable space_condition; // producers: slot freed
    std::condition_variable idle_condition;  // wait_all()
    std::atomic<bool> stop_flag{false};
    std::atomic<size_t> active_count{0};

    void worker_thread();
};
