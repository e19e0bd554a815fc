/**
 * @file log_dispatcher.hpp
 * @brief Executors running the dispatch chain inline or on a worker thread
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * logger::log_async() hands the chain to the registry's executor. The
 * inline executor runs it on the calling thread. The async dispatcher
 * queues it for a single worker, so records from one producer thread are
 * handled in the order they were submitted.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>

#include "moodycamel/blockingconcurrentqueue.h"
#include "log_types.hpp"

namespace treelog
{

/**
 * @brief Runs dispatch tasks
 */
class log_executor
{
  public:
    virtual ~log_executor() = default;

    /**
     * @brief Run @p task, now or later
     * @return Future for the task's result; exceptions are delivered through it
     */
    virtual std::future<bool> submit(std::function<bool()> task) = 0;

    /**
     * @brief Block until every task submitted so far has run
     */
    virtual void drain() {}
};

/**
 * @brief Executor running every task on the submitting thread
 */
class inline_executor final : public log_executor
{
  public:
    std::future<bool> submit(std::function<bool()> task) override
    {
        std::packaged_task<bool()> packaged(std::move(task));
        auto result = packaged.get_future();
        packaged();
        return result;
    }
};

/**
 * @brief Executor with a single worker thread fed by a lock-free queue
 *
 * After shutdown() the queue is drained and later submissions run inline,
 * so a record is never dropped.
 */
class async_dispatcher final : public log_executor
{
  public:
    async_dispatcher() : queue_(ASYNC_QUEUE_CAPACITY), worker_thread_(&async_dispatcher::worker_thread_func, this) {}

    ~async_dispatcher() override { shutdown(); }

    async_dispatcher(const async_dispatcher &)            = delete;
    async_dispatcher &operator=(const async_dispatcher &) = delete;

    std::future<bool> submit(std::function<bool()> task) override
    {
        auto packaged = std::make_unique<std::packaged_task<bool()>>(std::move(task));
        auto result   = packaged->get_future();

        {
            std::shared_lock lock(state_mutex_);
            if (!shutdown_.load(std::memory_order_relaxed))
            {
                pending_.fetch_add(1, std::memory_order_acq_rel);
                // Implicit producer per thread keeps per-thread FIFO order
                if (queue_.enqueue(std::move(packaged))) return result;
                task_done();
            }
        }

        // Shut down, or the queue could not grow
        (*packaged)();
        return result;
    }

    void drain() override
    {
        std::unique_lock lock(drain_mutex_);
        drained_cv_.wait(lock, [this] { return pending_.load(std::memory_order_acquire) == 0; });
    }

    /**
     * @brief Run every queued task and stop the worker
     *
     * Only the first call does anything; every call returns after the
     * worker has exited.
     */
    void shutdown()
    {
        {
            std::unique_lock lock(state_mutex_);
            if (!shutdown_.exchange(true))
            {
                // Sentinel to wake the worker
                queue_.enqueue(task_ptr{});
            }
        }

        std::lock_guard<std::mutex> join_lock(join_mutex_);
        if (worker_thread_.joinable()) worker_thread_.join();
    }

    bool is_shut_down() const noexcept { return shutdown_.load(std::memory_order_relaxed); }

    size_t pending() const noexcept { return pending_.load(std::memory_order_relaxed); }

  private:
    using task_ptr = std::unique_ptr<std::packaged_task<bool()>>;

    void worker_thread_func()
    {
        moodycamel::ConsumerToken consumer_token(queue_);
        task_ptr task;
        bool should_shutdown = false;

        while (!should_shutdown)
        {
            if (!queue_.wait_dequeue_timed(consumer_token, task, ASYNC_POLL_INTERVAL)) continue;
            if (!task)
            {
                should_shutdown = true;
                continue;
            }
            run(task);
        }

        // Producers on other threads may have queued work behind the sentinel
        while (queue_.try_dequeue(consumer_token, task))
        {
            if (task) run(task);
        }
    }

    void run(task_ptr &task)
    {
        // packaged_task stores any exception in the future
        (*task)();
        task.reset();
        task_done();
    }

    void task_done()
    {
        if (pending_.fetch_sub(1, std::memory_order_acq_rel) == 1)
        {
            std::lock_guard<std::mutex> lock(drain_mutex_);
            drained_cv_.notify_all();
        }
    }

    moodycamel::BlockingConcurrentQueue<task_ptr> queue_;
    std::atomic<bool> shutdown_{false};
    std::atomic<size_t> pending_{0};

    std::shared_mutex state_mutex_; // Orders submissions before the sentinel
    std::mutex drain_mutex_;
    std::condition_variable drained_cv_;
    std::mutex join_mutex_;

    std::thread worker_thread_; // Last, starts after the queue exists
};

} // namespace treelog
