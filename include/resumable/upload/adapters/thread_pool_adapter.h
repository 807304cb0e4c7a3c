// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pools that bound the number of concurrently running uploads
 *
 * Each upload task runs on one worker for its whole lifetime, so the
 * worker count of the pool is the coordinator's concurrency limit. Tasks
 * submitted while every worker is busy wait in FIFO order.
 *
 * Implementations:
 * - bounded_upload_pool: fixed set of std::thread workers (always available)
 * - thread_system_upload_adapter: kcenon::thread::thread_pool, when built
 *   with RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "resumable/upload/config/feature_flags.h"

#if RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace resumable::upload::adapters {

/**
 * @brief Interface for the pool that runs upload tasks
 */
class upload_pool_interface {
public:
    virtual ~upload_pool_interface() = default;

    /**
     * @brief Queue a task for execution
     * @param task The task to execute
     * @return Future that becomes ready when the task has run; exceptions
     *         thrown by the task are stored in it
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool accepts work
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks queued but not yet picked up by a worker
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Run what is queued, then stop and join the workers
     */
    virtual void shutdown() = 0;
};

/**
 * @brief Fixed-size pool of std::thread workers over a FIFO queue
 *
 * @note Thread-safe. The destructor calls shutdown().
 */
class bounded_upload_pool : public upload_pool_interface {
public:
    /**
     * @param worker_count Number of workers (0 = hardware concurrency)
     * @param pool_name Name used in log lines
     */
    explicit bounded_upload_pool(size_t worker_count,
                                 std::string pool_name = "upload_pool");
    ~bounded_upload_pool() override;

    bounded_upload_pool(const bounded_upload_pool&) = delete;
    bounded_upload_pool& operator=(const bounded_upload_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

    /**
     * @brief Tasks currently executing on a worker
     */
    [[nodiscard]] size_t active_tasks() const;

private:
    void worker_loop();

    std::string pool_name_;
    std::vector<std::thread> workers_;
    std::deque<std::packaged_task<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{true};
    std::atomic<size_t> active_{0};
};

#if RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that runs upload tasks on a thread_system thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_upload_adapter : public upload_pool_interface {
public:
    /**
     * @brief Construct with an existing, started thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_upload_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "upload_pool",
        size_t worker_count = 0);

    ~thread_system_upload_adapter() override;

    thread_system_upload_adapter(const thread_system_upload_adapter&) = delete;
    thread_system_upload_adapter& operator=(const thread_system_upload_adapter&) = delete;

    /**
     * @brief Create a pool with worker_count workers and start it
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_upload_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "upload_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM

/**
 * @brief Factory selecting the pool implementation for this build
 *
 * 1. thread_system_upload_adapter (when RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM)
 * 2. bounded_upload_pool (otherwise)
 */
class upload_pool_factory {
public:
    /**
     * @brief Create a pool with exactly worker_count workers
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<upload_pool_interface> create(
        size_t worker_count,
        const std::string& pool_name = "upload_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace resumable::upload::adapters
