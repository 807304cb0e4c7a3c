// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Upload worker pool implementations
 */

#include "resumable/upload/adapters/thread_pool_adapter.h"
#include "resumable/upload/core/logging.h"

#include <stdexcept>

#if RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace resumable::upload::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// bounded_upload_pool implementation
// ============================================================================

bounded_upload_pool::bounded_upload_pool(size_t worker_count, std::string pool_name)
    : pool_name_(std::move(pool_name)) {
    worker_count = resolve_worker_count(worker_count);
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    RU_LOG_DEBUG(log_category::pool,
        "Pool " + pool_name_ + " started with " + std::to_string(worker_count) + " workers");
}

bounded_upload_pool::~bounded_upload_pool() {
    shutdown();
}

std::future<void> bounded_upload_pool::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    auto future = packaged.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            std::promise<void> rejected;
            rejected.set_exception(std::make_exception_ptr(
                std::runtime_error("pool " + pool_name_ + " is shut down")));
            return rejected.get_future();
        }
        queue_.push_back(std::move(packaged));
    }
    cv_.notify_one();
    return future;
}

void bounded_upload_pool::worker_loop() {
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            active_.fetch_add(1, std::memory_order_relaxed);
        }

        // packaged_task stores any exception in the future
        task();
        active_.fetch_sub(1, std::memory_order_relaxed);
    }
}

size_t bounded_upload_pool::worker_count() const {
    return workers_.size();
}

bool bounded_upload_pool::is_running() const {
    return running_.load();
}

size_t bounded_upload_pool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t bounded_upload_pool::active_tasks() const {
    return active_.load(std::memory_order_relaxed);
}

void bounded_upload_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false) && workers_.empty()) {
            return;
        }
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == std::this_thread::get_id()) {
            // Called from a task; this worker exits once the task returns
            worker.detach();
        } else {
            worker.join();
        }
    }
    workers_.clear();
    RU_LOG_DEBUG(log_category::pool, "Pool " + pool_name_ + " stopped");
}

// ============================================================================
// thread_system_upload_adapter implementation
// ============================================================================

#if RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs one upload task on a thread_system worker
 */
class upload_job : public kcenon::thread::job {
public:
    explicit upload_job(std::function<void()> func, const std::string& name = "upload_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_upload_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<bool> running{true};
};

thread_system_upload_adapter::thread_system_upload_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_upload_adapter::~thread_system_upload_adapter() {
    shutdown();
}

std::shared_ptr<thread_system_upload_adapter>
thread_system_upload_adapter::create_default(size_t worker_count,
                                             const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    // One worker per concurrent upload
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_upload_adapter>(std::move(pool), pool_name,
                                                          worker_count);
}

std::future<void> thread_system_upload_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    if (!pimpl_->running.load()) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("pool " + pimpl_->pool_name + " is shut down")));
        return future;
    }

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    auto job = std::make_unique<upload_job>(std::move(wrapped_task), "upload_task");
    auto enqueued = pimpl_->pool->enqueue(std::move(job));
    if (!enqueued.is_ok()) {
        RU_LOG_ERROR(log_category::pool,
            "Failed to enqueue upload on " + pimpl_->pool_name);
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("failed to enqueue upload job")));
    }

    return future;
}

size_t thread_system_upload_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_upload_adapter::is_running() const {
    return pimpl_->pool != nullptr && pimpl_->running.load();
}

size_t thread_system_upload_adapter::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

void thread_system_upload_adapter::shutdown() {
    if (!pimpl_ || !pimpl_->running.exchange(false)) {
        return;
    }
    if (pimpl_->pool) {
        // Let queued uploads run; they observe cancellation quickly
        pimpl_->pool->stop(false);
    }
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_upload_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM

// ============================================================================
// upload_pool_factory implementation
// ============================================================================

std::shared_ptr<upload_pool_interface> upload_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if RESUMABLE_UPLOAD_WITH_THREAD_SYSTEM
    return thread_system_upload_adapter::create_default(worker_count, pool_name);
#else
    return std::make_shared<bounded_upload_pool>(worker_count, pool_name);
#endif
}

}  // namespace resumable::upload::adapters
