/**
 * @file upload_control.h
 * @brief Cooperative cancel and pause flags shared between caller and engine
 */

#ifndef RESUMABLE_UPLOAD_ENGINE_UPLOAD_CONTROL_H
#define RESUMABLE_UPLOAD_ENGINE_UPLOAD_CONTROL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace resumable::upload {

/**
 * @brief Control block for one running task
 *
 * Requests never interrupt an in-flight chunk write. The engine observes
 * them at chunk boundaries and while sleeping between retries.
 *
 * @note Thread-safe.
 */
class upload_control {
public:
    upload_control() = default;

    upload_control(const upload_control&) = delete;
    auto operator=(const upload_control&) -> upload_control& = delete;

    /**
     * @brief Ask the engine to stop before the next chunk
     */
    void request_cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    /**
     * @brief Ask the engine to hold at the next chunk boundary
     */
    void request_pause() {
        std::lock_guard lock(mutex_);
        paused_.store(true, std::memory_order_release);
    }

    /**
     * @brief Release a paused engine
     */
    void request_resume() {
        {
            std::lock_guard lock(mutex_);
            paused_.store(false, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto is_cancel_requested() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto is_pause_requested() const noexcept -> bool {
        return paused_.load(std::memory_order_acquire);
    }

    /**
     * @brief Block while paused
     * @return false if cancellation was requested
     */
    auto wait_while_paused() -> bool {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] {
            return !paused_.load(std::memory_order_acquire) ||
                   cancelled_.load(std::memory_order_acquire);
        });
        return !cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for a backoff delay unless cancelled first
     * @return false if cancellation was requested
     */
    auto sleep_for(std::chrono::milliseconds delay) -> bool {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, delay, [this] {
            return cancelled_.load(std::memory_order_acquire);
        });
        return !cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> paused_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_ENGINE_UPLOAD_CONTROL_H
