/**
 * @file serialized_remote_access.h
 * @brief Decorator that serializes remote I/O across tasks
 */

#ifndef RESUMABLE_UPLOAD_REMOTE_SERIALIZED_REMOTE_ACCESS_H
#define RESUMABLE_UPLOAD_REMOTE_SERIALIZED_REMOTE_ACCESS_H

#include <resumable/upload/remote/remote_access.h>

#include <memory>
#include <mutex>

namespace resumable::upload {

/**
 * @brief Wraps a remote_access so at most one remote call runs at a time
 *
 * Every stat, mkdir_all, open_for_write, and every write/close on writers
 * it hands out, takes the same mutex. The lock is held for one call only,
 * so tasks interleave at chunk granularity while their local reads,
 * record saves and event publishing proceed in parallel.
 *
 * @note Thread-safe.
 */
class serialized_remote_access : public remote_access {
public:
    explicit serialized_remote_access(std::shared_ptr<remote_access> inner);

    [[nodiscard]] auto stat(const std::string& path) -> result<remote_stat> override;

    [[nodiscard]] auto mkdir_all(const std::string& path) -> result<void> override;

    [[nodiscard]] auto open_for_write(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<remote_writer>> override;

    /**
     * @brief Always false: this decorator exists to forbid parallel use
     */
    [[nodiscard]] auto supports_concurrent_channels() const -> bool override {
        return false;
    }

    [[nodiscard]] auto inner() const -> std::shared_ptr<remote_access> { return inner_; }

private:
    std::shared_ptr<remote_access> inner_;
    std::shared_ptr<std::mutex> io_mutex_;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_REMOTE_SERIALIZED_REMOTE_ACCESS_H
