/**
 * @file uploader_types.h
 * @brief Request, handle and result types of the upload coordinator
 */

#ifndef RESUMABLE_UPLOAD_UPLOADER_UPLOADER_TYPES_H
#define RESUMABLE_UPLOAD_UPLOADER_UPLOADER_TYPES_H

#include <resumable/upload/core/upload_types.h>
#include <resumable/upload/engine/chunk_transfer_engine.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resumable::upload {

namespace detail {
struct upload_entry;
struct batch_state;
}  // namespace detail

/**
 * @brief Source and destination of one upload in a batch
 */
struct upload_target {
    std::filesystem::path local_path;
    std::string remote_path;
};

/**
 * @brief Terminal state of one file in a batch
 */
struct batch_task_result {
    std::string task_id;
    upload_status status = upload_status::pending;
    uint64_t bytes_transferred = 0;
    uint64_t total_size = 0;
    error_kind kind = error_kind::none;
    std::optional<error> last_error;
    bool rejected = false;  ///< Never started (duplicate id or invalid request)
};

/**
 * @brief Aggregate outcome of a batch
 */
struct batch_result {
    std::size_t total_files = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    std::size_t rejected = 0;
    uint64_t total_bytes = 0;                 ///< Bytes written during this batch
    std::chrono::milliseconds elapsed{0};
    std::vector<batch_task_result> file_results;

    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return succeeded == total_files;
    }
};

/**
 * @brief Handle to one submitted upload
 *
 * Copies share the same task. The handle stays usable after the task has
 * been retired from the coordinator.
 */
class upload_handle {
public:
    upload_handle() = default;

    [[nodiscard]] auto is_valid() const noexcept -> bool { return entry_ != nullptr; }

    [[nodiscard]] auto id() const -> const std::string&;

    /**
     * @brief Current snapshot of the task
     */
    [[nodiscard]] auto task() const -> upload_task;

    /**
     * @brief Block until the task reaches a terminal status
     */
    [[nodiscard]] auto wait() const -> upload_outcome;

    /**
     * @brief Block up to timeout for the task to finish
     * @return Outcome, or nullopt on timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const
        -> std::optional<upload_outcome>;

    /**
     * @brief Request cooperative cancellation
     */
    void cancel() const;

private:
    friend class upload_coordinator;
    explicit upload_handle(std::shared_ptr<detail::upload_entry> entry);

    std::shared_ptr<detail::upload_entry> entry_;
};

/**
 * @brief Handle to a submitted batch
 *
 * @code
 * auto batch = coordinator.batch_upload(targets);
 * if (batch) {
 *     auto summary = batch.value().wait();
 *     // summary.succeeded, summary.failed, summary.file_results
 * }
 * @endcode
 */
class batch_handle {
public:
    batch_handle() = default;

    [[nodiscard]] auto is_valid() const noexcept -> bool { return state_ != nullptr; }

    [[nodiscard]] auto id() const noexcept -> uint64_t;

    /**
     * @brief Ids of all tasks in the batch, including rejected ones
     */
    [[nodiscard]] auto task_ids() const -> std::vector<std::string>;

    /**
     * @brief Block until every task of the batch is terminal
     */
    [[nodiscard]] auto wait() const -> batch_result;

    /**
     * @brief Block up to timeout for the batch to finish
     * @return Result, or nullopt on timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const
        -> std::optional<batch_result>;

    /**
     * @brief Request cancellation of every task still running in the batch
     */
    void cancel_all() const;

private:
    friend class upload_coordinator;
    explicit batch_handle(std::shared_ptr<detail::batch_state> s);

    std::shared_ptr<detail::batch_state> state_;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_UPLOADER_UPLOADER_TYPES_H
