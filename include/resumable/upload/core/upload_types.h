/**
 * @file upload_types.h
 * @brief Upload task, status and event types
 */

#ifndef RESUMABLE_UPLOAD_CORE_UPLOAD_TYPES_H
#define RESUMABLE_UPLOAD_CORE_UPLOAD_TYPES_H

#include <resumable/upload/core/error_codes.h>
#include <resumable/upload/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace resumable::upload {

/**
 * @brief Lifecycle status of an upload task
 */
enum class upload_status {
    pending,       ///< Queued, waiting for a worker
    in_progress,   ///< Chunk loop running
    paused,        ///< Held at a chunk boundary by the caller
    completed,     ///< Remote copy is byte-identical to the local file
    failed,        ///< Permanent or retry-exhausted failure
    cancelled      ///< Stopped by the caller
};

/**
 * @brief Convert upload_status to string
 */
[[nodiscard]] constexpr auto to_string(upload_status status) noexcept
    -> const char* {
    switch (status) {
        case upload_status::pending: return "pending";
        case upload_status::in_progress: return "in_progress";
        case upload_status::paused: return "paused";
        case upload_status::completed: return "completed";
        case upload_status::failed: return "failed";
        case upload_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Parse upload_status from its string form
 */
[[nodiscard]] auto upload_status_from_string(const std::string& text)
    -> std::optional<upload_status>;

/**
 * @brief Check if status is terminal (final)
 */
[[nodiscard]] constexpr auto is_terminal_status(upload_status status) noexcept
    -> bool {
    return status == upload_status::completed ||
           status == upload_status::failed ||
           status == upload_status::cancelled;
}

/**
 * @brief One file transfer
 *
 * Created when an upload is requested and mutated only by the engine
 * running it. last_error is set only when status is failed.
 */
struct upload_task {
    std::string id;
    std::filesystem::path local_path;
    std::string remote_path;
    uint64_t total_size = 0;
    std::size_t chunk_size = default_chunk_size;
    uint64_t bytes_transferred = 0;
    upload_status status = upload_status::pending;
    std::optional<error> last_error;
    error_kind last_error_kind = error_kind::none;

    upload_task() = default;
    upload_task(std::string task_id,
                std::filesystem::path local,
                std::string remote,
                std::size_t chunk = default_chunk_size)
        : id(std::move(task_id))
        , local_path(std::move(local))
        , remote_path(std::move(remote))
        , chunk_size(chunk) {}

    /**
     * @brief File name shown in events and logs
     */
    [[nodiscard]] auto filename() const -> std::string {
        return local_path.filename().string();
    }

    /**
     * @brief Integer completion percentage, floor(bytes * 100 / total)
     *
     * A zero-length file is 100% once it has been processed.
     */
    [[nodiscard]] auto percent() const noexcept -> int {
        if (total_size == 0) {
            return status == upload_status::completed ? 100 : 0;
        }
        return static_cast<int>(bytes_transferred * 100 / total_size);
    }
};

// ============================================================================
// Chunk arithmetic
// ============================================================================

/**
 * @brief Number of chunks needed for a file, ceil(size / chunk_size)
 */
[[nodiscard]] constexpr auto chunk_count(uint64_t file_size, std::size_t chunk_size) noexcept
    -> uint64_t {
    if (file_size == 0 || chunk_size == 0) return 0;
    return (file_size + chunk_size - 1) / chunk_size;
}

/**
 * @brief Length of the chunk that starts at offset
 */
[[nodiscard]] constexpr auto chunk_length_at(uint64_t offset, uint64_t file_size,
                                             std::size_t chunk_size) noexcept
    -> std::size_t {
    if (offset >= file_size) return 0;
    auto remaining = file_size - offset;
    return remaining < chunk_size ? static_cast<std::size_t>(remaining) : chunk_size;
}

// ============================================================================
// Events
// ============================================================================

/**
 * @brief Published once per run before the first chunk
 */
struct started_event {
    std::string task_id;
    std::string filename;
    uint64_t total_size = 0;
    uint64_t resume_offset = 0;
};

/**
 * @brief Published after every committed chunk
 *
 * percent is non-decreasing per task and reaches 100 only on completion.
 */
struct progress_event {
    std::string task_id;
    int percent = 0;
    std::string filename;
};

/**
 * @brief Published when the remote copy is complete
 */
struct completion_event {
    std::string task_id;
    std::string filename;
};

/**
 * @brief Published when a task reaches failed
 */
struct failure_event {
    std::string task_id;
    std::string filename;
    error_kind kind = error_kind::internal;
    std::string detail;
};

/**
 * @brief Published when a task stops on caller request
 */
struct cancellation_event {
    std::string task_id;
    std::string filename;
    uint64_t bytes_transferred = 0;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_CORE_UPLOAD_TYPES_H
