/**
 * @file chunk_transfer_engine.h
 * @brief Chunk-by-chunk transfer of a single upload task
 */

#ifndef RESUMABLE_UPLOAD_ENGINE_CHUNK_TRANSFER_ENGINE_H
#define RESUMABLE_UPLOAD_ENGINE_CHUNK_TRANSFER_ENGINE_H

#include <resumable/upload/core/fingerprint.h>
#include <resumable/upload/core/resume_store.h>
#include <resumable/upload/core/upload_types.h>
#include <resumable/upload/engine/retry_policy.h>
#include <resumable/upload/engine/upload_control.h>
#include <resumable/upload/events/progress_event_bus.h>
#include <resumable/upload/remote/remote_access.h>

#include <functional>
#include <memory>
#include <optional>

namespace resumable::upload {

/**
 * @brief Engine settings shared by every task it runs
 */
struct engine_options {
    retry_policy retry;
    fingerprint_mode fingerprint = fingerprint_mode::size_and_mtime;
};

/**
 * @brief Terminal result of one engine run
 */
struct upload_outcome {
    upload_status status = upload_status::pending;
    uint64_t total_size = 0;
    uint64_t resume_offset = 0;        ///< Offset the run started from
    uint64_t bytes_transferred = 0;    ///< Bytes committed on the remote
    uint64_t bytes_sent = 0;           ///< Bytes written during this run
    uint64_t chunks_sent = 0;          ///< Chunks committed during this run
    std::optional<error> last_error;
    error_kind kind = error_kind::none;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return status == upload_status::completed;
    }
};

/**
 * @brief Drives one task from its resume offset to a terminal status
 *
 * For each run the engine
 *  1. fingerprints the local file and decides the start offset from the
 *     resume record and a remote stat, discarding stale records
 *  2. creates the remote parent directory
 *  3. opens the remote file at the start offset
 *  4. reads, writes and commits one chunk at a time, saving the resume
 *     record and publishing a progress event after each chunk
 *
 * Connectivity errors are retried according to retry_policy. Permission,
 * quota and local file errors fail the task at once. Every outcome is
 * published on the event bus; no error escapes run().
 *
 * The engine holds no per-task state and may run many tasks concurrently.
 */
class chunk_transfer_engine {
public:
    /// Invoked after every change of the task's status or byte count
    using state_callback = std::function<void(const upload_task&)>;

    chunk_transfer_engine(std::shared_ptr<remote_access> remote,
                          resume_store& store,
                          const progress_event_bus& events,
                          engine_options options = {});

    /**
     * @brief Transfer a task to completion, cancellation or failure
     * @param task Task to run; its status and byte count are updated in place
     * @param control Cancel and pause flags checked at chunk boundaries
     * @param on_update Optional observer of task state changes
     */
    auto run(upload_task& task, upload_control& control,
             const state_callback& on_update = {}) -> upload_outcome;

    [[nodiscard]] auto options() const -> const engine_options& { return options_; }

private:
    class run_context;

    std::shared_ptr<remote_access> remote_;
    resume_store& store_;
    const progress_event_bus& events_;
    engine_options options_;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_ENGINE_CHUNK_TRANSFER_ENGINE_H
