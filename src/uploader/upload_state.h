/**
 * @file upload_state.h
 * @brief Shared state behind upload and batch handles (internal)
 */

#ifndef RESUMABLE_UPLOAD_SRC_UPLOADER_UPLOAD_STATE_H
#define RESUMABLE_UPLOAD_SRC_UPLOADER_UPLOAD_STATE_H

#include <resumable/upload/engine/chunk_transfer_engine.h>
#include <resumable/upload/engine/upload_control.h>
#include <resumable/upload/uploader/uploader_types.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace resumable::upload {

namespace detail {

/**
 * @brief Owned jointly by the coordinator's active set, the worker running
 *        the task, and any handles given to callers
 *
 * The worker mutates its own copy of the task and mirrors every change
 * into snapshot, so readers never race with the engine.
 */
struct upload_entry {
    explicit upload_entry(upload_task task)
        : id(task.id)
        , snapshot(std::move(task))
        , future(promise.get_future().share()) {}

    auto current() const -> upload_task {
        std::lock_guard lock(mutex);
        return snapshot;
    }

    void update(const upload_task& task) {
        std::lock_guard lock(mutex);
        snapshot = task;
    }

    const std::string id;
    upload_control control;

    mutable std::mutex mutex;
    upload_task snapshot;

    std::promise<upload_outcome> promise;
    std::shared_future<upload_outcome> future;
};

/**
 * @brief Tasks admitted and rejected by one batch_upload call
 */
struct batch_state {
    uint64_t id = 0;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
    std::vector<std::shared_ptr<upload_entry>> entries;
    std::vector<batch_task_result> rejected;
};

}  // namespace detail

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_SRC_UPLOADER_UPLOAD_STATE_H
