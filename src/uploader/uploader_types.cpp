/**
 * @file uploader_types.cpp
 * @brief Implementation of upload_handle and batch_handle
 */

#include <resumable/upload/uploader/uploader_types.h>

#include "upload_state.h"

#include <algorithm>

namespace resumable::upload {

// ============================================================================
// upload_handle
// ============================================================================

upload_handle::upload_handle(std::shared_ptr<detail::upload_entry> entry)
    : entry_(std::move(entry)) {
}

auto upload_handle::id() const -> const std::string& {
    static const std::string empty;
    return entry_ ? entry_->id : empty;
}

auto upload_handle::task() const -> upload_task {
    return entry_ ? entry_->current() : upload_task{};
}

auto upload_handle::wait() const -> upload_outcome {
    if (!entry_) {
        return upload_outcome{};
    }
    return entry_->future.get();
}

auto upload_handle::wait_for(std::chrono::milliseconds timeout) const
    -> std::optional<upload_outcome> {
    if (!entry_) {
        return std::nullopt;
    }
    if (entry_->future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return entry_->future.get();
}

void upload_handle::cancel() const {
    if (entry_) {
        entry_->control.request_cancel();
    }
}

// ============================================================================
// batch_handle
// ============================================================================

namespace {

auto to_task_result(const detail::upload_entry& entry, const upload_outcome& outcome)
    -> batch_task_result {
    batch_task_result r;
    r.task_id = entry.id;
    r.status = outcome.status;
    r.bytes_transferred = outcome.bytes_transferred;
    r.total_size = outcome.total_size;
    r.kind = outcome.kind;
    r.last_error = outcome.last_error;
    return r;
}

}  // namespace

batch_handle::batch_handle(std::shared_ptr<detail::batch_state> s)
    : state_(std::move(s)) {
}

auto batch_handle::id() const noexcept -> uint64_t {
    return state_ ? state_->id : 0;
}

auto batch_handle::task_ids() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    if (!state_) {
        return ids;
    }
    for (const auto& entry : state_->entries) {
        ids.push_back(entry->id);
    }
    for (const auto& rejected : state_->rejected) {
        ids.push_back(rejected.task_id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

auto batch_handle::wait() const -> batch_result {
    batch_result result;
    if (!state_) {
        return result;
    }

    result.total_files = state_->entries.size() + state_->rejected.size();

    for (const auto& entry : state_->entries) {
        const auto& outcome = entry->future.get();
        result.total_bytes += outcome.bytes_sent;
        switch (outcome.status) {
            case upload_status::completed: ++result.succeeded; break;
            case upload_status::cancelled: ++result.cancelled; break;
            default: ++result.failed; break;
        }
        result.file_results.push_back(to_task_result(*entry, outcome));
    }

    for (const auto& rejected : state_->rejected) {
        ++result.rejected;
        result.file_results.push_back(rejected);
    }

    std::sort(result.file_results.begin(), result.file_results.end(),
              [](const batch_task_result& a, const batch_task_result& b) {
                  return a.task_id < b.task_id;
              });

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - state_->started);
    return result;
}

auto batch_handle::wait_for(std::chrono::milliseconds timeout) const
    -> std::optional<batch_result> {
    if (!state_) {
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (const auto& entry : state_->entries) {
        if (entry->future.wait_until(deadline) != std::future_status::ready) {
            return std::nullopt;
        }
    }
    return wait();
}

void batch_handle::cancel_all() const {
    if (!state_) {
        return;
    }
    for (const auto& entry : state_->entries) {
        entry->control.request_cancel();
    }
}

}  // namespace resumable::upload
