/**
 * @file observers.cpp
 * @brief Implementation of the bundled upload observers
 */

#include <resumable/upload/events/observers.h>
#include <resumable/upload/core/logging.h>

#include <algorithm>

namespace resumable::upload {

// ============================================================================
// callback_observer
// ============================================================================

auto callback_observer::on_started_callback(std::function<void(const started_event&)> cb)
    -> callback_observer& {
    started_ = std::move(cb);
    return *this;
}

auto callback_observer::on_progress_callback(std::function<void(const progress_event&)> cb)
    -> callback_observer& {
    progress_ = std::move(cb);
    return *this;
}

auto callback_observer::on_completed_callback(
    std::function<void(const completion_event&)> cb) -> callback_observer& {
    completed_ = std::move(cb);
    return *this;
}

auto callback_observer::on_failed_callback(std::function<void(const failure_event&)> cb)
    -> callback_observer& {
    failed_ = std::move(cb);
    return *this;
}

auto callback_observer::on_cancelled_callback(
    std::function<void(const cancellation_event&)> cb) -> callback_observer& {
    cancelled_ = std::move(cb);
    return *this;
}

void callback_observer::on_started(const started_event& event) {
    if (started_) started_(event);
}

void callback_observer::on_progress(const progress_event& event) {
    if (progress_) progress_(event);
}

void callback_observer::on_completed(const completion_event& event) {
    if (completed_) completed_(event);
}

void callback_observer::on_failed(const failure_event& event) {
    if (failed_) failed_(event);
}

void callback_observer::on_cancelled(const cancellation_event& event) {
    if (cancelled_) cancelled_(event);
}

// ============================================================================
// progress_tracker
// ============================================================================

auto progress_tracker::entry_for(const std::string& task_id, const std::string& filename)
    -> tracked_upload& {
    auto& entry = uploads_[task_id];
    entry.task_id = task_id;
    if (!filename.empty()) {
        entry.filename = filename;
    }
    return entry;
}

void progress_tracker::on_started(const started_event& event) {
    std::lock_guard lock(mutex_);
    auto& entry = entry_for(event.task_id, event.filename);
    entry.total_size = event.total_size;
    entry.resume_offset = event.resume_offset;
    entry.status = upload_status::in_progress;
    entry.failure_kind.reset();
    entry.failure_detail.clear();
    if (event.total_size > 0) {
        entry.percent = static_cast<int>(event.resume_offset * 100 / event.total_size);
    } else {
        entry.percent = 0;
    }
}

void progress_tracker::on_progress(const progress_event& event) {
    std::lock_guard lock(mutex_);
    auto& entry = entry_for(event.task_id, event.filename);
    entry.percent = std::max(entry.percent, event.percent);
    if (entry.status == upload_status::pending) {
        entry.status = upload_status::in_progress;
    }
}

void progress_tracker::on_completed(const completion_event& event) {
    std::lock_guard lock(mutex_);
    auto& entry = entry_for(event.task_id, event.filename);
    entry.percent = 100;
    entry.status = upload_status::completed;
}

void progress_tracker::on_failed(const failure_event& event) {
    std::lock_guard lock(mutex_);
    auto& entry = entry_for(event.task_id, event.filename);
    entry.status = upload_status::failed;
    entry.failure_kind = event.kind;
    entry.failure_detail = event.detail;
}

void progress_tracker::on_cancelled(const cancellation_event& event) {
    std::lock_guard lock(mutex_);
    auto& entry = entry_for(event.task_id, event.filename);
    entry.status = upload_status::cancelled;
}

auto progress_tracker::get(const std::string& task_id) const
    -> std::optional<tracked_upload> {
    std::lock_guard lock(mutex_);
    auto it = uploads_.find(task_id);
    if (it == uploads_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto progress_tracker::snapshot() const -> std::vector<tracked_upload> {
    std::lock_guard lock(mutex_);
    std::vector<tracked_upload> result;
    result.reserve(uploads_.size());
    for (const auto& [id, entry] : uploads_) {
        result.push_back(entry);
    }
    std::sort(result.begin(), result.end(),
              [](const tracked_upload& a, const tracked_upload& b) {
                  return a.task_id < b.task_id;
              });
    return result;
}

void progress_tracker::clear() {
    std::lock_guard lock(mutex_);
    uploads_.clear();
}

// ============================================================================
// logging_observer
// ============================================================================

void logging_observer::on_started(const started_event& event) {
    upload_log_context ctx;
    ctx.task_id = event.task_id;
    ctx.filename = event.filename;
    ctx.file_size = event.total_size;
    ctx.offset = event.resume_offset;
    if (event.resume_offset > 0) {
        RU_LOG_INFO_CTX(log_category::events, "Upload resumed", ctx);
    } else {
        RU_LOG_INFO_CTX(log_category::events, "Upload started", ctx);
    }
}

void logging_observer::on_progress(const progress_event& event) {
    upload_log_context ctx;
    ctx.task_id = event.task_id;
    ctx.filename = event.filename;
    ctx.progress_percent = event.percent;
    RU_LOG_DEBUG_CTX(log_category::events, "Upload progress", ctx);
}

void logging_observer::on_completed(const completion_event& event) {
    upload_log_context ctx;
    ctx.task_id = event.task_id;
    ctx.filename = event.filename;
    ctx.progress_percent = 100;
    RU_LOG_INFO_CTX(log_category::events, "Upload completed", ctx);
}

void logging_observer::on_failed(const failure_event& event) {
    upload_log_context ctx;
    ctx.task_id = event.task_id;
    ctx.filename = event.filename;
    ctx.error_kind = std::string(to_string(event.kind));
    ctx.error_message = event.detail;
    RU_LOG_ERROR_CTX(log_category::events, "Upload failed", ctx);
}

void logging_observer::on_cancelled(const cancellation_event& event) {
    upload_log_context ctx;
    ctx.task_id = event.task_id;
    ctx.filename = event.filename;
    ctx.bytes_transferred = event.bytes_transferred;
    RU_LOG_INFO_CTX(log_category::events, "Upload cancelled", ctx);
}

}  // namespace resumable::upload
