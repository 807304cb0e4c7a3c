/**
 * @file observers.h
 * @brief Ready-made upload observers
 */

#ifndef RESUMABLE_UPLOAD_EVENTS_OBSERVERS_H
#define RESUMABLE_UPLOAD_EVENTS_OBSERVERS_H

#include <resumable/upload/events/progress_event_bus.h>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace resumable::upload {

/**
 * @brief Observer that forwards events to std::function callbacks
 *
 * Unset callbacks are ignored.
 *
 * @code
 * auto observer = std::make_shared<callback_observer>();
 * observer->on_progress_callback([](const progress_event& e) {
 *     std::cout << e.filename << " " << e.percent << "%\n";
 * });
 * coordinator.events().subscribe(observer);
 * @endcode
 */
class callback_observer : public upload_observer {
public:
    auto on_started_callback(std::function<void(const started_event&)> cb)
        -> callback_observer&;
    auto on_progress_callback(std::function<void(const progress_event&)> cb)
        -> callback_observer&;
    auto on_completed_callback(std::function<void(const completion_event&)> cb)
        -> callback_observer&;
    auto on_failed_callback(std::function<void(const failure_event&)> cb)
        -> callback_observer&;
    auto on_cancelled_callback(std::function<void(const cancellation_event&)> cb)
        -> callback_observer&;

    void on_started(const started_event& event) override;
    void on_progress(const progress_event& event) override;
    void on_completed(const completion_event& event) override;
    void on_failed(const failure_event& event) override;
    void on_cancelled(const cancellation_event& event) override;

private:
    std::function<void(const started_event&)> started_;
    std::function<void(const progress_event&)> progress_;
    std::function<void(const completion_event&)> completed_;
    std::function<void(const failure_event&)> failed_;
    std::function<void(const cancellation_event&)> cancelled_;
};

/**
 * @brief Last known state of one task as seen through events
 */
struct tracked_upload {
    std::string task_id;
    std::string filename;
    uint64_t total_size = 0;
    uint64_t resume_offset = 0;
    int percent = 0;
    upload_status status = upload_status::pending;
    std::optional<error_kind> failure_kind;
    std::string failure_detail;
};

/**
 * @brief Observer that keeps a per-task summary for polling consumers
 *
 * @note Thread-safe.
 */
class progress_tracker : public upload_observer {
public:
    void on_started(const started_event& event) override;
    void on_progress(const progress_event& event) override;
    void on_completed(const completion_event& event) override;
    void on_failed(const failure_event& event) override;
    void on_cancelled(const cancellation_event& event) override;

    [[nodiscard]] auto get(const std::string& task_id) const
        -> std::optional<tracked_upload>;

    [[nodiscard]] auto snapshot() const -> std::vector<tracked_upload>;

    void clear();

private:
    auto entry_for(const std::string& task_id, const std::string& filename)
        -> tracked_upload&;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, tracked_upload> uploads_;
};

/**
 * @brief Observer that writes every event to the upload logger
 *
 * Progress is logged at debug level, terminal events at info (completed,
 * cancelled) or error (failed).
 */
class logging_observer : public upload_observer {
public:
    void on_started(const started_event& event) override;
    void on_progress(const progress_event& event) override;
    void on_completed(const completion_event& event) override;
    void on_failed(const failure_event& event) override;
    void on_cancelled(const cancellation_event& event) override;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_EVENTS_OBSERVERS_H
