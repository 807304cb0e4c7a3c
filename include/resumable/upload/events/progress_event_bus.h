/**
 * @file progress_event_bus.h
 * @brief Fan-out of upload events to independently registered observers
 */

#ifndef RESUMABLE_UPLOAD_EVENTS_PROGRESS_EVENT_BUS_H
#define RESUMABLE_UPLOAD_EVENTS_PROGRESS_EVENT_BUS_H

#include <resumable/upload/core/upload_types.h>

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace resumable::upload {

/**
 * @brief Receiver of upload events
 *
 * Every handler has an empty default so observers override only what they
 * need. Handlers run on the worker thread of the task that emitted the
 * event and may be invoked concurrently for different tasks.
 */
class upload_observer {
public:
    virtual ~upload_observer() = default;

    virtual void on_started(const started_event& /*event*/) {}
    virtual void on_progress(const progress_event& /*event*/) {}
    virtual void on_completed(const completion_event& /*event*/) {}
    virtual void on_failed(const failure_event& /*event*/) {}
    virtual void on_cancelled(const cancellation_event& /*event*/) {}
};

/// Handle returned by subscribe(), used to unsubscribe
using subscription_id = uint64_t;

/**
 * @brief Event bus between chunk engines and observers
 *
 * Engines publish without knowing who listens. Per task, events reach each
 * observer in emission order; there is no ordering across tasks. An
 * observer that throws is logged and skipped; the exception never reaches
 * the engine or the remaining observers.
 *
 * Observers can be added and removed at any time. The observer list is
 * copied before delivery, so an observer may unsubscribe itself (or
 * others) from inside a handler.
 *
 * @code
 * progress_event_bus bus;
 * auto tracker = std::make_shared<progress_tracker>();
 * auto id = bus.subscribe(tracker);
 * // ...
 * bus.unsubscribe(id);
 * @endcode
 */
class progress_event_bus {
public:
    progress_event_bus() = default;

    progress_event_bus(const progress_event_bus&) = delete;
    auto operator=(const progress_event_bus&) -> progress_event_bus& = delete;

    /**
     * @brief Register an observer
     * @return Subscription handle, 0 if observer is null
     */
    auto subscribe(std::shared_ptr<upload_observer> observer) -> subscription_id;

    /**
     * @brief Remove an observer
     * @return true if the subscription existed
     */
    auto unsubscribe(subscription_id id) -> bool;

    [[nodiscard]] auto observer_count() const -> std::size_t;

    void publish_started(const started_event& event) const;
    void publish_progress(const progress_event& event) const;
    void publish_completed(const completion_event& event) const;
    void publish_failed(const failure_event& event) const;
    void publish_cancelled(const cancellation_event& event) const;

private:
    using entry = std::pair<subscription_id, std::shared_ptr<upload_observer>>;

    [[nodiscard]] auto snapshot() const -> std::vector<entry>;

    template <typename Event, typename Handler>
    void dispatch(const char* event_name, const Event& event, Handler handler) const;

    mutable std::shared_mutex mutex_;
    std::vector<entry> observers_;
    subscription_id next_id_ = 1;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_EVENTS_PROGRESS_EVENT_BUS_H
