/**
 * @file progress_event_bus.cpp
 * @brief Implementation of progress_event_bus
 */

#include <resumable/upload/events/progress_event_bus.h>
#include <resumable/upload/core/logging.h>

#include <algorithm>
#include <exception>
#include <mutex>

namespace resumable::upload {

auto progress_event_bus::subscribe(std::shared_ptr<upload_observer> observer)
    -> subscription_id {
    if (!observer) {
        return 0;
    }

    std::unique_lock lock(mutex_);
    auto id = next_id_++;
    observers_.emplace_back(id, std::move(observer));
    RU_LOG_DEBUG(log_category::events,
        "Observer " + std::to_string(id) + " subscribed (" +
        std::to_string(observers_.size()) + " total)");
    return id;
}

auto progress_event_bus::unsubscribe(subscription_id id) -> bool {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(observers_.begin(), observers_.end(),
                           [id](const entry& e) { return e.first == id; });
    if (it == observers_.end()) {
        return false;
    }
    observers_.erase(it);
    RU_LOG_DEBUG(log_category::events, "Observer " + std::to_string(id) + " unsubscribed");
    return true;
}

auto progress_event_bus::observer_count() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return observers_.size();
}

auto progress_event_bus::snapshot() const -> std::vector<entry> {
    std::shared_lock lock(mutex_);
    return observers_;
}

template <typename Event, typename Handler>
void progress_event_bus::dispatch(const char* event_name, const Event& event,
                                  Handler handler) const {
    for (const auto& [id, observer] : snapshot()) {
        try {
            handler(*observer, event);
        } catch (const std::exception& e) {
            RU_LOG_WARN(log_category::events,
                std::string("Observer ") + std::to_string(id) + " threw from " +
                event_name + " for task " + event.task_id + ": " + e.what());
        } catch (...) {
            RU_LOG_WARN(log_category::events,
                std::string("Observer ") + std::to_string(id) +
                " threw a non-standard exception from " + event_name +
                " for task " + event.task_id);
        }
    }
}

void progress_event_bus::publish_started(const started_event& event) const {
    dispatch("on_started", event,
             [](upload_observer& o, const started_event& e) { o.on_started(e); });
}

void progress_event_bus::publish_progress(const progress_event& event) const {
    dispatch("on_progress", event,
             [](upload_observer& o, const progress_event& e) { o.on_progress(e); });
}

void progress_event_bus::publish_completed(const completion_event& event) const {
    dispatch("on_completed", event,
             [](upload_observer& o, const completion_event& e) { o.on_completed(e); });
}

void progress_event_bus::publish_failed(const failure_event& event) const {
    dispatch("on_failed", event,
             [](upload_observer& o, const failure_event& e) { o.on_failed(e); });
}

void progress_event_bus::publish_cancelled(const cancellation_event& event) const {
    dispatch("on_cancelled", event,
             [](upload_observer& o, const cancellation_event& e) { o.on_cancelled(e); });
}

}  // namespace resumable::upload
