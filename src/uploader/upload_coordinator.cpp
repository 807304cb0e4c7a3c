/**
 * @file upload_coordinator.cpp
 * @brief Implementation of upload_coordinator
 */

#include <resumable/upload/uploader/upload_coordinator.h>
#include <resumable/upload/adapters/thread_pool_adapter.h>
#include <resumable/upload/core/logging.h>
#include <resumable/upload/engine/chunk_transfer_engine.h>
#include <resumable/upload/remote/serialized_remote_access.h>

#include "upload_state.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace resumable::upload {

// ============================================================================
// upload_coordinator::impl
// ============================================================================

class upload_coordinator::impl {
public:
    impl(uploader_config cfg, std::shared_ptr<remote_access> remote,
         std::shared_ptr<adapters::upload_pool_interface> pool)
        : config_(std::move(cfg))
        , store_(make_store_config(config_))
        , pool_(std::move(pool))
        , owns_pool_(pool_ == nullptr) {
        if (remote) {
            set_remote_access(std::move(remote));
        }

        if (config_.auto_cleanup) {
            auto removed = store_.cleanup_expired();
            if (removed > 0) {
                RU_LOG_INFO(log_category::coordinator,
                    "Purged " + std::to_string(removed) + " expired resume records");
            }
        }

        if (owns_pool_) {
            pool_ = adapters::upload_pool_factory::create(config_.max_concurrent, "upload_pool");
        }

        RU_LOG_INFO(log_category::coordinator,
            "Coordinator ready: max_concurrent=" + std::to_string(config_.max_concurrent) +
            " chunk_size=" + std::to_string(config_.chunk_size) +
            " remote_io=" + to_string(config_.remote_io));
    }

    ~impl() {
        auto signalled = cancel_all();
        if (signalled > 0) {
            RU_LOG_INFO(log_category::coordinator,
                "Shutting down with " + std::to_string(signalled) + " active uploads");
        }
        wait_all();
        if (owns_pool_) {
            pool_->shutdown();
        }
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    // ------------------------------------------------------------------------
    // Remote capability
    // ------------------------------------------------------------------------

    void set_remote_access(std::shared_ptr<remote_access> remote) {
        auto effective = make_effective(std::move(remote));
        std::lock_guard lock(mutex_);
        remote_ = std::move(effective);
    }

    auto has_remote_access() const -> bool {
        std::lock_guard lock(mutex_);
        return remote_ != nullptr;
    }

    auto events() -> progress_event_bus& { return events_; }

    // ------------------------------------------------------------------------
    // Submission
    // ------------------------------------------------------------------------

    auto submit(const std::string& id,
                const std::filesystem::path& local_path,
                const std::string& remote_path)
        -> result<std::shared_ptr<detail::upload_entry>> {
        if (id.empty()) {
            return unexpected(error{error_code::invalid_task, "task id is empty"});
        }
        if (remote_path.empty()) {
            return unexpected(error{error_code::invalid_task,
                                    "remote path is empty for task " + id});
        }

        std::shared_ptr<detail::upload_entry> entry;
        std::shared_ptr<remote_access> remote;
        {
            std::lock_guard lock(mutex_);
            if (!remote_) {
                return unexpected(error{error_code::remote_not_configured});
            }
            if (active_.count(id) > 0) {
                RU_LOG_WARN(log_category::coordinator,
                    "Rejected duplicate upload request for active task " + id);
                return unexpected(error{error_code::upload_already_active,
                                        "upload already active: " + id});
            }

            entry = std::make_shared<detail::upload_entry>(
                upload_task(id, local_path, remote_path, config_.chunk_size));
            active_.emplace(id, entry);
            forget_finished(id);
            remote = remote_;
        }

        upload_log_context ctx;
        ctx.task_id = id;
        ctx.filename = local_path.filename().string();
        ctx.remote_path = remote_path;
        RU_LOG_DEBUG_CTX(log_category::coordinator, "Upload queued", ctx);

        // Completion is signalled through the entry's promise. A future that
        // is already ready with an exception means the pool refused the job.
        auto submitted = pool_->submit([this, entry, remote] { run(entry, remote); });
        if (auto refused = rejection_of(submitted)) {
            withdraw(entry);
            RU_LOG_ERROR_CTX(log_category::coordinator, refused->message, ctx);
            return unexpected(*refused);
        }
        return entry;
    }

    auto batch(const std::map<std::string, upload_target>& targets)
        -> result<std::shared_ptr<detail::batch_state>> {
        if (!has_remote_access()) {
            return unexpected(error{error_code::remote_not_configured});
        }

        auto state = std::make_shared<detail::batch_state>();
        state->id = next_batch_id_.fetch_add(1);

        for (const auto& [id, target] : targets) {
            auto entry = submit(id, target.local_path, target.remote_path);
            if (entry) {
                state->entries.push_back(std::move(entry.value()));
                continue;
            }

            batch_task_result rejected;
            rejected.task_id = id;
            rejected.rejected = true;
            rejected.kind = classify(entry.error().code);
            rejected.last_error = entry.error();
            state->rejected.push_back(std::move(rejected));
        }

        RU_LOG_INFO(log_category::coordinator,
            "Batch " + std::to_string(state->id) + " submitted: " +
            std::to_string(state->entries.size()) + " accepted, " +
            std::to_string(state->rejected.size()) + " rejected");
        return state;
    }

    // ------------------------------------------------------------------------
    // Control
    // ------------------------------------------------------------------------

    auto find(const std::string& id) const -> std::shared_ptr<detail::upload_entry> {
        std::lock_guard lock(mutex_);
        auto it = active_.find(id);
        return it != active_.end() ? it->second : nullptr;
    }

    auto cancel(const std::string& id) -> result<void> {
        auto entry = find(id);
        if (!entry) {
            return unexpected(error{error_code::upload_not_found, "no active upload: " + id});
        }
        entry->control.request_cancel();
        RU_LOG_INFO(log_category::coordinator, "Cancellation requested for " + id);
        return {};
    }

    auto pause(const std::string& id) -> result<void> {
        auto entry = find(id);
        if (!entry) {
            return unexpected(error{error_code::upload_not_found, "no active upload: " + id});
        }
        entry->control.request_pause();
        return {};
    }

    auto resume(const std::string& id) -> result<void> {
        auto entry = find(id);
        if (!entry) {
            return unexpected(error{error_code::upload_not_found, "no active upload: " + id});
        }
        entry->control.request_resume();
        return {};
    }

    auto cancel_all() -> std::size_t {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : active_) {
            entry->control.request_cancel();
        }
        return active_.size();
    }

    void wait_all() {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this] { return active_.empty(); });
    }

    auto wait_all_for(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] { return active_.empty(); });
    }

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    auto get_task(const std::string& id) const -> std::optional<upload_task> {
        std::lock_guard lock(mutex_);
        if (auto it = active_.find(id); it != active_.end()) {
            return it->second->current();
        }
        if (auto it = finished_.find(id); it != finished_.end()) {
            return it->second.task;
        }
        return std::nullopt;
    }

    auto active_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return active_.size();
    }

    auto is_active(const std::string& id) const -> bool {
        std::lock_guard lock(mutex_);
        return active_.count(id) > 0;
    }

    auto list_resumable() const -> std::vector<resume_record> {
        auto records = store_.list();

        std::lock_guard lock(mutex_);
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [this](const resume_record& r) {
                                         return active_.count(r.id) > 0 ||
                                                r.last_status == upload_status::completed;
                                     }),
                      records.end());
        std::sort(records.begin(), records.end(),
                  [](const resume_record& a, const resume_record& b) { return a.id < b.id; });
        return records;
    }

    auto clear_finished() -> std::size_t {
        std::lock_guard lock(mutex_);
        auto cleared = finished_.size();
        finished_.clear();
        finished_order_.clear();
        return cleared;
    }

    auto config() const -> const uploader_config& { return config_; }

private:
    struct finished_task {
        upload_task task;
        std::list<std::string>::iterator order;
    };

    static auto rejection_of(std::future<void>& submitted) -> std::optional<error> {
        if (submitted.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return std::nullopt;
        }
        try {
            submitted.get();
        } catch (const std::exception& e) {
            return error{error_code::internal_error,
                         std::string("worker pool rejected upload: ") + e.what()};
        }
        return std::nullopt;
    }

    void withdraw(const std::shared_ptr<detail::upload_entry>& entry) {
        {
            std::lock_guard lock(mutex_);
            auto it = active_.find(entry->id);
            if (it != active_.end() && it->second == entry) {
                active_.erase(it);
            }
        }
        idle_cv_.notify_all();
    }

    // Caller holds mutex_
    void forget_finished(const std::string& id) {
        auto it = finished_.find(id);
        if (it == finished_.end()) {
            return;
        }
        finished_order_.erase(it->second.order);
        finished_.erase(it);
    }

    // Caller holds mutex_
    void remember_finished(const std::string& id, upload_task task) {
        forget_finished(id);
        if (config_.finished_history == 0) {
            return;
        }
        finished_order_.push_back(id);
        finished_.emplace(id, finished_task{std::move(task), std::prev(finished_order_.end())});
        while (finished_.size() > config_.finished_history) {
            finished_.erase(finished_order_.front());
            finished_order_.pop_front();
        }
    }

    static auto make_store_config(const uploader_config& config) -> resume_store_config {
        resume_store_config store_config(config.metadata_directory);
        store_config.record_ttl = config.record_ttl;
        return store_config;
    }

    auto make_effective(std::shared_ptr<remote_access> remote) const
        -> std::shared_ptr<remote_access> {
        if (!remote) {
            return nullptr;
        }

        bool serialize = false;
        switch (config_.remote_io) {
            case remote_io_mode::serialized: serialize = true; break;
            case remote_io_mode::parallel: serialize = false; break;
            case remote_io_mode::automatic:
                serialize = !remote->supports_concurrent_channels();
                break;
        }

        RU_LOG_INFO(log_category::coordinator,
            std::string("Remote capability installed, remote I/O ") +
            (serialize ? "serialized across tasks" : "parallel per task"));

        if (serialize) {
            return std::make_shared<serialized_remote_access>(std::move(remote));
        }
        return remote;
    }

    void run(const std::shared_ptr<detail::upload_entry>& entry,
             const std::shared_ptr<remote_access>& remote) {
        auto work = entry->current();
        upload_outcome outcome;

        try {
            chunk_transfer_engine engine(remote, store_, events_,
                                         engine_options{config_.retry, config_.fingerprint});
            outcome = engine.run(work, entry->control,
                                 [&entry](const upload_task& t) { entry->update(t); });
        } catch (const std::exception& e) {
            outcome = abort_run(entry, work, e.what());
        } catch (...) {
            outcome = abort_run(entry, work, "unknown exception");
        }

        retire(entry, outcome);
    }

    auto abort_run(const std::shared_ptr<detail::upload_entry>& entry,
                   upload_task& work,
                   const std::string& what) -> upload_outcome {
        error err{error_code::internal_error, what};
        RU_LOG_ERROR(log_category::coordinator,
            "Upload " + entry->id + " aborted by exception: " + what);

        work.status = upload_status::failed;
        work.last_error = err;
        work.last_error_kind = error_kind::internal;
        entry->update(work);

        events_.publish_failed(
            failure_event{work.id, work.filename(), error_kind::internal, err.message});

        upload_outcome outcome;
        outcome.status = upload_status::failed;
        outcome.total_size = work.total_size;
        outcome.bytes_transferred = work.bytes_transferred;
        outcome.last_error = err;
        outcome.kind = error_kind::internal;
        return outcome;
    }

    void retire(const std::shared_ptr<detail::upload_entry>& entry,
                const upload_outcome& outcome) {
        {
            std::lock_guard lock(mutex_);
            auto it = active_.find(entry->id);
            if (it != active_.end() && it->second == entry) {
                active_.erase(it);
            }
            remember_finished(entry->id, entry->current());
            // Notified under the lock: once it is released the destructor may
            // run, so nothing below touches the coordinator
            idle_cv_.notify_all();
        }

        entry->promise.set_value(outcome);

        RU_LOG_DEBUG(log_category::coordinator,
            "Upload " + entry->id + " retired as " + to_string(outcome.status));
    }

    uploader_config config_;
    resume_store store_;
    progress_event_bus events_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::shared_ptr<remote_access> remote_;
    std::unordered_map<std::string, std::shared_ptr<detail::upload_entry>> active_;
    std::unordered_map<std::string, finished_task> finished_;
    std::list<std::string> finished_order_;
    std::atomic<uint64_t> next_batch_id_{1};

    std::shared_ptr<adapters::upload_pool_interface> pool_;
    const bool owns_pool_;
};

// ============================================================================
// upload_coordinator::builder
// ============================================================================

upload_coordinator::builder::builder() = default;

auto upload_coordinator::builder::with_metadata_directory(std::filesystem::path dir)
    -> builder& {
    config_.metadata_directory = std::move(dir);
    return *this;
}

auto upload_coordinator::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto upload_coordinator::builder::with_max_concurrent(std::size_t count) -> builder& {
    config_.max_concurrent = count;
    return *this;
}

auto upload_coordinator::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto upload_coordinator::builder::with_fingerprint_mode(fingerprint_mode mode) -> builder& {
    config_.fingerprint = mode;
    return *this;
}

auto upload_coordinator::builder::with_remote_io_mode(remote_io_mode mode) -> builder& {
    config_.remote_io = mode;
    return *this;
}

auto upload_coordinator::builder::with_record_ttl(std::chrono::seconds ttl) -> builder& {
    config_.record_ttl = ttl;
    return *this;
}

auto upload_coordinator::builder::with_auto_cleanup(bool enable) -> builder& {
    config_.auto_cleanup = enable;
    return *this;
}

auto upload_coordinator::builder::with_remote_access(std::shared_ptr<remote_access> remote)
    -> builder& {
    remote_ = std::move(remote);
    return *this;
}

auto upload_coordinator::builder::with_worker_pool(
    std::shared_ptr<adapters::upload_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_coordinator::builder::build() -> result<upload_coordinator> {
    return upload_coordinator::create(config_, remote_, pool_);
}

// ============================================================================
// upload_coordinator
// ============================================================================

auto upload_coordinator::create(uploader_config config,
                                std::shared_ptr<remote_access> remote,
                                std::shared_ptr<adapters::upload_pool_interface> pool)
    -> result<upload_coordinator> {
    if (auto valid = config.validate(); !valid) {
        RU_LOG_ERROR(log_category::coordinator,
            "Invalid uploader configuration: " + valid.error().message);
        return unexpected(valid.error());
    }
    if (pool && !pool->is_running()) {
        return unexpected(error{error_code::invalid_configuration,
                                "worker pool is not running"});
    }
    return upload_coordinator(std::move(config), std::move(remote), std::move(pool));
}

upload_coordinator::upload_coordinator(uploader_config config,
                                       std::shared_ptr<remote_access> remote,
                                       std::shared_ptr<adapters::upload_pool_interface> pool)
    : impl_(std::make_unique<impl>(std::move(config), std::move(remote), std::move(pool))) {
}

upload_coordinator::upload_coordinator(upload_coordinator&&) noexcept = default;

auto upload_coordinator::operator=(upload_coordinator&&) noexcept
    -> upload_coordinator& = default;

upload_coordinator::~upload_coordinator() = default;

void upload_coordinator::set_remote_access(std::shared_ptr<remote_access> remote) {
    impl_->set_remote_access(std::move(remote));
}

auto upload_coordinator::has_remote_access() const -> bool {
    return impl_->has_remote_access();
}

auto upload_coordinator::events() -> progress_event_bus& {
    return impl_->events();
}

auto upload_coordinator::upload_file(const std::string& id,
                                     const std::filesystem::path& local_path,
                                     const std::string& remote_path)
    -> result<upload_handle> {
    auto entry = impl_->submit(id, local_path, remote_path);
    if (!entry) {
        return unexpected(entry.error());
    }
    return upload_handle(std::move(entry.value()));
}

auto upload_coordinator::batch_upload(const std::map<std::string, upload_target>& targets)
    -> result<batch_handle> {
    auto state = impl_->batch(targets);
    if (!state) {
        return unexpected(state.error());
    }
    return batch_handle(std::move(state.value()));
}

auto upload_coordinator::cancel_upload(const std::string& id) -> result<void> {
    return impl_->cancel(id);
}

auto upload_coordinator::pause_upload(const std::string& id) -> result<void> {
    return impl_->pause(id);
}

auto upload_coordinator::resume_upload(const std::string& id) -> result<void> {
    return impl_->resume(id);
}

auto upload_coordinator::cancel_all() -> std::size_t {
    return impl_->cancel_all();
}

void upload_coordinator::wait_all() {
    impl_->wait_all();
}

auto upload_coordinator::wait_all_for(std::chrono::milliseconds timeout) -> bool {
    return impl_->wait_all_for(timeout);
}

auto upload_coordinator::get_task(const std::string& id) const
    -> std::optional<upload_task> {
    return impl_->get_task(id);
}

auto upload_coordinator::active_count() const -> std::size_t {
    return impl_->active_count();
}

auto upload_coordinator::is_active(const std::string& id) const -> bool {
    return impl_->is_active(id);
}

auto upload_coordinator::list_resumable() const -> std::vector<resume_record> {
    return impl_->list_resumable();
}

auto upload_coordinator::clear_finished() -> std::size_t {
    return impl_->clear_finished();
}

auto upload_coordinator::config() const -> const uploader_config& {
    return impl_->config();
}

}  // namespace resumable::upload
