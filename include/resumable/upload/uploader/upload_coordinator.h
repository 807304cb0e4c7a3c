/**
 * @file upload_coordinator.h
 * @brief Owner of in-flight uploads: admission, concurrency and cancellation
 */

#ifndef RESUMABLE_UPLOAD_UPLOADER_UPLOAD_COORDINATOR_H
#define RESUMABLE_UPLOAD_UPLOADER_UPLOAD_COORDINATOR_H

#include <resumable/upload/core/resume_store.h>
#include <resumable/upload/events/progress_event_bus.h>
#include <resumable/upload/remote/remote_access.h>
#include <resumable/upload/uploader/uploader_config.h>
#include <resumable/upload/uploader/uploader_types.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resumable::upload {

namespace adapters {
class upload_pool_interface;
}

/**
 * @brief Runs uploads against a remote capability with bounded concurrency
 *
 * Every accepted task runs on one worker of a pool sized max_concurrent;
 * further tasks wait in FIFO order. One task failing never affects the
 * others. A task id can be active only once at a time.
 *
 * Remote I/O scheduling follows uploader_config::remote_io. In automatic
 * mode calls are serialized across tasks unless the capability reports
 * supports_concurrent_channels().
 *
 * @code
 * auto coordinator = upload_coordinator::builder()
 *     .with_metadata_directory("/var/lib/uploader/resume")
 *     .with_max_concurrent(4)
 *     .build();
 *
 * if (coordinator.has_value()) {
 *     auto& uploads = coordinator.value();
 *     uploads.set_remote_access(sftp_session);
 *     uploads.events().subscribe(std::make_shared<logging_observer>());
 *
 *     auto handle = uploads.upload_file("report", "report.pdf", "/inbox/report.pdf");
 *     if (handle) {
 *         auto outcome = handle.value().wait();
 *     }
 * }
 * @endcode
 */
class upload_coordinator {
public:
    /**
     * @brief Builder for upload_coordinator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Directory for resume records (required)
         */
        auto with_metadata_directory(std::filesystem::path dir) -> builder&;

        /**
         * @brief Set chunk size for new tasks
         * @param size Chunk size in bytes (default: 4 MiB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Maximum simultaneously active uploads (default: 4)
         */
        auto with_max_concurrent(std::size_t count) -> builder&;

        /**
         * @brief Retry schedule for connectivity errors
         */
        auto with_retry_policy(retry_policy policy) -> builder&;

        auto with_fingerprint_mode(fingerprint_mode mode) -> builder&;

        auto with_remote_io_mode(remote_io_mode mode) -> builder&;

        /**
         * @brief Age after which retained resume records are purged
         */
        auto with_record_ttl(std::chrono::seconds ttl) -> builder&;

        auto with_auto_cleanup(bool enable) -> builder&;

        /**
         * @brief Remote capability; may also be supplied later
         */
        auto with_remote_access(std::shared_ptr<remote_access> remote) -> builder&;

        /**
         * @brief Run uploads on a caller-owned pool instead of an internal one
         *
         * The pool's worker count then bounds concurrency; the coordinator
         * never shuts it down.
         */
        auto with_worker_pool(std::shared_ptr<adapters::upload_pool_interface> pool)
            -> builder&;

        /**
         * @brief Build the coordinator instance
         * @return Result containing the coordinator or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<upload_coordinator>;

    private:
        uploader_config config_;
        std::shared_ptr<remote_access> remote_;
        std::shared_ptr<adapters::upload_pool_interface> pool_;
    };

    /**
     * @brief Create a coordinator from a complete configuration
     * @return The coordinator, or invalid_configuration (also for a pool
     *         that is not running)
     */
    [[nodiscard]] static auto create(
        uploader_config config,
        std::shared_ptr<remote_access> remote = nullptr,
        std::shared_ptr<adapters::upload_pool_interface> pool = nullptr)
        -> result<upload_coordinator>;

    // Non-copyable, movable
    upload_coordinator(const upload_coordinator&) = delete;
    auto operator=(const upload_coordinator&) -> upload_coordinator& = delete;
    upload_coordinator(upload_coordinator&&) noexcept;
    auto operator=(upload_coordinator&&) noexcept -> upload_coordinator&;

    /**
     * @brief Cancels every active upload and waits for the workers
     */
    ~upload_coordinator();

    /**
     * @brief Install or replace the remote capability
     *
     * Tasks already running keep the capability they started with.
     */
    void set_remote_access(std::shared_ptr<remote_access> remote);

    [[nodiscard]] auto has_remote_access() const -> bool;

    /**
     * @brief Event bus for observer registration
     */
    [[nodiscard]] auto events() -> progress_event_bus&;

    /**
     * @brief Submit one upload
     * @return Handle, or invalid_task, remote_not_configured,
     *         upload_already_active, internal_error if the pool refuses it
     */
    [[nodiscard]] auto upload_file(const std::string& id,
                                   const std::filesystem::path& local_path,
                                   const std::string& remote_path)
        -> result<upload_handle>;

    /**
     * @brief Submit one upload per entry of id -> target
     *
     * Entries that cannot be admitted (empty or active id) are reported as
     * rejected in the batch result; the others run normally.
     *
     * @return Batch handle, or remote_not_configured
     */
    [[nodiscard]] auto batch_upload(const std::map<std::string, upload_target>& targets)
        -> result<batch_handle>;

    /**
     * @brief Request cancellation of an active upload (non-blocking)
     * @return upload_not_found if the id is not active
     */
    [[nodiscard]] auto cancel_upload(const std::string& id) -> result<void>;

    /**
     * @brief Hold an active upload at its next chunk boundary
     */
    [[nodiscard]] auto pause_upload(const std::string& id) -> result<void>;

    /**
     * @brief Release a paused upload
     */
    [[nodiscard]] auto resume_upload(const std::string& id) -> result<void>;

    /**
     * @brief Request cancellation of every active upload
     * @return Number of uploads signalled
     */
    auto cancel_all() -> std::size_t;

    /**
     * @brief Block until no upload is active
     */
    void wait_all();

    /**
     * @brief Block up to timeout until no upload is active
     * @return true if all uploads finished in time
     */
    [[nodiscard]] auto wait_all_for(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Snapshot of an active or finished task
     *
     * Finished snapshots are kept for the last uploader_config::finished_history
     * tasks; resubmitting an id drops its previous snapshot.
     */
    [[nodiscard]] auto get_task(const std::string& id) const -> std::optional<upload_task>;

    [[nodiscard]] auto active_count() const -> std::size_t;

    [[nodiscard]] auto is_active(const std::string& id) const -> bool;

    /**
     * @brief Retained resume records of tasks that are not active
     *
     * These are uploads that failed, were cancelled, or were interrupted by
     * a process exit. Calling upload_file with the same id resumes them.
     */
    [[nodiscard]] auto list_resumable() const -> std::vector<resume_record>;

    /**
     * @brief Drop all finished task snapshots
     * @return Number of snapshots dropped
     */
    auto clear_finished() -> std::size_t;

    [[nodiscard]] auto config() const -> const uploader_config&;

private:
    upload_coordinator(uploader_config config,
                       std::shared_ptr<remote_access> remote,
                       std::shared_ptr<adapters::upload_pool_interface> pool);

    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_UPLOADER_UPLOAD_COORDINATOR_H
