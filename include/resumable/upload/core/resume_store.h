/**
 * @file resume_store.h
 * @brief Persistent resume records for interrupted uploads
 *
 * This file defines the resume_record persisted for every in-flight upload
 * and the resume_store that saves, loads and deletes those records under
 * an operator-configured directory.
 */

#ifndef RESUMABLE_UPLOAD_CORE_RESUME_STORE_H
#define RESUMABLE_UPLOAD_CORE_RESUME_STORE_H

#include <resumable/upload/core/types.h>
#include <resumable/upload/core/upload_types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace resumable::upload {

/**
 * @brief Persisted projection of an upload task, one per task id
 *
 * A record is valid for resume only while file_fingerprint matches the
 * current fingerprint of the local file.
 */
struct resume_record {
    std::string id;                      ///< Task identifier
    std::string remote_path;             ///< Destination path
    std::string local_path;              ///< Source path
    uint64_t file_size = 0;              ///< Local size when last committed
    std::string file_fingerprint;        ///< Canonical fingerprint string
    std::size_t chunk_size = default_chunk_size;
    uint64_t bytes_transferred = 0;      ///< Bytes committed on the remote
    upload_status last_status = upload_status::in_progress;
    std::chrono::system_clock::time_point updated_at;

    resume_record() = default;

    /**
     * @brief Snapshot a task into a record stamped with the current time
     */
    static auto from_task(const upload_task& task, std::string fingerprint)
        -> resume_record;
};

/**
 * @brief Configuration for resume_store
 */
struct resume_store_config {
    std::filesystem::path directory;              ///< Directory for record files
    std::chrono::seconds record_ttl{7 * 86400};   ///< Age after which records expire

    resume_store_config() = default;

    explicit resume_store_config(std::filesystem::path dir)
        : directory(std::move(dir)) {}
};

/**
 * @brief Store for resume records
 *
 * Each record lives in its own JSON file named after the (escaped) task
 * id. save() writes to a temporary file and renames it over the previous
 * record, so a failed write never corrupts what was saved before. Tasks
 * own exactly one record each, so no locking is performed between tasks.
 *
 * @code
 * resume_store store(resume_store_config{"/var/lib/uploader/state"});
 *
 * auto record = resume_record::from_task(task, fingerprint.to_string());
 * if (auto r = store.save(record); !r) {
 *     // r.error().message
 * }
 *
 * auto loaded = store.load(task.id);
 * @endcode
 */
class resume_store {
public:
    explicit resume_store(resume_store_config config);

    ~resume_store();

    resume_store(const resume_store&) = delete;
    auto operator=(const resume_store&) -> resume_store& = delete;
    resume_store(resume_store&&) noexcept;
    auto operator=(resume_store&&) noexcept -> resume_store&;

    /**
     * @brief Load the record for a task
     * @return Record, resume_record_not_found, or resume_record_corrupted
     */
    [[nodiscard]] auto load(const std::string& id) const -> result<resume_record>;

    /**
     * @brief Atomically persist a record (write-to-temp then rename)
     */
    [[nodiscard]] auto save(const resume_record& record) -> result<void>;

    /**
     * @brief Delete the record for a task; absent records are not an error
     */
    [[nodiscard]] auto remove(const std::string& id) -> result<void>;

    [[nodiscard]] auto contains(const std::string& id) const -> bool;

    /**
     * @brief All decodable records in the store
     */
    [[nodiscard]] auto list() const -> std::vector<resume_record>;

    /**
     * @brief Delete records whose updated_at is older than the TTL
     * @return Number of records removed
     */
    [[nodiscard]] auto cleanup_expired() -> std::size_t;

    /**
     * @brief Path of the file holding a task's record
     */
    [[nodiscard]] auto record_path(const std::string& id) const -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const resume_store_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Serialize a record to its on-disk JSON form
 */
[[nodiscard]] auto serialize_record(const resume_record& record) -> std::string;

/**
 * @brief Parse a record from its on-disk JSON form
 */
[[nodiscard]] auto deserialize_record(const std::string& json) -> result<resume_record>;

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_CORE_RESUME_STORE_H
