/**
 * @file uploader_config.h
 * @brief Configuration for upload_coordinator
 */

#ifndef RESUMABLE_UPLOAD_UPLOADER_UPLOADER_CONFIG_H
#define RESUMABLE_UPLOAD_UPLOADER_UPLOADER_CONFIG_H

#include <resumable/upload/core/fingerprint.h>
#include <resumable/upload/core/types.h>
#include <resumable/upload/engine/retry_policy.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace resumable::upload {

/**
 * @brief How remote I/O is scheduled across concurrent tasks
 */
enum class remote_io_mode {
    automatic,   ///< Serialize unless the capability reports concurrent channels
    serialized,  ///< Always one remote call at a time
    parallel     ///< Never serialize; the capability must be thread-safe
};

[[nodiscard]] constexpr auto to_string(remote_io_mode mode) noexcept -> const char* {
    switch (mode) {
        case remote_io_mode::automatic: return "automatic";
        case remote_io_mode::serialized: return "serialized";
        case remote_io_mode::parallel: return "parallel";
        default: return "unknown";
    }
}

/// Smallest accepted chunk size (4 KiB)
inline constexpr std::size_t min_chunk_size = 4 * 1024;

/// Largest accepted chunk size (64 MiB)
inline constexpr std::size_t max_chunk_size = 64 * 1024 * 1024;

/**
 * @brief Coordinator configuration
 */
struct uploader_config {
    std::filesystem::path metadata_directory;       ///< Resume record directory (required)
    std::size_t chunk_size = default_chunk_size;
    std::size_t max_concurrent = 4;                 ///< Simultaneously active uploads
    retry_policy retry;
    fingerprint_mode fingerprint = fingerprint_mode::size_and_mtime;
    remote_io_mode remote_io = remote_io_mode::automatic;
    std::chrono::seconds record_ttl{7 * 86400};     ///< Age at which stale records are purged
    bool auto_cleanup = true;                       ///< Purge expired records at startup
    std::size_t finished_history = 256;             ///< Finished task snapshots kept for get_task

    /**
     * @brief Check the configuration for values the coordinator cannot run with
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (metadata_directory.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "metadata_directory must be set"});
        }
        if (chunk_size < min_chunk_size || chunk_size > max_chunk_size) {
            return unexpected(error{error_code::invalid_configuration,
                                    "chunk_size must be between 4 KiB and 64 MiB"});
        }
        if (max_concurrent == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max_concurrent must be at least 1"});
        }
        if (retry.max_attempts == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retry.max_attempts must be at least 1"});
        }
        if (retry.backoff_multiplier < 1.0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retry.backoff_multiplier must be >= 1.0"});
        }
        if (retry.max_delay < retry.initial_delay) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retry.max_delay must be >= retry.initial_delay"});
        }
        return {};
    }
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_UPLOADER_UPLOADER_CONFIG_H
