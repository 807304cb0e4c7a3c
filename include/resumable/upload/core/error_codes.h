/**
 * @file error_codes.h
 * @brief Error taxonomy for upload failures
 *
 * Every error_code raised inside an upload is mapped onto one error_kind.
 * The kind decides whether the engine retries, recovers silently, or
 * surfaces a failure event for the task.
 */

#ifndef RESUMABLE_UPLOAD_CORE_ERROR_CODES_H
#define RESUMABLE_UPLOAD_CORE_ERROR_CODES_H

#include <resumable/upload/core/types.h>

#include <string_view>

namespace resumable::upload {

/**
 * @brief Category of an upload failure
 *
 * - connectivity: transient, retried with bounded backoff
 * - remote_permission_or_space: permanent, fatal to the task
 * - local_file: permanent, the task never starts (or stops on read error)
 * - resume_state_mismatch: recovered by restarting from offset 0
 * - cancelled_by_caller: terminal, not an error
 */
enum class error_kind {
    none,
    connectivity,
    remote_permission_or_space,
    local_file,
    resume_state_mismatch,
    cancelled_by_caller,
    internal
};

/**
 * @brief Convert error_kind to string
 */
[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case error_kind::none: return "None";
        case error_kind::connectivity: return "ConnectivityError";
        case error_kind::remote_permission_or_space:
            return "RemotePermissionOrSpaceError";
        case error_kind::local_file: return "LocalFileError";
        case error_kind::resume_state_mismatch: return "ResumeStateMismatchError";
        case error_kind::cancelled_by_caller: return "CancelledByCaller";
        case error_kind::internal: return "InternalError";
        default: return "UnknownError";
    }
}

/**
 * @brief Map an error code onto its failure category
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> error_kind {
    switch (code) {
        case error_code::success:
            return error_kind::none;

        case error_code::connection_lost:
        case error_code::connection_timeout:
        case error_code::connection_failed:
        case error_code::remote_io_error:
        case error_code::remote_partial_write:
        case error_code::retries_exhausted:
            return error_kind::connectivity;

        case error_code::remote_access_denied:
        case error_code::remote_no_space:
            return error_kind::remote_permission_or_space;

        case error_code::local_file_not_found:
        case error_code::local_file_unreadable:
        case error_code::local_file_read_error:
        case error_code::local_file_changed:
            return error_kind::local_file;

        case error_code::resume_record_not_found:
        case error_code::resume_record_corrupted:
        case error_code::resume_state_mismatch:
            return error_kind::resume_state_mismatch;

        case error_code::upload_cancelled:
            return error_kind::cancelled_by_caller;

        default:
            return error_kind::internal;
    }
}

/**
 * @brief Check whether a failure of this kind may be retried
 */
[[nodiscard]] constexpr auto is_transient(error_kind kind) noexcept -> bool {
    return kind == error_kind::connectivity;
}

/**
 * @brief Check whether an error code may be retried
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    // retries_exhausted is the escalated form and is never retried again
    return code != error_code::retries_exhausted && is_transient(classify(code));
}

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_CORE_ERROR_CODES_H
