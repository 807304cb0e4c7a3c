/**
 * @file types.h
 * @brief Core type definitions for resumable_upload
 */

#ifndef RESUMABLE_UPLOAD_CORE_TYPES_H
#define RESUMABLE_UPLOAD_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace resumable::upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Local file errors (-100 to -119)
    local_file_not_found = -100,
    local_file_unreadable = -101,
    local_file_read_error = -102,
    local_file_changed = -103,

    // Remote errors (-120 to -139)
    remote_not_found = -120,
    remote_access_denied = -121,
    remote_no_space = -122,
    remote_io_error = -123,
    remote_partial_write = -124,
    remote_not_configured = -125,

    // Connectivity errors (-140 to -159)
    connection_lost = -140,
    connection_timeout = -141,
    connection_failed = -142,

    // Resume store errors (-160 to -179)
    resume_record_not_found = -160,
    resume_record_corrupted = -161,
    resume_record_write_error = -162,
    resume_state_mismatch = -163,

    // Task errors (-180 to -199)
    upload_cancelled = -180,
    upload_already_active = -181,
    upload_not_found = -182,
    invalid_task = -183,
    retries_exhausted = -184,

    // Configuration and internal errors (-200 to -219)
    invalid_configuration = -200,
    not_initialized = -201,
    internal_error = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::local_file_not_found:
            return "local file not found";
        case error_code::local_file_unreadable:
            return "local file unreadable";
        case error_code::local_file_read_error:
            return "local file read error";
        case error_code::local_file_changed:
            return "local file changed during upload";
        case error_code::remote_not_found:
            return "remote path not found";
        case error_code::remote_access_denied:
            return "remote permission denied";
        case error_code::remote_no_space:
            return "no space left on remote";
        case error_code::remote_io_error:
            return "remote I/O error";
        case error_code::remote_partial_write:
            return "remote accepted fewer bytes than sent";
        case error_code::remote_not_configured:
            return "remote access capability not set";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::resume_record_not_found:
            return "resume record not found";
        case error_code::resume_record_corrupted:
            return "resume record corrupted";
        case error_code::resume_record_write_error:
            return "resume record write error";
        case error_code::resume_state_mismatch:
            return "resume state mismatch";
        case error_code::upload_cancelled:
            return "upload cancelled";
        case error_code::upload_already_active:
            return "upload already active";
        case error_code::upload_not_found:
            return "upload not found";
        case error_code::invalid_task:
            return "invalid upload task";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/// Chunk size used for every upload task unless configured otherwise (4 MiB)
inline constexpr std::size_t default_chunk_size = 4 * 1024 * 1024;

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_CORE_TYPES_H
