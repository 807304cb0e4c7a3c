/**
 * @file fingerprint.h
 * @brief Local file identity signatures used to validate resume safety
 */

#ifndef RESUMABLE_UPLOAD_CORE_FINGERPRINT_H
#define RESUMABLE_UPLOAD_CORE_FINGERPRINT_H

#include <resumable/upload/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace resumable::upload {

/**
 * @brief How a local file's identity is computed
 */
enum class fingerprint_mode {
    size_and_mtime,  ///< File size plus modification time (nanoseconds)
    content_hash     ///< File size plus SHA-256 of the content
};

/**
 * @brief Convert fingerprint_mode to string
 */
[[nodiscard]] constexpr auto to_string(fingerprint_mode mode) noexcept
    -> const char* {
    switch (mode) {
        case fingerprint_mode::size_and_mtime: return "size_and_mtime";
        case fingerprint_mode::content_hash: return "content_hash";
        default: return "unknown";
    }
}

/**
 * @brief Identity signature of a local file
 *
 * Two fingerprints are equal only if they were computed in the same mode
 * and every component matches. The canonical string form is what resume
 * records persist:
 *  - "size=<n>;mtime=<ns>"
 *  - "size=<n>;sha256=<hex>"
 */
struct file_fingerprint {
    fingerprint_mode mode = fingerprint_mode::size_and_mtime;
    uint64_t size = 0;
    int64_t mtime_ns = 0;
    std::string sha256;

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const file_fingerprint& other) const -> bool {
        return to_string() == other.to_string();
    }
};

/**
 * @brief Compute the fingerprint of a local file
 * @param path Local file path
 * @param mode Fingerprint mode
 * @return Fingerprint, or local_file_not_found / local_file_unreadable
 */
[[nodiscard]] auto compute_fingerprint(const std::filesystem::path& path,
                                       fingerprint_mode mode)
    -> result<file_fingerprint>;

/**
 * @brief SHA-256 of a file's content as lowercase hex
 */
[[nodiscard]] auto sha256_file(const std::filesystem::path& path)
    -> result<std::string>;

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_CORE_FINGERPRINT_H
