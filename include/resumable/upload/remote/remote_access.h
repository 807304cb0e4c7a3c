/**
 * @file remote_access.h
 * @brief Minimal capability interface over an established remote file session
 *
 * The upload engine never negotiates a transport. It consumes an already
 * connected session (SFTP or similar) through exactly three operations:
 * stat, mkdir_all and open_for_write. Back ends implement remote_access;
 * the engine only sees this header.
 */

#ifndef RESUMABLE_UPLOAD_REMOTE_REMOTE_ACCESS_H
#define RESUMABLE_UPLOAD_REMOTE_REMOTE_ACCESS_H

#include <resumable/upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace resumable::upload {

/**
 * @brief Result of a remote stat call
 */
struct remote_stat {
    bool exists = false;
    uint64_t size = 0;
};

/**
 * @brief Sequential writer positioned at the offset it was opened with
 */
class remote_writer {
public:
    virtual ~remote_writer() = default;

    /**
     * @brief Write bytes at the current position
     * @return Number of bytes the remote accepted, which may be less than
     *         data.size() without an error being reported
     */
    [[nodiscard]] virtual auto write(std::span<const std::byte> data)
        -> result<std::size_t> = 0;

    /**
     * @brief Flush and release the remote handle
     */
    [[nodiscard]] virtual auto close() -> result<void> = 0;
};

/**
 * @brief Remote file-access capability
 *
 * Paths are POSIX-style strings in the remote namespace.
 *
 * Error contract:
 * - stat() returns remote_not_found when the path does not exist
 * - mkdir_all() succeeds when the directory already exists
 * - open_for_write() truncates the remote file to offset and positions
 *   the writer there; bytes before offset are preserved
 * - permission and quota failures are reported as remote_access_denied and
 *   remote_no_space, dropped sessions as connection_lost
 */
class remote_access {
public:
    virtual ~remote_access() = default;

    [[nodiscard]] virtual auto stat(const std::string& path) -> result<remote_stat> = 0;

    [[nodiscard]] virtual auto mkdir_all(const std::string& path) -> result<void> = 0;

    [[nodiscard]] virtual auto open_for_write(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<remote_writer>> = 0;

    /**
     * @brief Whether several tasks may use this capability at the same time
     *
     * A single SFTP session multiplexed over one connection is not assumed to
     * be thread-safe, so the default is false and the coordinator serializes
     * remote calls across tasks.
     */
    [[nodiscard]] virtual auto supports_concurrent_channels() const -> bool {
        return false;
    }
};

/**
 * @brief Parent directory of a remote path ("" for a bare name, "/" for root)
 */
[[nodiscard]] auto remote_parent_path(const std::string& path) -> std::string;

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_REMOTE_REMOTE_ACCESS_H
