/**
 * @file local_remote_access.h
 * @brief remote_access back end rooted in a local directory
 *
 * Useful for staging uploads to a mounted share and for examples and
 * benchmarks that need a real file system on the remote side.
 */

#ifndef RESUMABLE_UPLOAD_REMOTE_LOCAL_REMOTE_ACCESS_H
#define RESUMABLE_UPLOAD_REMOTE_LOCAL_REMOTE_ACCESS_H

#include <resumable/upload/remote/remote_access.h>

#include <filesystem>

namespace resumable::upload {

/**
 * @brief Maps remote paths onto files below a root directory
 *
 * "/incoming/a.bin" is stored at <root>/incoming/a.bin. Paths that would
 * escape the root through ".." are rejected with remote_access_denied.
 * Each call opens its own file handle, so concurrent use is supported.
 */
class local_remote_access : public remote_access {
public:
    explicit local_remote_access(std::filesystem::path root);

    [[nodiscard]] auto stat(const std::string& path) -> result<remote_stat> override;

    [[nodiscard]] auto mkdir_all(const std::string& path) -> result<void> override;

    [[nodiscard]] auto open_for_write(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<remote_writer>> override;

    [[nodiscard]] auto supports_concurrent_channels() const -> bool override {
        return true;
    }

    /**
     * @brief Local location backing a remote path
     */
    [[nodiscard]] auto resolve(const std::string& path) const
        -> result<std::filesystem::path>;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_REMOTE_LOCAL_REMOTE_ACCESS_H
