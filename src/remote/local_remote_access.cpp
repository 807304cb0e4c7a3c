/**
 * @file local_remote_access.cpp
 * @brief Implementation of local_remote_access
 */

#include <resumable/upload/remote/local_remote_access.h>
#include <resumable/upload/core/logging.h>

#include <cerrno>
#include <fstream>
#include <system_error>

namespace resumable::upload {

namespace {

auto map_errno(int err, const std::string& what) -> error {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return error{error_code::remote_access_denied, what + ": permission denied"};
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return error{error_code::remote_no_space, what + ": no space left"};
        case ENOENT:
        case ENOTDIR:
            return error{error_code::remote_not_found, what + ": not found"};
        default:
            return error{error_code::remote_io_error,
                         what + ": " + std::generic_category().message(err)};
    }
}

auto map_error_code(const std::error_code& ec, const std::string& what) -> error {
    return map_errno(ec.value(), what);
}

class local_file_writer : public remote_writer {
public:
    local_file_writer(std::fstream stream, std::string path)
        : stream_(std::move(stream)), path_(std::move(path)) {}

    auto write(std::span<const std::byte> data) -> result<std::size_t> override {
        if (!stream_.is_open()) {
            return unexpected(error{error_code::remote_io_error, "writer is closed"});
        }
        errno = 0;
        stream_.write(reinterpret_cast<const char*>(data.data()),
                      static_cast<std::streamsize>(data.size()));
        stream_.flush();
        if (!stream_) {
            int err = errno != 0 ? errno : EIO;
            return unexpected(map_errno(err, "write " + path_));
        }
        return data.size();
    }

    auto close() -> result<void> override {
        if (!stream_.is_open()) {
            return {};
        }
        stream_.close();
        if (stream_.fail()) {
            return unexpected(error{error_code::remote_io_error, "close " + path_});
        }
        return {};
    }

private:
    std::fstream stream_;
    std::string path_;
};

}  // namespace

local_remote_access::local_remote_access(std::filesystem::path root)
    : root_(std::move(root)) {
}

auto local_remote_access::resolve(const std::string& path) const
    -> result<std::filesystem::path> {
    std::filesystem::path relative = std::filesystem::path(path).relative_path();
    auto normal = relative.lexically_normal();
    if (!normal.empty() && *normal.begin() == "..") {
        return unexpected(error{error_code::remote_access_denied,
                                "path escapes remote root: " + path});
    }
    return root_ / normal;
}

auto local_remote_access::stat(const std::string& path) -> result<remote_stat> {
    auto local = resolve(path);
    if (!local) {
        return unexpected(local.error());
    }

    std::error_code ec;
    auto status = std::filesystem::status(local.value(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return unexpected(map_error_code(ec, "stat " + path));
    }
    if (!std::filesystem::exists(status)) {
        return unexpected(error{error_code::remote_not_found, "no such file: " + path});
    }

    remote_stat st;
    st.exists = true;
    if (std::filesystem::is_regular_file(status)) {
        st.size = std::filesystem::file_size(local.value(), ec);
        if (ec) {
            return unexpected(map_error_code(ec, "stat " + path));
        }
    }
    return st;
}

auto local_remote_access::mkdir_all(const std::string& path) -> result<void> {
    auto local = resolve(path);
    if (!local) {
        return unexpected(local.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(local.value(), ec);
    if (ec) {
        return unexpected(map_error_code(ec, "mkdir " + path));
    }
    if (!std::filesystem::is_directory(local.value(), ec)) {
        return unexpected(error{error_code::remote_io_error,
                                "not a directory: " + path});
    }
    return {};
}

auto local_remote_access::open_for_write(const std::string& path, uint64_t offset)
    -> result<std::unique_ptr<remote_writer>> {
    auto local = resolve(path);
    if (!local) {
        return unexpected(local.error());
    }
    const auto& file_path = local.value();

    std::error_code ec;
    bool exists = std::filesystem::exists(file_path, ec);
    if (!exists) {
        if (offset > 0) {
            return unexpected(error{error_code::remote_not_found,
                                    "cannot resume missing remote file: " + path});
        }
        errno = 0;
        std::ofstream create(file_path, std::ios::binary | std::ios::trunc);
        if (!create) {
            int err = errno != 0 ? errno : EIO;
            return unexpected(map_errno(err, "create " + path));
        }
    } else {
        auto current = std::filesystem::file_size(file_path, ec);
        if (ec) {
            return unexpected(map_error_code(ec, "stat " + path));
        }
        if (current < offset) {
            return unexpected(error{error_code::remote_io_error,
                                    "remote file shorter than resume offset: " + path});
        }
        if (current != offset) {
            std::filesystem::resize_file(file_path, offset, ec);
            if (ec) {
                return unexpected(map_error_code(ec, "truncate " + path));
            }
        }
    }

    errno = 0;
    std::fstream stream(file_path, std::ios::binary | std::ios::in | std::ios::out);
    if (!stream) {
        int err = errno != 0 ? errno : EIO;
        return unexpected(map_errno(err, "open " + path));
    }
    stream.seekp(static_cast<std::streamoff>(offset));
    if (!stream) {
        return unexpected(error{error_code::remote_io_error, "seek failed: " + path});
    }

    RU_LOG_TRACE(log_category::remote,
        "Opened " + file_path.string() + " at offset " + std::to_string(offset));
    return std::unique_ptr<remote_writer>(
        std::make_unique<local_file_writer>(std::move(stream), path));
}

}  // namespace resumable::upload
