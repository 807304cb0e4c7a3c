/**
 * @file serialized_remote_access.cpp
 * @brief Implementation of serialized_remote_access
 */

#include <resumable/upload/remote/serialized_remote_access.h>

namespace resumable::upload {

namespace {

class serialized_writer : public remote_writer {
public:
    serialized_writer(std::unique_ptr<remote_writer> inner,
                      std::shared_ptr<std::mutex> io_mutex)
        : inner_(std::move(inner)), io_mutex_(std::move(io_mutex)) {}

    ~serialized_writer() override {
        std::lock_guard lock(*io_mutex_);
        inner_.reset();
    }

    auto write(std::span<const std::byte> data) -> result<std::size_t> override {
        std::lock_guard lock(*io_mutex_);
        return inner_->write(data);
    }

    auto close() -> result<void> override {
        std::lock_guard lock(*io_mutex_);
        return inner_->close();
    }

private:
    std::unique_ptr<remote_writer> inner_;
    std::shared_ptr<std::mutex> io_mutex_;
};

}  // namespace

serialized_remote_access::serialized_remote_access(std::shared_ptr<remote_access> inner)
    : inner_(std::move(inner))
    , io_mutex_(std::make_shared<std::mutex>()) {
}

auto serialized_remote_access::stat(const std::string& path) -> result<remote_stat> {
    std::lock_guard lock(*io_mutex_);
    return inner_->stat(path);
}

auto serialized_remote_access::mkdir_all(const std::string& path) -> result<void> {
    std::lock_guard lock(*io_mutex_);
    return inner_->mkdir_all(path);
}

auto serialized_remote_access::open_for_write(const std::string& path, uint64_t offset)
    -> result<std::unique_ptr<remote_writer>> {
    std::unique_ptr<remote_writer> writer;
    {
        std::lock_guard lock(*io_mutex_);
        auto opened = inner_->open_for_write(path, offset);
        if (!opened) {
            return unexpected(opened.error());
        }
        writer = std::move(opened.value());
    }
    return std::unique_ptr<remote_writer>(
        std::make_unique<serialized_writer>(std::move(writer), io_mutex_));
}

}  // namespace resumable::upload
