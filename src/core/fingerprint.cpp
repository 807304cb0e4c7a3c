/**
 * @file fingerprint.cpp
 * @brief Implementation of local file fingerprinting
 */

#include <resumable/upload/core/fingerprint.h>

#include <openssl/evp.h>

#include <array>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace resumable::upload {

namespace {

constexpr std::size_t hash_buffer_size = 1024 * 1024;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

auto to_hex(const unsigned char* data, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

}  // namespace

auto file_fingerprint::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "size=" << size;
    if (mode == fingerprint_mode::content_hash) {
        oss << ";sha256=" << sha256;
    } else {
        oss << ";mtime=" << mtime_ns;
    }
    return oss.str();
}

auto sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::local_file_unreadable,
                                "cannot open file: " + path.string()});
    }

    std::unique_ptr<EVP_MD_CTX, md_ctx_deleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return unexpected(error{error_code::internal_error,
                                "failed to initialize SHA-256 context"});
    }

    std::vector<char> buffer(hash_buffer_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(),
                             static_cast<std::size_t>(bytes_read)) != 1) {
            return unexpected(error{error_code::internal_error,
                                    "SHA-256 update failed"});
        }
    }
    if (file.bad()) {
        return unexpected(error{error_code::local_file_read_error,
                                "read failed while hashing: " + path.string()});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_length) != 1) {
        return unexpected(error{error_code::internal_error,
                                "SHA-256 finalization failed"});
    }

    return to_hex(digest.data(), digest_length);
}

auto compute_fingerprint(const std::filesystem::path& path, fingerprint_mode mode)
    -> result<file_fingerprint> {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return unexpected(error{error_code::local_file_not_found,
                                "local file not found: " + path.string()});
    }
    if (!std::filesystem::is_regular_file(status)) {
        return unexpected(error{error_code::local_file_unreadable,
                                "not a regular file: " + path.string()});
    }

    file_fingerprint fp;
    fp.mode = mode;

    fp.size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::local_file_unreadable,
                                "cannot read size of " + path.string() + ": " + ec.message()});
    }

    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return unexpected(error{error_code::local_file_unreadable,
                                "cannot read mtime of " + path.string() + ": " + ec.message()});
    }
    fp.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        mtime.time_since_epoch()).count();

    if (mode == fingerprint_mode::content_hash) {
        auto hash = sha256_file(path);
        if (!hash) {
            return unexpected(hash.error());
        }
        fp.sha256 = std::move(hash.value());
    }

    return fp;
}

}  // namespace resumable::upload
