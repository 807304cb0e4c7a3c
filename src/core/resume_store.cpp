/**
 * @file resume_store.cpp
 * @brief Implementation of resume_store for upload record persistence
 */

#include <resumable/upload/core/resume_store.h>
#include <resumable/upload/core/logging.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace resumable::upload {

// ============================================================================
// resume_record implementation
// ============================================================================

auto resume_record::from_task(const upload_task& task, std::string fingerprint)
    -> resume_record {
    resume_record record;
    record.id = task.id;
    record.remote_path = task.remote_path;
    record.local_path = task.local_path.string();
    record.file_size = task.total_size;
    record.file_fingerprint = std::move(fingerprint);
    record.chunk_size = task.chunk_size;
    record.bytes_transferred = task.bytes_transferred;
    record.last_status = task.status;
    record.updated_at = std::chrono::system_clock::now();
    return record;
}

// ============================================================================
// JSON serialization helpers
// ============================================================================

namespace {

constexpr const char* record_extension = ".json";
constexpr const char* temp_suffix = ".tmp";

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4)
                      << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto is_hex_quad(const std::string& s, std::size_t pos) -> bool {
    if (pos + 4 > s.size()) {
        return false;
    }
    for (std::size_t k = pos; k < pos + 4; ++k) {
        if (!std::isxdigit(static_cast<unsigned char>(s[k]))) {
            return false;
        }
    }
    return true;
}

// Returns nullopt on a malformed escape sequence
auto unescape_json_string(const std::string& s) -> std::optional<std::string> {
    std::string out;
    out.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') {
            out += s[i];
            continue;
        }
        if (i + 1 >= s.size()) {
            return std::nullopt;
        }
        switch (s[i + 1]) {
            case '"': out += '"'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '/': out += '/'; ++i; break;
            case 'b': out += '\b'; ++i; break;
            case 'f': out += '\f'; ++i; break;
            case 'n': out += '\n'; ++i; break;
            case 'r': out += '\r'; ++i; break;
            case 't': out += '\t'; ++i; break;
            case 'u': {
                if (!is_hex_quad(s, i + 2)) {
                    return std::nullopt;
                }
                auto code = std::strtoul(s.substr(i + 2, 4).c_str(), nullptr, 16);
                // Records only escape control characters; wider code points
                // cannot come from serialize_record
                if (code > 0xFF) {
                    return std::nullopt;
                }
                out += static_cast<char>(code);
                i += 5;
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

auto to_epoch_ms(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto from_epoch_ms(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

// Locates the raw value of "key": in a flat JSON object. String values are
// returned still escaped, together with a flag telling that they were quoted.
auto extract_json_value(const std::string& json, const std::string& key, bool& quoted)
    -> std::optional<std::string> {
    const std::string needle = "\"" + key + "\"";
    std::size_t key_pos = 0;
    while (true) {
        key_pos = json.find(needle, key_pos);
        if (key_pos == std::string::npos) {
            return std::nullopt;
        }
        // Skip occurrences inside string values, which are always escaped
        if (key_pos == 0 || json[key_pos - 1] != '\\') {
            auto after = json.find_first_not_of(" \t\r\n", key_pos + needle.size());
            if (after != std::string::npos && json[after] == ':') {
                key_pos = after;
                break;
            }
        }
        key_pos += needle.size();
    }

    auto value_start = json.find_first_not_of(" \t\r\n", key_pos + 1);
    if (value_start == std::string::npos) {
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        quoted = true;
        auto pos = value_start + 1;
        while (pos < json.size()) {
            if (json[pos] == '\\') {
                pos += 2;
                continue;
            }
            if (json[pos] == '"') {
                return json.substr(value_start + 1, pos - value_start - 1);
            }
            ++pos;
        }
        return std::nullopt;
    }

    quoted = false;
    auto value_end = json.find_first_of(",}\n", value_start);
    if (value_end == std::string::npos) {
        value_end = json.size();
    }
    auto value = json.substr(value_start, value_end - value_start);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

auto extract_string(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    bool quoted = false;
    auto raw = extract_json_value(json, key, quoted);
    if (!raw || !quoted) {
        return std::nullopt;
    }
    return unescape_json_string(*raw);
}

auto extract_number(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    bool quoted = false;
    auto raw = extract_json_value(json, key, quoted);
    if (!raw || quoted || raw->empty()) {
        return std::nullopt;
    }
    return raw;
}

// Task ids are caller-supplied; anything outside [A-Za-z0-9._-] is
// percent-encoded so every id maps onto exactly one portable file name.
auto encode_file_stem(const std::string& id) -> std::string {
    std::ostringstream oss;
    for (unsigned char c : id) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2)
                << std::setfill('0') << static_cast<int>(c) << std::dec;
        }
    }
    auto stem = oss.str();
    // "." and ".." are not usable as file names
    if (stem == "." || stem == "..") {
        std::string escaped;
        for (std::size_t i = 0; i < stem.size(); ++i) escaped += "%2E";
        return escaped;
    }
    return stem;
}

}  // namespace

auto serialize_record(const resume_record& record) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"id\": \"" << escape_json_string(record.id) << "\",\n";
    oss << "  \"remotePath\": \"" << escape_json_string(record.remote_path) << "\",\n";
    oss << "  \"localPath\": \"" << escape_json_string(record.local_path) << "\",\n";
    oss << "  \"fileSize\": " << record.file_size << ",\n";
    oss << "  \"fileFingerprint\": \"" << escape_json_string(record.file_fingerprint) << "\",\n";
    oss << "  \"chunkSize\": " << record.chunk_size << ",\n";
    oss << "  \"bytesTransferred\": " << record.bytes_transferred << ",\n";
    oss << "  \"lastStatus\": \"" << to_string(record.last_status) << "\",\n";
    oss << "  \"updatedAt\": " << to_epoch_ms(record.updated_at) << "\n";
    oss << "}\n";
    return oss.str();
}

auto deserialize_record(const std::string& json) -> result<resume_record> {
    resume_record record;

    auto id = extract_string(json, "id");
    if (!id || id->empty()) {
        return unexpected(error(error_code::resume_record_corrupted, "missing or malformed id field"));
    }
    record.id = std::move(*id);

    auto remote_path = extract_string(json, "remotePath");
    auto local_path = extract_string(json, "localPath");
    auto fingerprint = extract_string(json, "fileFingerprint");
    if (!remote_path || !local_path || !fingerprint) {
        return unexpected(error(error_code::resume_record_corrupted,
                                "missing or malformed path or fingerprint field"));
    }
    record.remote_path = std::move(*remote_path);
    record.local_path = std::move(*local_path);
    record.file_fingerprint = std::move(*fingerprint);

    auto file_size = extract_number(json, "fileSize");
    auto chunk_size = extract_number(json, "chunkSize");
    auto bytes_transferred = extract_number(json, "bytesTransferred");
    auto updated_at = extract_number(json, "updatedAt");
    if (!file_size || !chunk_size || !bytes_transferred || !updated_at) {
        return unexpected(error(error_code::resume_record_corrupted,
                                "missing numeric field"));
    }

    try {
        record.file_size = std::stoull(*file_size);
        record.chunk_size = static_cast<std::size_t>(std::stoull(*chunk_size));
        record.bytes_transferred = std::stoull(*bytes_transferred);
        record.updated_at = from_epoch_ms(std::stoll(*updated_at));
    } catch (const std::exception&) {
        return unexpected(error(error_code::resume_record_corrupted,
                                "invalid numeric field"));
    }

    if (record.bytes_transferred > record.file_size) {
        return unexpected(error(error_code::resume_record_corrupted,
                                "bytesTransferred exceeds fileSize"));
    }

    if (auto status_text = extract_string(json, "lastStatus")) {
        if (auto status = upload_status_from_string(*status_text)) {
            record.last_status = *status;
        }
    }

    return record;
}

// ============================================================================
// resume_store::impl
// ============================================================================

class resume_store::impl {
public:
    explicit impl(resume_store_config cfg)
        : config_(std::move(cfg)) {
        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            RU_LOG_WARN(log_category::resume,
                "Cannot create resume directory " + config_.directory.string() +
                ": " + ec.message());
        }
    }

    auto record_path(const std::string& id) const -> std::filesystem::path {
        return config_.directory / (encode_file_stem(id) + record_extension);
    }

    auto load(const std::string& id) const -> result<resume_record> {
        auto path = record_path(id);

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            RU_LOG_TRACE(log_category::resume, "No resume record for " + id);
            return unexpected(error(error_code::resume_record_not_found,
                                    "resume record not found: " + id));
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            RU_LOG_ERROR(log_category::resume,
                "Failed to open resume record: " + path.string());
            return unexpected(error(error_code::resume_record_corrupted,
                                    "failed to open resume record"));
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        auto parsed = deserialize_record(oss.str());
        if (!parsed) {
            RU_LOG_WARN(log_category::resume,
                "Unreadable resume record " + path.string() + ": " +
                parsed.error().message);
            return parsed;
        }

        if (parsed.value().id != id) {
            return unexpected(error(error_code::resume_record_corrupted,
                                    "record id does not match file name"));
        }

        RU_LOG_DEBUG(log_category::resume,
            "Loaded resume record " + id + " (" +
            std::to_string(parsed.value().bytes_transferred) + "/" +
            std::to_string(parsed.value().file_size) + " bytes)");
        return parsed;
    }

    auto save(const resume_record& record) -> result<void> {
        if (record.id.empty()) {
            return unexpected(error(error_code::invalid_task, "record id is empty"));
        }

        auto path = record_path(record.id);
        auto temp_path = path;
        temp_path += temp_suffix;

        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                RU_LOG_ERROR(log_category::resume,
                    "Failed to open temp record for writing: " + temp_path.string());
                return unexpected(error(error_code::resume_record_write_error,
                                        "failed to open temp record for writing"));
            }

            file << serialize_record(record);
            file.flush();
            if (!file) {
                file.close();
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                RU_LOG_ERROR(log_category::resume,
                    "Failed to write temp record: " + temp_path.string());
                return unexpected(error(error_code::resume_record_write_error,
                                        "failed to write temp record"));
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_path, cleanup_ec);
            RU_LOG_ERROR(log_category::resume,
                "Failed to commit resume record " + path.string() + ": " + ec.message());
            return unexpected(error(error_code::resume_record_write_error,
                                    "failed to rename temp record: " + ec.message()));
        }

        RU_LOG_TRACE(log_category::resume,
            "Saved resume record " + record.id + " at " +
            std::to_string(record.bytes_transferred) + " bytes");
        return {};
    }

    auto remove(const std::string& id) -> result<void> {
        auto path = record_path(id);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            RU_LOG_ERROR(log_category::resume,
                "Failed to delete resume record " + path.string() + ": " + ec.message());
            return unexpected(error(error_code::resume_record_write_error,
                                    "failed to delete resume record: " + ec.message()));
        }

        RU_LOG_DEBUG(log_category::resume, "Deleted resume record " + id);
        return {};
    }

    auto contains(const std::string& id) const -> bool {
        std::error_code ec;
        return std::filesystem::exists(record_path(id), ec);
    }

    auto list() const -> std::vector<resume_record> {
        std::vector<resume_record> records;

        std::error_code ec;
        if (!std::filesystem::exists(config_.directory, ec)) {
            return records;
        }

        for (const auto& entry :
             std::filesystem::directory_iterator(config_.directory, ec)) {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec) ||
                entry.path().extension() != record_extension) {
                continue;
            }

            std::ifstream file(entry.path(), std::ios::binary);
            if (!file) {
                continue;
            }
            std::ostringstream oss;
            oss << file.rdbuf();

            auto parsed = deserialize_record(oss.str());
            if (parsed) {
                records.push_back(std::move(parsed.value()));
            } else {
                RU_LOG_DEBUG(log_category::resume,
                    "Skipping unreadable record " + entry.path().string());
            }
        }

        return records;
    }

    auto cleanup_expired() -> std::size_t {
        auto now = std::chrono::system_clock::now();
        std::size_t removed = 0;

        for (const auto& record : list()) {
            if (now - record.updated_at <= config_.record_ttl) {
                continue;
            }
            if (remove(record.id)) {
                ++removed;
            }
        }

        if (removed > 0) {
            RU_LOG_INFO(log_category::resume,
                "Removed " + std::to_string(removed) + " expired resume records");
        }
        return removed;
    }

    auto config() const -> const resume_store_config& {
        return config_;
    }

private:
    resume_store_config config_;
};

// ============================================================================
// resume_store public interface
// ============================================================================

resume_store::resume_store(resume_store_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
}

resume_store::~resume_store() = default;

resume_store::resume_store(resume_store&&) noexcept = default;

auto resume_store::operator=(resume_store&&) noexcept -> resume_store& = default;

auto resume_store::load(const std::string& id) const -> result<resume_record> {
    return impl_->load(id);
}

auto resume_store::save(const resume_record& record) -> result<void> {
    return impl_->save(record);
}

auto resume_store::remove(const std::string& id) -> result<void> {
    return impl_->remove(id);
}

auto resume_store::contains(const std::string& id) const -> bool {
    return impl_->contains(id);
}

auto resume_store::list() const -> std::vector<resume_record> {
    return impl_->list();
}

auto resume_store::cleanup_expired() -> std::size_t {
    return impl_->cleanup_expired();
}

auto resume_store::record_path(const std::string& id) const -> std::filesystem::path {
    return impl_->record_path(id);
}

auto resume_store::config() const -> const resume_store_config& {
    return impl_->config();
}

}  // namespace resumable::upload
