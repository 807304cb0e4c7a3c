// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include <resumable/upload/config/feature_flags.h>

#if RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace resumable::upload {

/**
 * @brief Log categories for the upload engine
 */
struct log_category {
    static constexpr std::string_view engine = "upload.engine";
    static constexpr std::string_view coordinator = "upload.coordinator";
    static constexpr std::string_view resume = "upload.resume";
    static constexpr std::string_view events = "upload.events";
    static constexpr std::string_view remote = "upload.remote";
    static constexpr std::string_view pool = "upload.pool";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Masking of local and remote paths in log output
 *
 * Upload logs carry both the operator's local paths and the remote layout;
 * deployments that ship logs elsewhere can hide directory names and
 * shorten file names.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_filenames = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Applies masking_config to free text and to single paths
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths) {
            return input;
        }

        static const std::regex path_pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, it->position() - last_pos);
            out += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        out += input.substr(last_pos);
        return out;
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos) {
            return mask_filename(path);
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        std::string filename = path.substr(last_sep + 1);
        if (config_.mask_filenames) {
            filename = mask_filename(filename);
        }
        return masked_dir + "/" + filename;
    }

    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (!config_.mask_filenames || filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        std::string name = filename;
        std::string ext;
        if (dot_pos != std::string::npos && dot_pos > 0) {
            name = filename.substr(0, dot_pos);
            ext = filename.substr(dot_pos);
        }

        if (name.size() <= config_.visible_chars) {
            return filename;
        }

        return name.substr(0, config_.visible_chars) +
               std::string(name.size() - config_.visible_chars, config_.mask_char[0]) +
               ext;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

/**
 * @brief Structured context attached to upload log lines
 */
struct upload_log_context {
    std::string task_id;
    std::string filename;
    std::optional<std::string> remote_path;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> offset;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<int> progress_percent;
    std::optional<uint32_t> attempt;
    std::optional<std::string> error_kind;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_string = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_number = [&](const char* name, auto value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!task_id.empty()) add_string("task_id", task_id);
        if (!filename.empty()) {
            add_string("filename", masker ? masker->mask_filename(filename) : filename);
        }
        if (remote_path) {
            add_string("remote_path", masker ? masker->mask_path(*remote_path) : *remote_path);
        }
        if (file_size) add_number("size", *file_size);
        if (bytes_transferred) add_number("bytes_transferred", *bytes_transferred);
        if (offset) add_number("offset", *offset);
        if (chunk_index) add_number("chunk_index", *chunk_index);
        if (total_chunks) add_number("total_chunks", *total_chunks);
        if (progress_percent) add_number("progress_percent", *progress_percent);
        if (attempt) add_number("attempt", *attempt);
        if (error_kind) add_string("error_kind", *error_kind);
        if (error_message) {
            add_string("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief A single log line with its metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\""
            << detail::escape_json(masker ? masker->mask(message) : message) << "\"";

        if (context) {
            auto ctx_json = context->to_json(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the upload engine
 *
 * Writes to stderr unless built against logger_system, in which case
 * messages are forwarded to an asynchronous console writer. A callback
 * receives every emitted line regardless of the backend.
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view,
                                            std::string_view, const upload_log_context*)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times. Called by the coordinator on construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string line_text;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            line_text = entry.to_json(&masker);
        } else {
            std::ostringstream oss;
            oss << local_timestamp() << " [" << log_level_to_string(level) << "] ["
                << category << "] " << masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json(&masker);
            }
            line_text = oss.str();
        }

        emit(level, line_text);
    }

    void flush() {
#if RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit([[maybe_unused]] log_level level, const std::string& text) {
#if RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), text);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << text << "\n";
    }

#if RESUMABLE_UPLOAD_WITH_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    static auto local_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define RU_LOG(level, category, message) \
    resumable::upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__)

#define RU_LOG_CTX(level, category, message, context) \
    resumable::upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__)

#define RU_LOG_TRACE(category, message) \
    RU_LOG(resumable::upload::log_level::trace, category, message)

#define RU_LOG_DEBUG(category, message) \
    RU_LOG(resumable::upload::log_level::debug, category, message)

#define RU_LOG_INFO(category, message) \
    RU_LOG(resumable::upload::log_level::info, category, message)

#define RU_LOG_WARN(category, message) \
    RU_LOG(resumable::upload::log_level::warn, category, message)

#define RU_LOG_ERROR(category, message) \
    RU_LOG(resumable::upload::log_level::error, category, message)

#define RU_LOG_DEBUG_CTX(category, message, ctx) \
    RU_LOG_CTX(resumable::upload::log_level::debug, category, message, ctx)

#define RU_LOG_INFO_CTX(category, message, ctx) \
    RU_LOG_CTX(resumable::upload::log_level::info, category, message, ctx)

#define RU_LOG_WARN_CTX(category, message, ctx) \
    RU_LOG_CTX(resumable::upload::log_level::warn, category, message, ctx)

#define RU_LOG_ERROR_CTX(category, message, ctx) \
    RU_LOG_CTX(resumable::upload::log_level::error, category, message, ctx)

}  // namespace resumable::upload
