// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(FILE_DROP_WITH_LOGGER_SYSTEM) && defined(FILE_DROP_WITH_COMMON_SYSTEM)
#define FILE_DROP_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::file_drop {

/**
 * @brief Log categories for file drop system
 */
struct log_category {
    static constexpr std::string_view sender = "file_drop.sender";
    static constexpr std::string_view coordinator = "file_drop.coordinator";
    static constexpr std::string_view channel = "file_drop.channel";
    static constexpr std::string_view config = "file_drop.config";
};

/**
 * @brief Log levels for file drop system
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

/**
 * @brief Parse a log level name (case-insensitive)
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return log_level::trace;
    if (lowered == "debug") return log_level::debug;
    if (lowered == "info") return log_level::info;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "error") return log_level::error;
    if (lowered == "fatal") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Escape a string for embedding in a JSON string literal
 */
inline std::string escape_json_string(std::string_view input) {
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
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

/**
 * @brief Configuration for masking file names in log output
 *
 * File names picked by the user can be sensitive; when enabled only the
 * first @c visible_chars of the stem and the extension are kept.
 */
struct masking_config {
    bool mask_filenames = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config masked() { return {true, '*', 4}; }
    static masking_config none() { return {false, '*', 4}; }
};

/**
 * @brief Masks file names according to a masking_config
 */
class filename_masker {
public:
    explicit filename_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& filename) const -> std::string {
        if (!config_.mask_filenames || filename.size() <= config_.visible_chars) {
            return filename;
        }

        std::string stem = filename;
        std::string ext;
        auto dot_pos = filename.find_last_of('.');
        if (dot_pos != std::string::npos && dot_pos > 0) {
            stem = filename.substr(0, dot_pos);
            ext = filename.substr(dot_pos);
        }

        if (stem.size() <= config_.visible_chars) {
            return filename;
        }

        return stem.substr(0, config_.visible_chars) +
               std::string(stem.size() - config_.visible_chars, config_.mask_char) + ext;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for a file drop
 */
struct transfer_log_context {
    std::string label;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> offset;
    std::optional<uint64_t> chunk_size;
    std::optional<std::string> drop_id;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json(const filename_masker* masker = nullptr) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!label.empty()) add_field("label", label);
        if (!filename.empty()) add_field("filename", masker ? masker->mask(filename) : filename);
        if (file_size) add_uint("size", *file_size);
        if (offset) add_uint("offset", *offset);
        if (chunk_size) add_uint("chunk_size", *chunk_size);
        if (drop_id) add_field("drop_id", *drop_id);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< One JSON object per line
};

/**
 * @brief File drop logging interface
 *
 * Process-wide logger reached through get_logger(). Messages below the
 * minimum level are dropped before any formatting happens.
 */
class file_drop_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const transfer_log_context*)>;

    file_drop_logger() = default;
    ~file_drop_logger() = default;

    file_drop_logger(const file_drop_logger&) = delete;
    file_drop_logger& operator=(const file_drop_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef FILE_DROP_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#ifdef FILE_DROP_USE_LOGGER_SYSTEM
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
#ifdef FILE_DROP_USE_LOGGER_SYSTEM
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
        masker_.set_config(config);
    }

    /**
     * @brief Set custom log callback
     *
     * The callback sees every enabled message before it is written out.
     * Pass nullptr to remove it.
     */
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
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        filename_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string rendered = format == log_output_format::json
                                   ? render_json(level, category, message, context, masker)
                                   : render_text(category, message, context, masker);

#ifdef FILE_DROP_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            rendered = get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " +
                       rendered;
        }
        output_to_stderr(rendered);
    }

    void flush() {
#ifdef FILE_DROP_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto render_text(std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context,
                            const filename_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json(&masker);
        }
        return oss.str();
    }

    static auto render_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context,
                            const filename_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << escape_json_string(message) << "\"";
        if (context) {
            std::string ctx_json = context->to_json(&masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef FILE_DROP_USE_LOGGER_SYSTEM
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

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

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
    filename_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline file_drop_logger& get_logger() {
    static file_drop_logger instance;
    return instance;
}

// Logging macros for convenience
#define FD_LOG(level, category, message) \
    kcenon::file_drop::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FD_LOG_CTX(level, category, message, context) \
    kcenon::file_drop::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FD_LOG_TRACE(category, message) \
    FD_LOG(kcenon::file_drop::log_level::trace, category, message)

#define FD_LOG_DEBUG(category, message) \
    FD_LOG(kcenon::file_drop::log_level::debug, category, message)

#define FD_LOG_INFO(category, message) \
    FD_LOG(kcenon::file_drop::log_level::info, category, message)

#define FD_LOG_WARN(category, message) \
    FD_LOG(kcenon::file_drop::log_level::warn, category, message)

#define FD_LOG_ERROR(category, message) \
    FD_LOG(kcenon::file_drop::log_level::error, category, message)

#define FD_LOG_TRACE_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_drop::log_level::trace, category, message, ctx)

#define FD_LOG_DEBUG_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_drop::log_level::debug, category, message, ctx)

#define FD_LOG_INFO_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_drop::log_level::info, category, message, ctx)

#define FD_LOG_WARN_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_drop::log_level::warn, category, message, ctx)

#define FD_LOG_ERROR_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::file_drop::log_level::error, category, message, ctx)

} // namespace kcenon::file_drop
