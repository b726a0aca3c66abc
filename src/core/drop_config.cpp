/**
 * @file drop_config.cpp
 * @brief Validation and environment loading for drop_config
 */

#include <kcenon/file_drop/core/drop_config.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace kcenon::file_drop {

namespace {

auto parse_size(const std::string& text) -> std::optional<std::size_t> {
    if (text.empty()) {
        return std::nullopt;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    try {
        return static_cast<std::size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace

auto drop_config::validate() const -> result<void> {
    if (max_message_size < min_message_size) {
        return unexpected(error{
            error_code::invalid_message_size,
            "message size too small (minimum: " + std::to_string(min_message_size) + ")"});
    }
    if (max_message_size > max_message_size_limit) {
        return unexpected(error{
            error_code::invalid_message_size,
            "message size too large (maximum: " + std::to_string(max_message_size_limit) + ")"});
    }
    return {};
}

auto drop_config::from_environment() -> result<drop_config> {
    drop_config config;

    if (const char* value = std::getenv(message_size_env); value != nullptr) {
        auto size = parse_size(value);
        if (!size) {
            return unexpected(error{error_code::invalid_configuration,
                                    std::string(message_size_env) + " is not a byte count: " +
                                        value});
        }
        config.max_message_size = *size;
    }

    if (const char* value = std::getenv(log_level_env); value != nullptr) {
        auto level = log_level_from_string(value);
        if (!level) {
            return unexpected(error{error_code::invalid_configuration,
                                    std::string(log_level_env) + " is not a log level: " +
                                        value});
        }
        config.min_log_level = *level;
    }

    if (auto valid = config.validate(); !valid) {
        FD_LOG_ERROR(log_category::config, valid.error().message);
        return unexpected(valid.error());
    }

    return config;
}

}  // namespace kcenon::file_drop
