/**
 * @file drop_config.h
 * @brief Configuration for file drops
 */

#ifndef KCENON_FILE_DROP_CORE_DROP_CONFIG_H
#define KCENON_FILE_DROP_CORE_DROP_CONFIG_H

#include <kcenon/file_drop/core/logging.h>
#include <kcenon/file_drop/core/types.h>

#include <cstddef>
#include <cstdint>

namespace kcenon::file_drop {

/**
 * @brief Configuration for a drop
 *
 * The maximum message size is fixed for the lifetime of a coordinator and
 * applies to every channel it opens.
 */
struct drop_config {
    /// Default maximum message size (64KB)
    static constexpr std::size_t default_message_size = 64 * 1024;

    /// Minimum allowed message size (1KB)
    static constexpr std::size_t min_message_size = 1024;

    /// Maximum allowed message size (1MB)
    static constexpr std::size_t max_message_size_limit = 1024 * 1024;

    /// Environment variable holding the maximum message size in bytes
    static constexpr const char* message_size_env = "FILE_DROP_MESSAGE_SIZE";

    /// Environment variable holding the minimum log level
    static constexpr const char* log_level_env = "FILE_DROP_LOG_LEVEL";

    /// Largest binary payload handed to a channel in one write
    std::size_t max_message_size = default_message_size;

    /// Minimum level applied to the global logger
    log_level min_log_level = log_level::info;

    drop_config() = default;

    explicit drop_config(std::size_t message_size) : max_message_size(message_size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Number of payload messages needed for a file
     * @param file_size Size of the file in bytes
     */
    [[nodiscard]] auto calculate_message_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0 || max_message_size == 0) return 0;
        return (file_size + max_message_size - 1) / max_message_size;
    }

    /**
     * @brief Build a configuration from the process environment
     *
     * Unset variables keep their defaults. The result is validated.
     */
    [[nodiscard]] static auto from_environment() -> result<drop_config>;
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_CORE_DROP_CONFIG_H
