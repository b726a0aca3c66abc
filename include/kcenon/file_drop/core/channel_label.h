/**
 * @file channel_label.h
 * @brief Process-unique labels for data channels
 */

#ifndef KCENON_FILE_DROP_CORE_CHANNEL_LABEL_H
#define KCENON_FILE_DROP_CORE_CHANNEL_LABEL_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::file_drop {

/**
 * @brief Label of one file's data channel (16-byte random UUID)
 *
 * Labels are never derived from file content; two senders of the same file
 * get different labels.
 */
struct channel_label {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr channel_label() noexcept = default;

    explicit constexpr channel_label(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random (version 4) label
     *
     * Thread-safe.
     */
    [[nodiscard]] static auto generate() -> channel_label;

    /**
     * @brief Convert to string representation (UUID format)
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Parse from UUID string
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<channel_label>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const channel_label& other) const
        noexcept -> bool = default;
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_CORE_CHANNEL_LABEL_H
