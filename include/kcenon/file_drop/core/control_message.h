/**
 * @file control_message.h
 * @brief Text control messages exchanged on a file's data channel
 *
 * Every channel carries, in order:
 * - one fileinfo message:
 *   {"type":"fileinfo","fileinfo":{"name":"a.txt","size":12,"type":"text/plain"}}
 * - zero or more binary payload messages holding the file bytes
 * - one done message: {"type":"done"}
 */

#ifndef KCENON_FILE_DROP_CORE_CONTROL_MESSAGE_H
#define KCENON_FILE_DROP_CORE_CONTROL_MESSAGE_H

#include <kcenon/file_drop/core/file_descriptor.h>
#include <kcenon/file_drop/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace kcenon::file_drop {

/**
 * @brief Control message kinds
 */
enum class control_type {
    fileinfo,
    done
};

[[nodiscard]] constexpr auto to_string(control_type type) -> const char* {
    switch (type) {
        case control_type::fileinfo: return "fileinfo";
        case control_type::done: return "done";
        default: return "unknown";
    }
}

/**
 * @brief A decoded control message
 */
struct control_message {
    control_type type = control_type::done;
    std::optional<file_descriptor> fileinfo;  ///< Set for control_type::fileinfo
};

/**
 * @brief Encode the fileinfo announcement for a file
 */
[[nodiscard]] auto encode_fileinfo(const file_descriptor& file) -> std::string;

/**
 * @brief Encode the done message
 */
[[nodiscard]] auto encode_done() -> std::string;

/**
 * @brief Decode a text control message
 * @return The message, or malformed_message
 */
[[nodiscard]] auto parse_control_message(std::string_view text) -> result<control_message>;

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_CORE_CONTROL_MESSAGE_H
