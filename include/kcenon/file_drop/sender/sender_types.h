/**
 * @file sender_types.h
 * @brief State and progress types for chunked senders and drops
 */

#ifndef KCENON_FILE_DROP_SENDER_SENDER_TYPES_H
#define KCENON_FILE_DROP_SENDER_SENDER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/file_drop/core/types.h"

namespace kcenon::file_drop {

/**
 * @brief State of one file's sender
 */
enum class sender_state {
    awaiting_open,        ///< Channel not open yet
    announcing_info,      ///< Writing the fileinfo message
    sending,              ///< Ready to produce the next chunk or finish
    awaiting_next_chunk,  ///< A chunk read is in flight; events are ignored
    done,                 ///< All bytes and the done message were sent
    failed                ///< A read or write failed; the sender is stalled
};

[[nodiscard]] constexpr auto to_string(sender_state state) noexcept -> const char* {
    switch (state) {
        case sender_state::awaiting_open: return "awaiting_open";
        case sender_state::announcing_info: return "announcing_info";
        case sender_state::sending: return "sending";
        case sender_state::awaiting_next_chunk: return "awaiting_next_chunk";
        case sender_state::done: return "done";
        case sender_state::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_state(sender_state state) noexcept -> bool {
    return state == sender_state::done || state == sender_state::failed;
}

/**
 * @brief Which channel event woke the sender
 */
enum class sender_event {
    opened,
    buffered_amount_low
};

[[nodiscard]] constexpr auto to_string(sender_event event) noexcept -> const char* {
    switch (event) {
        case sender_event::opened: return "opened";
        case sender_event::buffered_amount_low: return "buffered_amount_low";
        default: return "unknown";
    }
}

/**
 * @brief The file that made a drop fail
 */
struct drop_failure {
    std::size_t file_index = 0;
    std::string label;
    std::string filename;
    error cause;
};

/**
 * @brief Terminal outcome of a drop
 */
enum class drop_status {
    done,
    failed
};

[[nodiscard]] constexpr auto to_string(drop_status status) noexcept -> const char* {
    switch (status) {
        case drop_status::done: return "done";
        case drop_status::failed: return "failed";
        default: return "unknown";
    }
}

struct drop_outcome {
    drop_status status = drop_status::done;
    std::optional<drop_failure> failure;  ///< Set when status is failed
};

/**
 * @brief Snapshot of a drop's progress
 */
struct drop_progress {
    std::size_t total_files = 0;      ///< Files in the drop
    std::size_t completed_files = 0;  ///< Senders in done
    std::size_t failed_files = 0;     ///< Senders in failed
    uint64_t total_bytes = 0;         ///< Sum of file sizes
    uint64_t bytes_sent = 0;          ///< Bytes handed to channels so far

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_sent) /
               static_cast<double>(total_bytes) * 100.0;
    }

    [[nodiscard]] auto pending_files() const noexcept -> std::size_t {
        return total_files - completed_files - failed_files;
    }
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_SENDER_SENDER_TYPES_H
