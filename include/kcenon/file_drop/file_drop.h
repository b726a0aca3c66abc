/**
 * @file file_drop.h
 * @brief Main header for file_drop_system library
 * @version 0.1.0
 *
 * Include this header to access the whole sending side of a file drop.
 *
 * @code
 * #include <kcenon/file_drop/file_drop.h>
 *
 * using namespace kcenon::file_drop;
 *
 * boost::asio::io_context io;
 * loopback_provider peer(io.get_executor());
 *
 * auto file = disk_file_source::open("report.pdf");
 * auto drop = transfer_coordinator::create(peer, io.get_executor(), {file.value()});
 * drop.value()->on_done([] { std::cout << "dropped\n"; });
 *
 * peer.connect();
 * io.run();
 * @endcode
 */

#ifndef KCENON_FILE_DROP_FILE_DROP_H
#define KCENON_FILE_DROP_FILE_DROP_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/file_drop/core/types.h"
#include "kcenon/file_drop/core/logging.h"
#include "kcenon/file_drop/core/drop_config.h"
#include "kcenon/file_drop/core/channel_label.h"
#include "kcenon/file_drop/core/file_descriptor.h"
#include "kcenon/file_drop/core/file_source.h"
#include "kcenon/file_drop/core/control_message.h"

// Transport
#include "kcenon/file_drop/transport/data_channel.h"
#include "kcenon/file_drop/transport/loopback_channel.h"

// Sender
#include "kcenon/file_drop/sender/sender_types.h"
#include "kcenon/file_drop/sender/chunked_sender.h"
#include "kcenon/file_drop/sender/completion_join.h"
#include "kcenon/file_drop/sender/transfer_coordinator.h"

namespace kcenon::file_drop {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_FILE_DROP_H
