/**
 * @file simple_drop.cpp
 * @brief Drops local files to an in-process receiver
 *
 * This example demonstrates:
 * - Loading the drop configuration from the environment
 * - Opening files from disk as file sources
 * - Starting a drop and observing its signaling events
 * - Reassembling the files on the receiving side of a loopback provider
 * - Reporting progress and the drop's outcome
 *
 * Environment:
 *   FILE_DROP_MESSAGE_SIZE  largest binary message in bytes (default 65536)
 *   FILE_DROP_LOG_LEVEL     trace, debug, info, warn, error or fatal
 */

#include <kcenon/file_drop/file_drop.h>

#include <boost/asio/io_context.hpp>

#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::file_drop;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief What the receiving side has seen on one channel
 */
struct incoming_file {
    std::string name;
    uint64_t expected_size = 0;
    uint64_t received = 0;
    bool complete = false;
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Simple Drop Example - File Drop System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [--json] <file>..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --json     Write log lines as JSON" << std::endl;
    std::cout << "  --help     Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> paths;
    bool json_logs = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--json") {
            json_logs = true;
        } else {
            paths.push_back(arg);
        }
    }

    if (paths.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto config = drop_config::from_environment();
    if (!config) {
        std::cerr << "Error: " << config.error().message << std::endl;
        return 1;
    }

    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(config.value().min_log_level);
    if (json_logs) {
        logger.set_output_format(log_output_format::json);
    }

    std::vector<std::shared_ptr<const file_source>> files;
    for (const auto& path : paths) {
        auto source = disk_file_source::open(path);
        if (!source) {
            std::cerr << "Error: " << source.error().message << std::endl;
            return 1;
        }
        files.push_back(source.value());
    }

    boost::asio::io_context io;
    loopback_provider peer(io.get_executor());

    std::map<std::string, incoming_file> incoming;
    peer.set_sink([&incoming](const loopback_message& msg) {
        auto& file = incoming[msg.label];
        if (msg.binary) {
            file.received += msg.data.size();
            return;
        }

        auto control = parse_control_message(msg.text);
        if (!control) {
            std::cerr << "Receiver: " << control.error().message << std::endl;
            return;
        }
        if (control.value().type == control_type::fileinfo) {
            file.name = control.value().fileinfo->name;
            file.expected_size = control.value().fileinfo->size;
        } else {
            file.complete = true;
            std::cout << "Received " << file.name << " (" << format_bytes(file.received) << ")"
                      << std::endl;
        }
    });

    auto created = transfer_coordinator::create(peer, io.get_executor(), files, config.value());
    if (!created) {
        std::cerr << "Error: " << created.error().message << std::endl;
        return 1;
    }
    auto drop = std::move(created).value();

    std::cout << "Dropping " << drop->files().size() << " file(s), "
              << format_bytes(drop->total_size()) << " in messages of up to "
              << format_bytes(config.value().max_message_size) << std::endl;

    int exit_code = 1;

    drop->on_id_changed([](const std::string& id) {
        std::cout << "Drop registered, share id: " << id << std::endl;
    });
    drop->on_connected([] { std::cout << "Recipient connected" << std::endl; });
    drop->on_disconnected([] { std::cout << "Recipient disconnected" << std::endl; });

    drop->on_done([&] {
        auto progress = drop->progress();
        std::cout << "Drop complete: " << progress.completed_files << " file(s), "
                  << format_bytes(drop->bytes_sent()) << std::endl;
        exit_code = 0;
    });
    drop->on_failed([&](const drop_failure& failure) {
        std::cerr << "Drop failed on " << failure.filename << ": " << failure.cause.message
                  << " (" << format_bytes(drop->bytes_sent()) << " of "
                  << format_bytes(drop->total_size()) << " sent)" << std::endl;
        exit_code = 1;
    });

    peer.register_drop(channel_label::generate().to_string().substr(0, 8));
    peer.connect();
    io.run();

    for (const auto& [label, file] : incoming) {
        if (!file.complete || file.received != file.expected_size) {
            std::cerr << "Incomplete: " << file.name << " " << file.received << "/"
                      << file.expected_size << std::endl;
            exit_code = 1;
        }
    }

    logger.flush();
    return exit_code;
}
