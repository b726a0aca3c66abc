/**
 * @file channel_label.cpp
 * @brief Implementation of channel_label generation and serialization
 */

#include "kcenon/file_drop/core/channel_label.h"

#include <cctype>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace kcenon::file_drop {

namespace {

// One engine per process, seeded once from the OS entropy source.
auto label_engine() -> std::mt19937_64& {
    static std::mt19937_64 engine{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }()};
    return engine;
}

std::mutex label_engine_mutex;

}  // namespace

auto channel_label::generate() -> channel_label {
    uint64_t part1 = 0;
    uint64_t part2 = 0;
    {
        std::lock_guard<std::mutex> lock(label_engine_mutex);
        auto& gen = label_engine();
        part1 = gen();
        part2 = gen();
    }

    channel_label label;
    for (int i = 0; i < 8; ++i) {
        label.bytes[i] = static_cast<uint8_t>((part1 >> (i * 8)) & 0xFF);
        label.bytes[i + 8] = static_cast<uint8_t>((part2 >> (i * 8)) & 0xFF);
    }

    // Version 4 (random), RFC 4122 variant
    label.bytes[6] = (label.bytes[6] & 0x0F) | 0x40;
    label.bytes[8] = (label.bytes[8] & 0x3F) | 0x80;

    return label;
}

auto channel_label::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    // Format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

auto channel_label::from_string(std::string_view str)
    -> std::optional<channel_label> {
    std::string hex_str;
    hex_str.reserve(32);

    for (char c : str) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        hex_str += c;
    }

    if (hex_str.length() != 32) {
        return std::nullopt;
    }

    channel_label label;
    for (std::size_t i = 0; i < 16; ++i) {
        label.bytes[i] = static_cast<uint8_t>(std::stoul(hex_str.substr(i * 2, 2), nullptr, 16));
    }

    return label;
}

}  // namespace kcenon::file_drop
