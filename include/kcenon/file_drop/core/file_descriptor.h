/**
 * @file file_descriptor.h
 * @brief Immutable description of a dropped file
 */

#ifndef KCENON_FILE_DROP_CORE_FILE_DESCRIPTOR_H
#define KCENON_FILE_DROP_CORE_FILE_DESCRIPTOR_H

#include <kcenon/file_drop/core/file_source.h>

#include <cstdint>
#include <string>

namespace kcenon::file_drop {

/**
 * @brief Name, size and media type of one file, as announced to the peer
 */
struct file_descriptor {
    std::string name;
    uint64_t size = 0;
    std::string media_type;

    file_descriptor() = default;
    file_descriptor(std::string n, uint64_t s, std::string type)
        : name(std::move(n)), size(s), media_type(std::move(type)) {}

    [[nodiscard]] static auto from(const file_source& source) -> file_descriptor {
        return {source.name(), source.size(), source.media_type()};
    }

    [[nodiscard]] auto operator==(const file_descriptor& other) const -> bool = default;
};

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_CORE_FILE_DESCRIPTOR_H
