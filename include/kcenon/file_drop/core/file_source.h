/**
 * @file file_source.h
 * @brief Read-only, randomly sliceable byte sources for dropped files
 */

#ifndef KCENON_FILE_DROP_CORE_FILE_SOURCE_H
#define KCENON_FILE_DROP_CORE_FILE_SOURCE_H

#include <kcenon/file_drop/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::file_drop {

/**
 * @brief A file being dropped
 *
 * Name, size and media type are fixed when the source is created.
 * Implementations must allow read() of any range inside [0, size()).
 */
class file_source {
public:
    virtual ~file_source() = default;

    [[nodiscard]] virtual auto name() const -> const std::string& = 0;

    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief MIME type of the file, empty when unknown
     */
    [[nodiscard]] virtual auto media_type() const -> const std::string& = 0;

    /**
     * @brief Read the byte range [offset, offset + length)
     * @return The bytes, or invalid_range / file_read_error
     */
    [[nodiscard]] virtual auto read(uint64_t offset, std::size_t length) const
        -> result<std::vector<std::byte>> = 0;

protected:
    file_source() = default;
};

/**
 * @brief File whose bytes are held in memory
 */
class memory_file_source : public file_source {
public:
    memory_file_source(std::string name, std::vector<std::byte> data, std::string media_type = {});

    [[nodiscard]] auto name() const -> const std::string& override { return name_; }
    [[nodiscard]] auto size() const -> uint64_t override { return data_.size(); }
    [[nodiscard]] auto media_type() const -> const std::string& override { return media_type_; }

    [[nodiscard]] auto read(uint64_t offset, std::size_t length) const
        -> result<std::vector<std::byte>> override;

private:
    std::string name_;
    std::vector<std::byte> data_;
    std::string media_type_;
};

/**
 * @brief File read from disk on demand
 *
 * The size is captured at open(); a file that shrinks afterwards surfaces
 * as file_read_error on the affected reads.
 */
class disk_file_source : public file_source {
public:
    /**
     * @brief Open a file for dropping
     * @param path Path of the file
     * @param media_type MIME type; guessed from the extension when empty
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path, std::string media_type = {})
        -> result<std::shared_ptr<disk_file_source>>;

    [[nodiscard]] auto name() const -> const std::string& override { return name_; }
    [[nodiscard]] auto size() const -> uint64_t override { return size_; }
    [[nodiscard]] auto media_type() const -> const std::string& override { return media_type_; }

    [[nodiscard]] auto read(uint64_t offset, std::size_t length) const
        -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    disk_file_source(std::filesystem::path path, std::ifstream stream, uint64_t size,
                     std::string media_type);

    std::filesystem::path path_;
    std::string name_;
    uint64_t size_;
    std::string media_type_;

    mutable std::ifstream stream_;
    mutable std::mutex stream_mutex_;
};

/**
 * @brief Guess a MIME type from a file extension
 * @return The MIME type, or an empty string for unknown extensions
 */
[[nodiscard]] auto guess_media_type(const std::filesystem::path& path) -> std::string;

}  // namespace kcenon::file_drop

#endif  // KCENON_FILE_DROP_CORE_FILE_SOURCE_H
