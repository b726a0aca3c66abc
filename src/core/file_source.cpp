/**
 * @file file_source.cpp
 * @brief In-memory and on-disk file sources
 */

#include <kcenon/file_drop/core/file_source.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace kcenon::file_drop {

namespace {

auto check_range(uint64_t offset, std::size_t length, uint64_t size) -> result<void> {
    if (offset > size || length > size - offset) {
        return unexpected(error{error_code::invalid_range,
                                "range [" + std::to_string(offset) + ", " +
                                    std::to_string(offset + length) + ") outside file of " +
                                    std::to_string(size) + " bytes"});
    }
    return {};
}

}  // namespace

// memory_file_source

memory_file_source::memory_file_source(std::string name,
                                       std::vector<std::byte> data,
                                       std::string media_type)
    : name_(std::move(name)), data_(std::move(data)), media_type_(std::move(media_type)) {}

auto memory_file_source::read(uint64_t offset, std::size_t length) const
    -> result<std::vector<std::byte>> {
    if (auto range = check_range(offset, length, data_.size()); !range) {
        return unexpected(range.error());
    }

    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(length));
}

// disk_file_source

disk_file_source::disk_file_source(std::filesystem::path path,
                                   std::ifstream stream,
                                   uint64_t size,
                                   std::string media_type)
    : path_(std::move(path)),
      name_(path_.filename().string()),
      size_(size),
      media_type_(std::move(media_type)),
      stream_(std::move(stream)) {}

auto disk_file_source::open(const std::filesystem::path& path, std::string media_type)
    -> result<std::shared_ptr<disk_file_source>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + path.string()});
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_access_denied, "cannot get file size: " + path.string()});
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return unexpected(
            error{error_code::file_access_denied, "cannot open file: " + path.string()});
    }

    if (media_type.empty()) {
        media_type = guess_media_type(path);
    }

    return std::shared_ptr<disk_file_source>(
        new disk_file_source(path, std::move(stream), file_size, std::move(media_type)));
}

auto disk_file_source::read(uint64_t offset, std::size_t length) const
    -> result<std::vector<std::byte>> {
    if (auto range = check_range(offset, length, size_); !range) {
        return unexpected(range.error());
    }

    std::vector<std::byte> buffer(length);
    if (length == 0) {
        return buffer;
    }

    std::lock_guard<std::mutex> lock(stream_mutex_);

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed: " + path_.string()});
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    auto bytes_read = static_cast<std::size_t>(stream_.gcount());

    if (bytes_read != length) {
        return unexpected(error{error_code::file_read_error,
                                "short read at offset " + std::to_string(offset) + ": " +
                                    std::to_string(bytes_read) + " of " +
                                    std::to_string(length) + " bytes"});
    }

    return buffer;
}

auto guess_media_type(const std::filesystem::path& path) -> std::string {
    static const std::unordered_map<std::string, std::string> types{
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".flac", "audio/flac"},
        {".aac", "audio/aac"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".webm", "video/webm"},
        {".mkv", "video/x-matroska"},
        {".avi", "video/x-msvideo"},
    };

    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(extension);
    return it != types.end() ? it->second : std::string{};
}

}  // namespace kcenon::file_drop
