/**
 * @file control_message.cpp
 * @brief Encoding and decoding of channel control messages
 */

#include <kcenon/file_drop/core/control_message.h>

#include <kcenon/file_drop/core/logging.h>

#include <cstdint>
#include <limits>
#include <sstream>

namespace kcenon::file_drop {

namespace {

/**
 * Reader for the small JSON subset used by control messages: objects,
 * strings and non-negative integers.
 */
class json_reader {
public:
    explicit json_reader(std::string_view text) : text_(text) {}

    void skip_whitespace() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    auto consume(char expected) -> bool {
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[nodiscard]] auto at_end() -> bool {
        skip_whitespace();
        return pos_ == text_.size();
    }

    auto read_string() -> std::optional<std::string> {
        if (!consume('"')) {
            return std::nullopt;
        }

        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    auto code_point = read_unicode_escape();
                    if (!code_point) {
                        return std::nullopt;
                    }
                    append_utf8(out, *code_point);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    auto read_uint() -> std::optional<uint64_t> {
        skip_whitespace();
        std::size_t start = pos_;
        uint64_t value = 0;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            auto digit = static_cast<uint64_t>(text_[pos_] - '0');
            if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 + digit;
            ++pos_;
        }
        if (pos_ == start) {
            return std::nullopt;
        }
        // Leading zeros are not valid JSON
        if (text_[start] == '0' && pos_ - start > 1) {
            return std::nullopt;
        }
        // Fractions and exponents are not byte counts
        if (pos_ < text_.size() && (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * Read an object, handing each key to @p on_member, which must consume
     * the member's value and return false to reject it.
     */
    template <typename Handler>
    auto read_object(Handler&& on_member) -> bool {
        if (!consume('{')) {
            return false;
        }
        if (consume('}')) {
            return true;
        }
        do {
            auto key = read_string();
            if (!key || !consume(':')) {
                return false;
            }
            if (!on_member(*key)) {
                return false;
            }
        } while (consume(','));
        return consume('}');
    }

private:
    auto read_hex4() -> std::optional<uint32_t> {
        if (pos_ + 4 > text_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else return std::nullopt;
        }
        return value;
    }

    auto read_unicode_escape() -> std::optional<uint32_t> {
        auto high = read_hex4();
        if (!high) {
            return std::nullopt;
        }
        if (*high < 0xD800 || *high > 0xDFFF) {
            return high;
        }
        if (*high > 0xDBFF) {
            return std::nullopt;  // lone low surrogate
        }
        if (pos_ + 2 > text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
            return std::nullopt;
        }
        pos_ += 2;
        auto low = read_hex4();
        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
            return std::nullopt;
        }
        return 0x10000 + ((*high - 0xD800) << 10) + (*low - 0xDC00);
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

auto malformed(std::string_view text) -> unexpected {
    constexpr std::size_t max_preview = 64;
    std::string preview(text.substr(0, max_preview));
    if (text.size() > max_preview) {
        preview += "...";
    }
    return unexpected(error{error_code::malformed_message, "malformed control message: " + preview});
}

}  // namespace

auto encode_fileinfo(const file_descriptor& file) -> std::string {
    std::ostringstream oss;
    oss << "{\"type\":\"fileinfo\",\"fileinfo\":{"
        << "\"name\":\"" << escape_json_string(file.name) << "\","
        << "\"size\":" << file.size << ","
        << "\"type\":\"" << escape_json_string(file.media_type) << "\"}}";
    return oss.str();
}

auto encode_done() -> std::string {
    return "{\"type\":\"done\"}";
}

auto parse_control_message(std::string_view text) -> result<control_message> {
    json_reader reader(text);

    std::optional<std::string> type;
    std::optional<file_descriptor> info;

    bool ok = reader.read_object([&](const std::string& key) {
        if (key == "type") {
            type = reader.read_string();
            return type.has_value();
        }
        if (key == "fileinfo") {
            std::optional<std::string> name;
            std::optional<uint64_t> size;
            std::optional<std::string> media_type;

            bool inner = reader.read_object([&](const std::string& field) {
                if (field == "name") {
                    name = reader.read_string();
                    return name.has_value();
                }
                if (field == "size") {
                    size = reader.read_uint();
                    return size.has_value();
                }
                if (field == "type") {
                    media_type = reader.read_string();
                    return media_type.has_value();
                }
                return false;
            });

            if (!inner || !name || !size || !media_type) {
                return false;
            }
            info = file_descriptor{*name, *size, *media_type};
            return true;
        }
        return false;
    });

    if (!ok || !reader.at_end() || !type) {
        return malformed(text);
    }

    if (*type == "fileinfo" && info) {
        return control_message{control_type::fileinfo, std::move(info)};
    }
    if (*type == "done" && !info) {
        return control_message{control_type::done, std::nullopt};
    }

    return malformed(text);
}

}  // namespace kcenon::file_drop
