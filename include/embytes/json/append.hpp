#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace embytes {
namespace json {

// Fast integer -> decimal formatter. Writes into out without a terminator.
// Returns number of characters written (at most 20).
[[nodiscard]]
inline std::size_t append(char* out, std::uint64_t value) noexcept {
    char buf[20];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    const std::size_t len = static_cast<std::size_t>(buf + sizeof(buf) - p);
    std::memcpy(out, p, len);
    return len;
}

// Raw copy (no escaping). Returns number of characters written.
[[nodiscard]]
inline std::size_t append(char* out, std::string_view text) noexcept {
    std::memcpy(out, text.data(), text.size());
    return text.size();
}

// Quoted string escaped per RFC 8259: '"' and '\\' get a backslash, control
// characters below 0x20 become \b \f \n \r \t or \u00XX.
// Returns number of characters written.
// PRECONDITION: out holds at least 6 * text.size() + 2 characters.
[[nodiscard]]
inline std::size_t append_quoted(char* out, std::string_view text) noexcept {
    static constexpr char hex[] = "0123456789abcdef";
    std::size_t pos = 0;
    out[pos++] = '"';
    for (char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out[pos++] = '\\';
            out[pos++] = c;
        } else if (byte < 0x20) {
            out[pos++] = '\\';
            switch (c) {
            case '\b': out[pos++] = 'b'; break;
            case '\f': out[pos++] = 'f'; break;
            case '\n': out[pos++] = 'n'; break;
            case '\r': out[pos++] = 'r'; break;
            case '\t': out[pos++] = 't'; break;
            default:
                out[pos++] = 'u';
                out[pos++] = '0';
                out[pos++] = '0';
                out[pos++] = hex[byte >> 4];
                out[pos++] = hex[byte & 0x0F];
                break;
            }
        } else {
            out[pos++] = c;
        }
    }
    out[pos++] = '"';
    return pos;
}

// Upper bound of append_quoted() output for text of the given length
[[nodiscard]]
inline constexpr std::size_t max_quoted_size(std::size_t length) noexcept {
    return 6 * length + 2;
}

} // namespace json
} // namespace embytes
