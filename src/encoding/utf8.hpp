#pragma once

// UTF-8 code point arithmetic for run text.
// Offsets exposed to callers count code points; storage is UTF-8 bytes.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace docspan_cpp::encoding {

inline auto is_continuation(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Number of code points in a UTF-8 string. Stray continuation bytes are
// not counted, so malformed input never inflates the length.
inline auto utf8_length(std::string_view s) -> std::size_t {
    auto count = std::size_t{0};
    for (auto c : s) {
        if (!is_continuation(c)) ++count;
    }
    return count;
}

// Byte offset of the code point at `index`. Indices at or past the end
// map to s.size().
inline auto utf8_byte_offset(std::string_view s, std::size_t index) -> std::size_t {
    auto seen = std::size_t{0};
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(s[i])) continue;
        if (seen == index) return i;
        ++seen;
    }
    return s.size();
}

// Code points [begin, end) of s.
inline auto utf8_substr(std::string_view s, std::size_t begin, std::size_t end) -> std::string {
    if (end <= begin) return {};
    auto b = utf8_byte_offset(s, begin);
    auto e = utf8_byte_offset(s, end);
    return std::string{s.substr(b, e - b)};
}

// Erase code points [begin, end) in place.
inline void utf8_erase(std::string& s, std::size_t begin, std::size_t end) {
    if (end <= begin) return;
    auto b = utf8_byte_offset(s, begin);
    auto e = utf8_byte_offset(s, end);
    s.erase(b, e - b);
}

// Strict validation: well-formed sequences, no overlongs, no surrogates,
// nothing above U+10FFFF.
inline auto utf8_valid(std::string_view s) -> bool {
    std::size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        auto need = std::size_t{0};
        auto cp = std::uint32_t{0};
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            need = 1; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            need = 2; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            need = 3; cp = c & 0x07;
        } else {
            return false;
        }
        if (i + need >= s.size()) return false;  // truncated sequence
        for (std::size_t k = 1; k <= need; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((need == 1 && cp < 0x80) || (need == 2 && cp < 0x800) || (need == 3 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += need + 1;
    }
    return true;
}

}  // namespace docspan_cpp::encoding
