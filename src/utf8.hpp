#pragma once

// Internal header, not installed.
// Code-point arithmetic over UTF-8 strings. Positions inside text nodes are
// counted in code points; these helpers translate them to byte offsets.

#include <cstddef>
#include <string>
#include <string_view>

namespace blocktree_cpp::detail::utf8 {

// bit masks for recognising continuation bytes
inline constexpr unsigned char mask_cont = 0b1100'0000;
inline constexpr unsigned char test_cont = 0b1000'0000;

constexpr auto is_continuation(char c) noexcept -> bool {
    return (static_cast<unsigned char>(c) & mask_cont) == test_cont;
}

// Number of code points in a string. Invalid sequences count one per lead byte.
inline auto length(std::string_view str) noexcept -> std::size_t {
    auto count = std::size_t{0};
    for (auto c : str) {
        if (!is_continuation(c)) ++count;
    }
    return count;
}

// Byte offset of the code point at `index`; str.size() when past the end.
inline auto byte_offset(std::string_view str, std::size_t index) noexcept -> std::size_t {
    auto seen = std::size_t{0};
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (is_continuation(str[i])) continue;
        if (seen == index) return i;
        ++seen;
    }
    return str.size();
}

// Substring between two code-point offsets.
inline auto substr(std::string_view str, std::size_t from, std::size_t to) -> std::string {
    auto begin = byte_offset(str, from);
    auto end = byte_offset(str, to);
    return std::string{str.substr(begin, end - begin)};
}

// Append the UTF-8 encoding of a code point. Surrogates and values past
// U+10FFFF become U+FFFD.
inline void append(std::string& out, char32_t cp) {
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) cp = 0xFFFD;
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

}  // namespace blocktree_cpp::detail::utf8
