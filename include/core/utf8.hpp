#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace anonymizer::utf8 {

/**
 * @brief Byte offset of every code point boundary in a UTF-8 string
 *
 * Entity offsets on the wire are code point indices. The returned vector has
 * one entry per code point plus a trailing entry equal to text.size(), so
 * code point range [start, end) maps to bytes [b[start], b[end]).
 * Malformed sequences are counted one byte per code point.
 */
[[nodiscard]] inline std::vector<size_t> boundaries(std::string_view text) {
    std::vector<size_t> result;
    result.reserve(text.size() + 1);

    size_t i = 0;
    while (i < text.size()) {
        result.push_back(i);
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;

        if (i + len > text.size()) len = 1;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                len = 1;
                break;
            }
        }
        i += len;
    }
    result.push_back(text.size());
    return result;
}

[[nodiscard]] inline size_t length(std::string_view text) {
    return boundaries(text).size() - 1;
}

// Code point substring [start, end); caller guarantees the range is valid
[[nodiscard]] inline std::string substr(std::string_view text, size_t start, size_t end) {
    const auto b = boundaries(text);
    return std::string(text.substr(b[start], b[end] - b[start]));
}

} // namespace anonymizer::utf8
