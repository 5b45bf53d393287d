#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace verity::text {

// Length of the well-formed UTF-8 sequence starting at pos, or 0 when the bytes there are not one
inline size_t utf8SequenceLength(std::string_view text, size_t pos) {
    const auto* data = reinterpret_cast<const unsigned char*>(text.data());
    const size_t n = text.size();
    const unsigned char c = data[pos];
    size_t len = 0;
    if (c < 0x80) {
        return 1;
    } else if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
    } else {
        return 0;
    }
    if (pos + len > n) {
        return 0;
    }
    for (size_t i = 1; i < len; ++i) {
        if ((data[pos + i] & 0xC0) != 0x80) {
            return 0;
        }
    }
    return len;
}

// Code point of a sequence already measured by utf8SequenceLength
inline char32_t decodeUtf8(std::string_view text, size_t pos, size_t len) {
    const auto* data = reinterpret_cast<const unsigned char*>(text.data()) + pos;
    switch (len) {
        case 1: return data[0];
        case 2: return ((data[0] & 0x1Fu) << 6) | (data[1] & 0x3Fu);
        case 3: return ((data[0] & 0x0Fu) << 12) | ((data[1] & 0x3Fu) << 6) | (data[2] & 0x3Fu);
        case 4:
            return ((data[0] & 0x07u) << 18) | ((data[1] & 0x3Fu) << 12) |
                   ((data[2] & 0x3Fu) << 6) | (data[3] & 0x3Fu);
        default: return 0xFFFD;
    }
}

inline bool isValidUtf8(std::string_view text) {
    for (size_t i = 0; i < text.size();) {
        const size_t len = utf8SequenceLength(text, i);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

// One string per code point; a malformed byte becomes a piece of its own
inline std::vector<std::string> splitCodePoints(std::string_view text) {
    std::vector<std::string> pieces;
    pieces.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        const size_t len = std::max<size_t>(1, utf8SequenceLength(text, i));
        pieces.emplace_back(text.substr(i, len));
        i += len;
    }
    return pieces;
}

} // namespace verity::text
