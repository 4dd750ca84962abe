#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace redline {

// =============================================================================
// UTF-8 decoding
// =============================================================================

/**
 * Decode one code point at `pos`. Invalid or truncated sequences decode to
 * U+FFFD with byteLen 1 so callers always make progress.
 */
inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const auto at = [&](std::size_t i) { return static_cast<unsigned char>(content[pos + i]); };
    const auto isCont = [](unsigned char c) { return (c & 0xC0) == 0x80; };

    const unsigned char c0 = at(0);
    if (c0 < 0x80) {
        byteLen = 1;
        return c0;
    }

    std::uint32_t need = 0;
    std::uint32_t cp = 0;
    if ((c0 & 0xE0) == 0xC0) {
        need = 1;
        cp = c0 & 0x1F;
    } else if ((c0 & 0xF0) == 0xE0) {
        need = 2;
        cp = c0 & 0x0F;
    } else if ((c0 & 0xF8) == 0xF0) {
        need = 3;
        cp = c0 & 0x07;
    } else {
        byteLen = 1;
        return 0xFFFD;
    }

    if (pos + need >= n) {
        byteLen = 1;
        return 0xFFFD;
    }
    for (std::uint32_t i = 1; i <= need; ++i) {
        if (!isCont(at(i))) {
            byteLen = 1;
            return 0xFFFD;
        }
        cp = (cp << 6) | (at(i) & 0x3F);
    }
    byteLen = need + 1;
    return cp;
}

inline void appendUtf16(std::u16string& out, std::uint32_t cp) {
    if (cp > 0xFFFF) {
        cp -= 0x10000;
        out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
        out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
    } else {
        out.push_back(static_cast<char16_t>(cp));
    }
}

inline void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// =============================================================================
// UTF-8 <-> UTF-16
// =============================================================================

/**
 * Strict conversion. Returns false on any malformed sequence; a literal
 * U+FFFD in the input is three bytes and still accepted.
 */
inline bool utf8ToUtf16(std::string_view content, std::u16string& out) {
    out.clear();
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) return false;
        if (cp == 0xFFFD && byteLen == 1) return false;
        appendUtf16(out, cp);
        pos += byteLen;
    }
    return true;
}

inline std::u16string utf8ToUtf16(std::string_view content) {
    std::u16string out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        appendUtf16(out, cp);
        pos += byteLen;
    }
    return out;
}

/**
 * Unpaired surrogates become U+FFFD.
 */
inline std::string utf16ToUtf8(std::u16string_view content) {
    std::string out;
    out.reserve(content.size());
    for (std::size_t i = 0; i < content.size(); ++i) {
        std::uint32_t cu = content[i];
        if (cu >= 0xD800 && cu <= 0xDBFF) {
            if (i + 1 < content.size() && content[i + 1] >= 0xDC00 && content[i + 1] <= 0xDFFF) {
                const std::uint32_t lo = content[i + 1];
                appendUtf8(out, 0x10000 + ((cu - 0xD800) << 10) + (lo - 0xDC00));
                ++i;
                continue;
            }
            cu = 0xFFFD;
        } else if (cu >= 0xDC00 && cu <= 0xDFFF) {
            cu = 0xFFFD;
        }
        appendUtf8(out, cu);
    }
    return out;
}

// =============================================================================
// Logical (UTF-16 code unit) index conversion
// =============================================================================

inline std::uint32_t utf16Length(std::string_view content) {
    std::uint32_t units = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        units += cp > 0xFFFF ? 2u : 1u;
        pos += byteLen;
    }
    return units;
}

/**
 * Map logical index (UTF-16 code unit count) to UTF-8 byte offset. An index
 * inside a surrogate pair maps to the start of that code point.
 */
inline std::size_t logicalToByteIndex(std::string_view content, std::uint32_t logicalIndex) {
    std::size_t bytePos = 0;
    std::uint32_t logicalCount = 0;
    while (bytePos < content.size() && logicalCount < logicalIndex) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, bytePos, byteLen);
        if (byteLen == 0) break;
        const std::uint32_t units = cp > 0xFFFF ? 2u : 1u;
        if (logicalCount + units > logicalIndex) break;
        logicalCount += units;
        bytePos += byteLen;
    }
    return bytePos;
}

/**
 * Map UTF-8 byte index to logical index (UTF-16 code unit count).
 */
inline std::uint32_t byteToLogicalIndex(std::string_view content, std::size_t byteIndex) {
    std::uint32_t logicalCount = 0;
    const std::size_t limit = std::min(content.size(), byteIndex);
    std::size_t pos = 0;
    while (pos < limit) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0 || pos + byteLen > limit) break;
        logicalCount += cp > 0xFFFF ? 2u : 1u;
        pos += byteLen;
    }
    return logicalCount;
}

/**
 * Substring addressed in UTF-16 code units.
 */
inline std::string_view logicalSubstr(std::string_view content, std::uint32_t start, std::uint32_t length) {
    const std::size_t b0 = logicalToByteIndex(content, start);
    const std::size_t b1 = logicalToByteIndex(content, start + length);
    return content.substr(b0, b1 - b0);
}

inline bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace redline
