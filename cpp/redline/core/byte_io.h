#ifndef REDLINE_CORE_BYTE_IO_H
#define REDLINE_CORE_BYTE_IO_H

#include <cstddef>
#include <cstdint>
#include <vector>

// Little-endian scalar access for wire buffers. Callers bounds-check first.

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    return static_cast<std::uint32_t>(src[offset])
        | (static_cast<std::uint32_t>(src[offset + 1]) << 8)
        | (static_cast<std::uint32_t>(src[offset + 2]) << 16)
        | (static_cast<std::uint32_t>(src[offset + 3]) << 24);
}

static inline std::uint16_t readU16(const std::uint8_t* src, std::size_t offset) noexcept {
    return static_cast<std::uint16_t>(src[offset] | (src[offset + 1] << 8));
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    for (std::size_t i = 0; i < 4; ++i) {
        dst[offset + i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

static inline void appendU32LE(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

static inline void appendU16LE(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

#endif // REDLINE_CORE_BYTE_IO_H
