#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace redline::codec::detail {

constexpr std::size_t pickleHeaderBytes = 4;       // payloadSize
constexpr std::size_t pickleCountBytes = 4;        // entryCount
constexpr std::size_t pickleMinEntryBytes = 4 + 4; // two empty strings

inline bool tryAdd(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max() - b)) return false;
    out = a + b;
    return true;
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > (std::numeric_limits<std::size_t>::max() / b)) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

} // namespace redline::codec::detail
