#ifndef REDLINE_CODEC_PICKLE_H
#define REDLINE_CODEC_PICKLE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace redline::codec {

// Clipboard type tag whose data is a pickle of custom MIME entries.
constexpr const char* kWebCustomDataType = "org.chromium.web-custom-data";
constexpr const char* kPlainTextType = "public.utf8-plain-text";

enum class DecodeError : std::uint32_t {
    Ok = 0,
    BufferTruncated = 1,
    PayloadSizeMismatch = 2,
    InvalidPayloadSize = 3,
    TrailingBytes = 4,
};

const char* toString(DecodeError error);

struct PickleEntry {
    std::u16string type;
    std::u16string value;

    bool operator==(const PickleEntry& o) const { return type == o.type && value == o.value; }
    bool operator!=(const PickleEntry& o) const { return !(*this == o); }
};

struct PickleContainer {
    std::vector<PickleEntry> entries;

    bool operator==(const PickleContainer& o) const { return entries == o.entries; }
    bool operator!=(const PickleContainer& o) const { return !(*this == o); }
};

/**
 * Decode a pickle container.
 *
 * Layout (little endian):
 *   u32 payloadSize, u32 entryCount, then per entry two strings, each
 *   u32 charCount + charCount UTF-16LE code units + zero padding to 4 bytes.
 * payloadSize counts every byte after itself and must match the buffer.
 *
 * @param src Buffer start (may be null when byteCount is 0)
 * @param byteCount Buffer length in bytes
 * @param out Receives the entries; left cleared on error
 * @return DecodeError::Ok or the first structural problem found
 */
DecodeError decodePickle(const std::uint8_t* src, std::size_t byteCount, PickleContainer& out);

/**
 * Encode a container. decodePickle(encodePickle(c)) reproduces c.
 */
std::vector<std::uint8_t> encodePickle(const PickleContainer& container);

const PickleEntry* findEntry(const PickleContainer& container, std::u16string_view type);

/**
 * Replace the value of the first entry of `type`, appending one if absent.
 */
void setEntry(PickleContainer& container, std::u16string_view type, std::u16string value);

} // namespace redline::codec

#endif // REDLINE_CODEC_PICKLE_H
