#include "redline/codec/pickle.h"
#include "redline/codec/codec_detail.h"
#include "redline/core/byte_io.h"

namespace redline::codec {
using namespace detail;

namespace {

DecodeError readString(const std::uint8_t* payload, std::size_t payloadBytes, std::size_t& o, std::u16string& out) {
    if (!requireBytes(o, 4, payloadBytes)) return DecodeError::BufferTruncated;
    const std::uint32_t charCount = readU32(payload, o);
    o += 4;

    // Counts are characters; the byte length is twice that.
    std::size_t byteLen = 0;
    if (!tryMul(static_cast<std::size_t>(charCount), 2, byteLen)) return DecodeError::InvalidPayloadSize;
    std::size_t padded = 0;
    if (!tryAdd(byteLen, 3, padded)) return DecodeError::InvalidPayloadSize;
    padded &= ~static_cast<std::size_t>(3);
    if (!requireBytes(o, padded, payloadBytes)) return DecodeError::BufferTruncated;

    out.clear();
    out.reserve(charCount);
    for (std::uint32_t i = 0; i < charCount; ++i) {
        out.push_back(static_cast<char16_t>(readU16(payload, o + i * 2)));
    }
    o += padded;
    return DecodeError::Ok;
}

void writeString(std::vector<std::uint8_t>& out, const std::u16string& s) {
    appendU32LE(out, static_cast<std::uint32_t>(s.size()));
    for (char16_t c : s) {
        appendU16LE(out, static_cast<std::uint16_t>(c));
    }
    while (out.size() % 4 != 0) {
        out.push_back(0);
    }
}

} // namespace

const char* toString(DecodeError error) {
    switch (error) {
        case DecodeError::Ok: return "ok";
        case DecodeError::BufferTruncated: return "buffer truncated";
        case DecodeError::PayloadSizeMismatch: return "payload size mismatch";
        case DecodeError::InvalidPayloadSize: return "invalid payload size";
        case DecodeError::TrailingBytes: return "trailing bytes";
    }
    return "unknown";
}

DecodeError decodePickle(const std::uint8_t* src, std::size_t byteCount, PickleContainer& out) {
    out.entries.clear();
    if (!src || byteCount < pickleHeaderBytes + pickleCountBytes) {
        return DecodeError::BufferTruncated;
    }

    const std::uint32_t payloadSize = readU32(src, 0);
    const std::size_t available = byteCount - pickleHeaderBytes;
    if (payloadSize > available) return DecodeError::BufferTruncated;
    if (payloadSize < available) return DecodeError::PayloadSizeMismatch;
    if (payloadSize % 4 != 0) return DecodeError::InvalidPayloadSize;

    const std::uint8_t* payload = src + pickleHeaderBytes;
    const std::size_t payloadBytes = payloadSize;
    std::size_t o = 0;

    const std::uint32_t entryCount = readU32(payload, o);
    o += 4;
    std::size_t minBytes = 0;
    if (!tryMul(static_cast<std::size_t>(entryCount), pickleMinEntryBytes, minBytes)) {
        return DecodeError::InvalidPayloadSize;
    }
    if (!requireBytes(o, minBytes, payloadBytes)) return DecodeError::BufferTruncated;

    std::vector<PickleEntry> entries;
    entries.reserve(entryCount);
    for (std::uint32_t i = 0; i < entryCount; ++i) {
        PickleEntry entry;
        DecodeError err = readString(payload, payloadBytes, o, entry.type);
        if (err != DecodeError::Ok) return err;
        err = readString(payload, payloadBytes, o, entry.value);
        if (err != DecodeError::Ok) return err;
        entries.push_back(std::move(entry));
    }
    if (o != payloadBytes) return DecodeError::TrailingBytes;

    out.entries = std::move(entries);
    return DecodeError::Ok;
}

std::vector<std::uint8_t> encodePickle(const PickleContainer& container) {
    std::vector<std::uint8_t> out;
    out.reserve(pickleHeaderBytes + pickleCountBytes + container.entries.size() * 64);
    appendU32LE(out, 0); // patched below
    appendU32LE(out, static_cast<std::uint32_t>(container.entries.size()));
    for (const auto& entry : container.entries) {
        writeString(out, entry.type);
        writeString(out, entry.value);
    }
    writeU32LE(out.data(), 0, static_cast<std::uint32_t>(out.size() - pickleHeaderBytes));
    return out;
}

const PickleEntry* findEntry(const PickleContainer& container, std::u16string_view type) {
    for (const auto& entry : container.entries) {
        if (entry.type == type) return &entry;
    }
    return nullptr;
}

void setEntry(PickleContainer& container, std::u16string_view type, std::u16string value) {
    for (auto& entry : container.entries) {
        if (entry.type == type) {
            entry.value = std::move(value);
            return;
        }
    }
    container.entries.push_back(PickleEntry{std::u16string(type), std::move(value)});
}

} // namespace redline::codec
