#include <gtest/gtest.h>
#include "redline/codec/pickle.h"
#include "redline/core/string_utils.h"

#include <cstring>
#include <vector>

using namespace redline;
using namespace redline::codec;

namespace {

void put32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
}

void putString(std::vector<std::uint8_t>& out, const std::u16string& s) {
    put32(out, static_cast<std::uint32_t>(s.size()));
    for (char16_t c : s) {
        out.push_back(static_cast<std::uint8_t>(c & 0xFF));
        out.push_back(static_cast<std::uint8_t>(c >> 8));
    }
    while (out.size() % 4 != 0) out.push_back(0);
}

// Hand-built pickle with the payload size filled in.
std::vector<std::uint8_t> pickleOf(const std::vector<std::pair<std::u16string, std::u16string>>& entries) {
    std::vector<std::uint8_t> body;
    put32(body, static_cast<std::uint32_t>(entries.size()));
    for (const auto& [type, value] : entries) {
        putString(body, type);
        putString(body, value);
    }
    std::vector<std::uint8_t> out;
    put32(out, static_cast<std::uint32_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

} // namespace

// =============================================================================
// Decoding
// =============================================================================

TEST(PickleCodecTest, DecodesSingleDeltaEntry) {
    const std::u16string delta = u"{\"ops\":[{\"insert\":\"teh\"}]}";
    const auto bytes = pickleOf({{u"slack/texty", delta}});

    PickleContainer c;
    ASSERT_EQ(decodePickle(bytes.data(), bytes.size(), c), DecodeError::Ok);
    ASSERT_EQ(c.entries.size(), 1u);
    EXPECT_EQ(c.entries[0].type, u"slack/texty");
    EXPECT_EQ(c.entries[0].value, delta);
}

TEST(PickleCodecTest, LengthCountsCodeUnitsNotBytes) {
    // Odd code unit count forces two bytes of padding.
    const auto bytes = pickleOf({{u"a", u"xéz"}});
    // header 8 + type (4 + 2 + 2 pad) + value (4 + 6 + 2 pad)
    EXPECT_EQ(bytes.size(), 28u);

    PickleContainer c;
    ASSERT_EQ(decodePickle(bytes.data(), bytes.size(), c), DecodeError::Ok);
    EXPECT_EQ(c.entries[0].value, u"xéz");
}

TEST(PickleCodecTest, SurrogatePairsSurvive) {
    const std::u16string emoji = utf8ToUtf16(std::string_view("\xF0\x9F\x98\x80!"));
    const auto bytes = pickleOf({{u"t", emoji}});
    PickleContainer c;
    ASSERT_EQ(decodePickle(bytes.data(), bytes.size(), c), DecodeError::Ok);
    EXPECT_EQ(c.entries[0].value, emoji);
}

TEST(PickleCodecTest, HeaderIsLittleEndianOnAnyHost) {
    // One entry "a" -> "b": payload is 4 + (4 + 2 + pad 2) * 2 = 20 bytes.
    const std::vector<std::uint8_t> bytes = {
        0x14, 0x00, 0x00, 0x00,
        0x01, 0x00, 0x00, 0x00,
        0x01, 0x00, 0x00, 0x00, 'a', 0x00, 0x00, 0x00,
        0x01, 0x00, 0x00, 0x00, 'b', 0x00, 0x00, 0x00,
    };
    PickleContainer c;
    ASSERT_EQ(decodePickle(bytes.data(), bytes.size(), c), DecodeError::Ok);
    ASSERT_EQ(c.entries.size(), 1u);
    EXPECT_EQ(c.entries[0].type, u"a");
    EXPECT_EQ(c.entries[0].value, u"b");
    EXPECT_EQ(encodePickle(c), bytes);
}

TEST(PickleCodecTest, EmptyContainer) {
    const auto bytes = pickleOf({});
    PickleContainer c;
    ASSERT_EQ(decodePickle(bytes.data(), bytes.size(), c), DecodeError::Ok);
    EXPECT_TRUE(c.entries.empty());
}

TEST(PickleCodecTest, TruncatedHeader) {
    const std::uint8_t bytes[3] = {4, 0, 0};
    PickleContainer c;
    EXPECT_EQ(decodePickle(bytes, sizeof(bytes), c), DecodeError::BufferTruncated);
    EXPECT_EQ(decodePickle(nullptr, 0, c), DecodeError::BufferTruncated);
}

TEST(PickleCodecTest, PayloadLargerThanBuffer) {
    auto bytes = pickleOf({{u"a", u"b"}});
    bytes.resize(bytes.size() - 4);
    PickleContainer c;
    EXPECT_EQ(decodePickle(bytes.data(), bytes.size(), c), DecodeError::BufferTruncated);
    EXPECT_TRUE(c.entries.empty());
}

TEST(PickleCodecTest, PayloadSmallerThanBuffer) {
    auto bytes = pickleOf({{u"a", u"b"}});
    bytes.insert(bytes.end(), 4, 0);
    PickleContainer c;
    EXPECT_EQ(decodePickle(bytes.data(), bytes.size(), c), DecodeError::PayloadSizeMismatch);
}

TEST(PickleCodecTest, StringLengthPastEnd) {
    std::vector<std::uint8_t> body;
    put32(body, 1);
    put32(body, 1000); // type claims 1000 code units
    put32(body, 0);
    std::vector<std::uint8_t> bytes;
    put32(bytes, static_cast<std::uint32_t>(body.size()));
    bytes.insert(bytes.end(), body.begin(), body.end());

    PickleContainer c;
    EXPECT_NE(decodePickle(bytes.data(), bytes.size(), c), DecodeError::Ok);
    EXPECT_TRUE(c.entries.empty());
}

TEST(PickleCodecTest, HugeCharCountDoesNotOverflow) {
    std::vector<std::uint8_t> body;
    put32(body, 1);
    put32(body, 0xFFFFFFFFu);
    std::vector<std::uint8_t> bytes;
    put32(bytes, static_cast<std::uint32_t>(body.size()));
    bytes.insert(bytes.end(), body.begin(), body.end());

    PickleContainer c;
    EXPECT_NE(decodePickle(bytes.data(), bytes.size(), c), DecodeError::Ok);
}

TEST(PickleCodecTest, EntryCountBeyondData) {
    std::vector<std::uint8_t> body;
    put32(body, 3);
    putString(body, u"a");
    putString(body, u"b");
    std::vector<std::uint8_t> bytes;
    put32(bytes, static_cast<std::uint32_t>(body.size()));
    bytes.insert(bytes.end(), body.begin(), body.end());

    PickleContainer c;
    EXPECT_NE(decodePickle(bytes.data(), bytes.size(), c), DecodeError::Ok);
}

TEST(PickleCodecTest, BytesAfterLastEntry) {
    std::vector<std::uint8_t> body;
    put32(body, 1);
    putString(body, u"a");
    putString(body, u"b");
    put32(body, 0xDEADBEEF);
    std::vector<std::uint8_t> bytes;
    put32(bytes, static_cast<std::uint32_t>(body.size()));
    bytes.insert(bytes.end(), body.begin(), body.end());

    PickleContainer c;
    EXPECT_EQ(decodePickle(bytes.data(), bytes.size(), c), DecodeError::TrailingBytes);
}

// =============================================================================
// Encoding
// =============================================================================

TEST(PickleCodecTest, EncodeMatchesHandBuiltLayout) {
    PickleContainer c;
    c.entries.push_back({u"slack/texty", u"{}"});
    c.entries.push_back({u"text/plain", u"the"});
    EXPECT_EQ(encodePickle(c), pickleOf({{u"slack/texty", u"{}"}, {u"text/plain", u"the"}}));
}

TEST(PickleCodecTest, SetEntryReplacesOrAppends) {
    PickleContainer c;
    c.entries.push_back({u"a", u"1"});
    c.entries.push_back({u"b", u"2"});
    setEntry(c, u"a", u"one");
    setEntry(c, u"c", u"3");
    ASSERT_EQ(c.entries.size(), 3u);
    EXPECT_EQ(c.entries[0].value, u"one");
    EXPECT_EQ(c.entries[1].value, u"2");
    ASSERT_NE(findEntry(c, u"c"), nullptr);
    EXPECT_EQ(findEntry(c, u"c")->value, u"3");
    EXPECT_EQ(findEntry(c, u"z"), nullptr);
}

TEST(PickleCodecTest, ReencodedContainerDecodesUnchanged) {
    PickleContainer c;
    c.entries.push_back({u"slack/texty", u"{\"ops\":[{\"insert\":\"the\"}]}"});
    c.entries.push_back({u"", u"odd"});
    const auto bytes = encodePickle(c);
    PickleContainer back;
    ASSERT_EQ(decodePickle(bytes.data(), bytes.size(), back), DecodeError::Ok);
    EXPECT_EQ(back, c);
}
