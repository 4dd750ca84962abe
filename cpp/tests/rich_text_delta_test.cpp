#include <gtest/gtest.h>
#include "redline/richtext/delta.h"

using namespace redline::richtext;

namespace {

RichTextDelta parsed(const std::string& json) {
    RichTextDelta delta;
    EXPECT_EQ(parseDelta(json, delta), DeltaError::Ok) << json;
    return delta;
}

} // namespace

// =============================================================================
// Parsing
// =============================================================================

TEST(RichTextDeltaTest, ParsesOpsEnvelope) {
    const auto delta = parsed(R"({"ops":[{"insert":"I saw "},{"insert":"teh","attributes":{"bold":true}},{"insert":" cat\n"}]})");
    ASSERT_EQ(delta.runs.size(), 3u);
    EXPECT_EQ(delta.envelope, DeltaEnvelope::OpsObject);
    EXPECT_EQ(delta.runs[1].text, "teh");
    EXPECT_EQ(std::get<bool>(delta.runs[1].attributes.at("bold")), true);
    EXPECT_EQ(plainText(delta), "I saw teh cat\n");
}

TEST(RichTextDeltaTest, ParsesBareArrayAndKeepsIt) {
    const auto delta = parsed(R"([{"insert":"hi"}])");
    EXPECT_EQ(delta.envelope, DeltaEnvelope::BareArray);
    EXPECT_EQ(serializeDelta(delta), R"([{"insert":"hi"}])");
}

TEST(RichTextDeltaTest, AttributeValueKinds) {
    const auto delta = parsed(R"({"ops":[{"insert":"x","attributes":{"b":false,"n":3,"link":"https://a.b"}}]})");
    const AttributeMap& attrs = delta.runs[0].attributes;
    EXPECT_EQ(std::get<bool>(attrs.at("b")), false);
    EXPECT_EQ(std::get<std::int64_t>(attrs.at("n")), 3);
    EXPECT_EQ(std::get<std::string>(attrs.at("link")), "https://a.b");
}

TEST(RichTextDeltaTest, EmbedsContributeNoText) {
    const auto delta = parsed(R"({"ops":[{"insert":"a"},{"insert":{"emoji":"smile"}},{"insert":"b"}]})");
    ASSERT_EQ(delta.runs.size(), 3u);
    EXPECT_TRUE(delta.runs[1].isEmbed());
    EXPECT_EQ(plainText(delta), "ab");
}

TEST(RichTextDeltaTest, RejectsMalformedInput) {
    RichTextDelta delta;
    EXPECT_EQ(parseDelta("{not json", delta), DeltaError::MalformedJson);
    EXPECT_EQ(parseDelta(R"({"foo":[]})", delta), DeltaError::NotAnOpsList);
    EXPECT_EQ(parseDelta(R"("text")", delta), DeltaError::NotAnOpsList);
    EXPECT_EQ(parseDelta(R"({"ops":[{"retain":3}]})", delta), DeltaError::UnsupportedOperation);
    EXPECT_EQ(parseDelta(R"({"ops":[{"delete":1}]})", delta), DeltaError::UnsupportedOperation);
    EXPECT_EQ(parseDelta(R"({"ops":[{"insert":5}]})", delta), DeltaError::InvalidInsert);
    EXPECT_EQ(parseDelta(R"({"ops":[{"insert":"x","attributes":{"c":[1]}}]})", delta), DeltaError::InvalidAttribute);
    EXPECT_TRUE(delta.runs.empty());
}

// =============================================================================
// Serialization
// =============================================================================

TEST(RichTextDeltaTest, SerializeOmitsEmptyAttributes) {
    RichTextDelta delta;
    delta.runs.push_back(RichTextRun{"plain", std::nullopt, {}});
    EXPECT_EQ(serializeDelta(delta), R"({"ops":[{"insert":"plain"}]})");
}

TEST(RichTextDeltaTest, SerializedDeltaParsesBackEqual) {
    const auto delta = parsed(
        R"({"ops":[{"insert":"Hi "},{"insert":{"user":"U1"}},{"insert":" there","attributes":{"italic":true,"size":2}}]})");
    EXPECT_EQ(parsed(serializeDelta(delta)), delta);
}

// =============================================================================
// Correction
// =============================================================================

TEST(RichTextDeltaTest, CorrectsInsideBoldRun) {
    const auto delta = parsed(R"({"ops":[{"insert":"I saw "},{"insert":"teh","attributes":{"bold":true}},{"insert":" cat\n"}]})");
    const CorrectionResult result = applyCorrection(delta, "teh", "the");
    ASSERT_EQ(result.status, CorrectionStatus::Ok);
    ASSERT_EQ(result.delta.runs.size(), 3u);
    EXPECT_EQ(result.delta.runs[1].text, "the");
    EXPECT_EQ(result.delta.runs[1].attributes, delta.runs[1].attributes);
    EXPECT_EQ(result.delta.runs[0], delta.runs[0]);
    EXPECT_EQ(result.delta.runs[2], delta.runs[2]);
    EXPECT_EQ(plainText(result.delta), "I saw the cat\n");
}

TEST(RichTextDeltaTest, SpanAcrossRunsIsRefused) {
    const auto delta = parsed(R"({"ops":[{"insert":"te"},{"insert":"h cat","attributes":{"bold":true}}]})");
    const CorrectionResult result = applyCorrection(delta, "teh", "the");
    EXPECT_EQ(result.status, CorrectionStatus::MultiRunSpan);
}

TEST(RichTextDeltaTest, SpanAroundEmbedIsRefused) {
    const auto delta = parsed(R"({"ops":[{"insert":"te"},{"insert":{"image":"a.png"}},{"insert":"h cat"}]})");
    const CorrectionResult result = applyCorrection(delta, "teh", "the");
    EXPECT_EQ(result.status, CorrectionStatus::EmbedInSpan);
    EXPECT_TRUE(result.delta.runs.empty());
}

TEST(RichTextDeltaTest, ExpectedOffsetPicksOccurrence) {
    const auto delta = parsed(R"({"ops":[{"insert":"teh "},{"insert":"teh","attributes":{"italic":true}}]})");
    const CorrectionResult result = applyCorrection(delta, "teh", "the", 4u);
    ASSERT_EQ(result.status, CorrectionStatus::Ok);
    EXPECT_EQ(result.delta.runs[0].text, "teh ");
    EXPECT_EQ(result.delta.runs[1].text, "the");

    EXPECT_EQ(applyCorrection(delta, "teh", "the", 2u).status, CorrectionStatus::NotFound);
}

TEST(RichTextDeltaTest, OffsetCountsUtf16Units) {
    // The emoji is two code units, so the error starts at offset 3.
    const auto delta = parsed("{\"ops\":[{\"insert\":\"\xF0\x9F\x98\x80 teh\"}]}");
    const CorrectionResult result = applyCorrection(delta, "teh", "the", 3u);
    ASSERT_EQ(result.status, CorrectionStatus::Ok);
    EXPECT_EQ(plainText(result.delta), "\xF0\x9F\x98\x80 the");
}

TEST(RichTextDeltaTest, CorrectionSkipsEmbeds) {
    const auto delta = parsed(R"({"ops":[{"insert":{"emoji":"x"}},{"insert":"teh"}]})");
    const CorrectionResult result = applyCorrection(delta, "teh", "the", 0u);
    ASSERT_EQ(result.status, CorrectionStatus::Ok);
    EXPECT_TRUE(result.delta.runs[0].isEmbed());
    EXPECT_EQ(result.delta.runs[1].text, "the");
}

TEST(RichTextDeltaTest, DeletingWholeRunRemovesIt) {
    const auto delta = parsed(R"({"ops":[{"insert":"a "},{"insert":"xx","attributes":{"bold":true}},{"insert":" b"}]})");
    const CorrectionResult result = applyCorrection(delta, "xx", "");
    ASSERT_EQ(result.status, CorrectionStatus::Ok);
    ASSERT_EQ(result.delta.runs.size(), 2u);
    EXPECT_EQ(plainText(result.delta), "a  b");
}

TEST(RichTextDeltaTest, MissingTextIsNotFound) {
    const auto delta = parsed(R"({"ops":[{"insert":"hello"}]})");
    EXPECT_EQ(applyCorrection(delta, "teh", "the").status, CorrectionStatus::NotFound);
    EXPECT_EQ(applyCorrection(delta, "", "the").status, CorrectionStatus::NotFound);
}

TEST(RichTextDeltaTest, NormalizeMergesEqualNeighbours) {
    const auto delta = parsed(
        R"({"ops":[{"insert":"a"},{"insert":"b"},{"insert":"c","attributes":{"bold":true}},{"insert":"d","attributes":{"bold":true}}]})");
    const RichTextDelta merged = normalize(delta);
    ASSERT_EQ(merged.runs.size(), 2u);
    EXPECT_EQ(merged.runs[0].text, "ab");
    EXPECT_EQ(merged.runs[1].text, "cd");
    EXPECT_EQ(plainText(merged), plainText(delta));
}
