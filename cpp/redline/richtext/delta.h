#ifndef REDLINE_RICHTEXT_DELTA_H
#define REDLINE_RICHTEXT_DELTA_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace redline::richtext {

using AttributeValue = std::variant<bool, std::int64_t, std::string>;
using AttributeMap = std::map<std::string, AttributeValue>;

/**
 * One insert operation of a document delta: either UTF-8 text or an embedded
 * object (kept as its compact JSON text), plus its formatting attributes.
 */
struct RichTextRun {
    std::string text;
    std::optional<std::string> embed;
    AttributeMap attributes;

    bool isEmbed() const { return embed.has_value(); }
    bool operator==(const RichTextRun& o) const {
        return text == o.text && embed == o.embed && attributes == o.attributes;
    }
    bool operator!=(const RichTextRun& o) const { return !(*this == o); }
};

// Outer JSON shape the delta arrived in, kept so serialize mirrors the host.
enum class DeltaEnvelope : std::uint8_t {
    OpsObject = 0, // {"ops":[...]}
    BareArray = 1, // [...]
};

struct RichTextDelta {
    std::vector<RichTextRun> runs;
    DeltaEnvelope envelope{DeltaEnvelope::OpsObject};

    bool operator==(const RichTextDelta& o) const { return runs == o.runs && envelope == o.envelope; }
    bool operator!=(const RichTextDelta& o) const { return !(*this == o); }
};

enum class DeltaError : std::uint32_t {
    Ok = 0,
    MalformedJson = 1,
    NotAnOpsList = 2,
    UnsupportedOperation = 3,
    InvalidInsert = 4,
    InvalidAttribute = 5,
};

enum class CorrectionStatus : std::uint32_t {
    Ok = 0,
    NotFound = 1,
    MultiRunSpan = 2,
    EmbedInSpan = 3,
};

const char* toString(DeltaError error);
const char* toString(CorrectionStatus status);

struct CorrectionResult {
    CorrectionStatus status{CorrectionStatus::NotFound};
    RichTextDelta delta;
};

/**
 * Parse a document delta. Only insert operations are accepted; retain and
 * delete belong to change deltas and are rejected.
 */
DeltaError parseDelta(std::string_view json, RichTextDelta& out);

/**
 * Serialize back to JSON in the envelope the delta was parsed from.
 */
std::string serializeDelta(const RichTextDelta& delta);

/**
 * Concatenated text of all text runs. Embeds contribute nothing.
 */
std::string plainText(const RichTextDelta& delta);

/**
 * Replace `errorText` with `suggestion` inside the single run that holds it.
 *
 * @param expectedOffset Offset of the match in UTF-16 code units of plainText();
 *        when absent the first occurrence is used
 * @return Ok with the corrected delta, NotFound when the text is not at the
 *         expected place, or MultiRunSpan when the match crosses a run boundary.
 *         Attributes are never merged across runs.
 */
CorrectionResult applyCorrection(
    const RichTextDelta& delta,
    std::string_view errorText,
    std::string_view suggestion,
    std::optional<std::uint32_t> expectedOffset = std::nullopt);

/**
 * Merge neighbouring text runs whose attributes are identical.
 */
RichTextDelta normalize(const RichTextDelta& delta);

} // namespace redline::richtext

#endif // REDLINE_RICHTEXT_DELTA_H
