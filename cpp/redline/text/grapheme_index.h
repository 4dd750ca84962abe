#ifndef REDLINE_TEXT_GRAPHEME_INDEX_H
#define REDLINE_TEXT_GRAPHEME_INDEX_H

#include "redline/core/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redline::text {

/**
 * Index space a host's text APIs count in.
 */
enum class IndexUnit : std::uint8_t {
    Utf16CodeUnit = 0,
    Grapheme = 1,
};

/**
 * GraphemeIndex: grapheme cluster boundaries of one text snapshot, expressed
 * in UTF-16 code units.
 *
 * The analysis engine reports offsets in grapheme clusters while host text
 * APIs take code units. Every conversion between the two goes through this
 * table; a conversion that cannot be made exactly fails instead of guessing.
 */
class GraphemeIndex {
public:
    /**
     * Segment `utf8` into extended grapheme clusters.
     * @return The index, or std::nullopt for malformed UTF-8 or a segmenter failure
     */
    static std::optional<GraphemeIndex> build(std::string_view utf8);

    std::uint32_t graphemeCount() const { return static_cast<std::uint32_t>(boundaries_.size() - 1); }
    std::uint32_t codeUnitCount() const { return static_cast<std::uint32_t>(utf16_.size()); }
    const std::u16string& utf16() const { return utf16_; }

    /**
     * Code unit offset of grapheme boundary `grapheme` (0..graphemeCount()).
     */
    std::optional<std::uint32_t> codeUnitOffset(std::uint32_t grapheme) const;

    /**
     * Grapheme offset of `codeUnit`, only if it sits exactly on a boundary.
     */
    std::optional<std::uint32_t> graphemeOffset(std::uint32_t codeUnit) const;

    std::optional<CodeUnitRange> toCodeUnits(const GraphemeRange& range) const;
    std::optional<GraphemeRange> toGraphemes(const CodeUnitRange& range) const;

    /**
     * Smallest grapheme range covering `range`, clamped to the text. Used where
     * a host reports ranges that split clusters (attribute runs).
     */
    GraphemeRange enclosingGraphemes(const CodeUnitRange& range) const;

private:
    GraphemeIndex() = default;

    std::u16string utf16_;
    std::vector<std::uint32_t> boundaries_{0};
};

std::optional<CodeUnitRange> graphemeToCodeUnitRange(std::string_view text, const GraphemeRange& range);
std::optional<GraphemeRange> codeUnitToGraphemeRange(std::string_view text, const CodeUnitRange& range);

/**
 * UTF-8 text covered by `range`, or std::nullopt when out of bounds.
 */
std::optional<std::string> extractGraphemes(std::string_view text, const GraphemeRange& range);

/**
 * Translate a grapheme range into the host's index space.
 */
std::optional<CodeUnitRange> toHostRange(const GraphemeIndex& index, const GraphemeRange& range, IndexUnit unit);

} // namespace redline::text

#endif // REDLINE_TEXT_GRAPHEME_INDEX_H
