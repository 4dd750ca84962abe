#include "redline/text/grapheme_index.h"
#include "redline/core/logging.h"
#include "redline/core/string_utils.h"

#include <unicode/ubrk.h>
#include <unicode/utypes.h>

#include <algorithm>

namespace redline::text {

namespace {

struct BreakIteratorCloser {
    UBreakIterator* iter{nullptr};
    ~BreakIteratorCloser() {
        if (iter) ubrk_close(iter);
    }
};

} // namespace

std::optional<GraphemeIndex> GraphemeIndex::build(std::string_view utf8) {
    GraphemeIndex index;
    if (!utf8ToUtf16(utf8, index.utf16_)) {
        return std::nullopt;
    }
    if (index.utf16_.empty()) {
        return index;
    }

    UErrorCode status = U_ZERO_ERROR;
    BreakIteratorCloser closer;
    closer.iter = ubrk_open(
        UBRK_CHARACTER,
        "",
        reinterpret_cast<const UChar*>(index.utf16_.data()),
        static_cast<int32_t>(index.utf16_.size()),
        &status);
    if (U_FAILURE(status) || !closer.iter) {
        REDLINE_LOG_WARN("grapheme segmentation failed: %s", u_errorName(status));
        return std::nullopt;
    }

    index.boundaries_.clear();
    for (int32_t pos = ubrk_first(closer.iter); pos != UBRK_DONE; pos = ubrk_next(closer.iter)) {
        index.boundaries_.push_back(static_cast<std::uint32_t>(pos));
    }
    if (index.boundaries_.empty() || index.boundaries_.front() != 0
        || index.boundaries_.back() != index.utf16_.size()) {
        return std::nullopt;
    }
    return index;
}

std::optional<std::uint32_t> GraphemeIndex::codeUnitOffset(std::uint32_t grapheme) const {
    if (grapheme >= boundaries_.size()) return std::nullopt;
    return boundaries_[grapheme];
}

std::optional<std::uint32_t> GraphemeIndex::graphemeOffset(std::uint32_t codeUnit) const {
    auto it = std::lower_bound(boundaries_.begin(), boundaries_.end(), codeUnit);
    if (it == boundaries_.end() || *it != codeUnit) return std::nullopt;
    return static_cast<std::uint32_t>(it - boundaries_.begin());
}

std::optional<CodeUnitRange> GraphemeIndex::toCodeUnits(const GraphemeRange& range) const {
    if (range.end < range.start) return std::nullopt;
    const auto start = codeUnitOffset(range.start);
    const auto end = codeUnitOffset(range.end);
    if (!start || !end) return std::nullopt;
    return CodeUnitRange{*start, *end - *start};
}

std::optional<GraphemeRange> GraphemeIndex::toGraphemes(const CodeUnitRange& range) const {
    const auto start = graphemeOffset(range.start);
    const auto end = graphemeOffset(range.end());
    if (!start || !end) return std::nullopt;
    return GraphemeRange{*start, *end};
}

GraphemeRange GraphemeIndex::enclosingGraphemes(const CodeUnitRange& range) const {
    const std::uint32_t total = codeUnitCount();
    const std::uint32_t lo = std::min(range.start, total);
    const std::uint32_t hi = std::min(range.end(), total);

    // Last boundary <= lo, first boundary >= hi.
    auto startIt = std::upper_bound(boundaries_.begin(), boundaries_.end(), lo);
    const auto startIdx = static_cast<std::uint32_t>((startIt - boundaries_.begin()) - 1);
    auto endIt = std::lower_bound(boundaries_.begin(), boundaries_.end(), hi);
    const auto endIdx = static_cast<std::uint32_t>(endIt - boundaries_.begin());
    return GraphemeRange{startIdx, std::max(startIdx, endIdx)};
}

std::optional<CodeUnitRange> graphemeToCodeUnitRange(std::string_view text, const GraphemeRange& range) {
    const auto index = GraphemeIndex::build(text);
    if (!index) return std::nullopt;
    return index->toCodeUnits(range);
}

std::optional<GraphemeRange> codeUnitToGraphemeRange(std::string_view text, const CodeUnitRange& range) {
    const auto index = GraphemeIndex::build(text);
    if (!index) return std::nullopt;
    return index->toGraphemes(range);
}

std::optional<std::string> extractGraphemes(std::string_view text, const GraphemeRange& range) {
    const auto units = graphemeToCodeUnitRange(text, range);
    if (!units) return std::nullopt;
    return std::string(logicalSubstr(text, units->start, units->length));
}

std::optional<CodeUnitRange> toHostRange(const GraphemeIndex& index, const GraphemeRange& range, IndexUnit unit) {
    if (unit == IndexUnit::Grapheme) {
        if (range.end < range.start || range.end > index.graphemeCount()) return std::nullopt;
        return CodeUnitRange{range.start, range.end - range.start};
    }
    return index.toCodeUnits(range);
}

} // namespace redline::text
