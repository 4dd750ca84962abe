#include "redline/positioning/element_tree_strategy.h"
#include "redline/core/logging.h"
#include "redline/core/string_utils.h"
#include "redline/positioning/screen_space.h"
#include "redline/text/text_measurer.h"

#include <algorithm>

namespace redline::positioning {

namespace {

// Local code unit range in the host's index space for one part.
std::optional<CodeUnitRange> localHostRange(const ResolveRequest& request, const TextPart& part,
                                            const CodeUnitRange& local) {
    if (!request.profile || request.profile->indexUnit == text::IndexUnit::Utf16CodeUnit) {
        return local;
    }
    const auto index = text::GraphemeIndex::build(part.text);
    if (!index) return std::nullopt;
    const GraphemeRange g = index->enclosingGraphemes(local);
    return CodeUnitRange{g.start, g.length()};
}

} // namespace

GeometryResult ElementTreeStrategy::resolve(const ResolveRequest& request) {
    const TextPartMap map = TextPartMap::build(host_, request.element, request.text);
    const std::vector<const TextPart*> parts = map.overlapping(request.units);
    if (parts.empty()) {
        return GeometryResult::unavailable(kind(), "no text part covers range");
    }

    std::optional<Rect> merged;
    bool estimated = false;
    for (const TextPart* part : parts) {
        const std::uint32_t lo = std::max(part->range.start, request.units.start);
        const std::uint32_t hi = std::min(part->range.end(), request.units.end());
        const CodeUnitRange local{lo - part->range.start, hi - lo};

        std::optional<Rect> rect;
        if (const auto hostLocal = localHostRange(request, *part, local)) {
            const QueryResult<Rect> bounds = host_.queryBounds(part->element, *hostLocal);
            if (bounds && bounds->w > 0.0f && bounds->h > 0.0f) {
                rect = *bounds;
            }
        }
        if (!rect) {
            rect = estimateWithinPart(request, *part, local);
            estimated = true;
        }
        if (!rect) {
            return GeometryResult::unavailable(kind(), "text part has no usable geometry");
        }
        merged = merged ? unionRect(*merged, *rect) : *rect;
    }

    return GeometryResult::success(
        *merged, estimated ? kConfidenceElementEstimated : kConfidenceElementTree, kind());
}

std::optional<Rect> ElementTreeStrategy::estimateWithinPart(
    const ResolveRequest& request,
    const TextPart& part,
    const CodeUnitRange& local) {
    if (!request.profile || part.frame.w <= 0.0f || part.frame.h <= 0.0f) return std::nullopt;

    const text::MeasureStyle style = measureStyleFor(*request.profile);
    const float lineHeight = request.profile->font.lineHeight();
    const text::LineLocation start = measurer_.locate(part.text, local.start, style, part.frame.w);
    const text::LineLocation end = measurer_.locate(part.text, local.end(), style, part.frame.w);

    Rect rect;
    rect.y = part.frame.y + static_cast<float>(start.line) * lineHeight;
    rect.h = static_cast<float>(end.line - start.line + 1) * lineHeight;
    if (start.line == end.line) {
        rect.x = part.frame.x + start.x;
        rect.w = std::max(end.x - start.x, 1.0f);
    } else {
        rect.x = part.frame.x;
        rect.w = part.frame.w;
    }
    REDLINE_LOG_DEBUG("estimated part slice at %.1f,%.1f", rect.x, rect.y);
    return rect;
}

} // namespace redline::positioning
