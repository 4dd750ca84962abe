#include "redline/positioning/estimation_strategies.h"
#include "redline/core/string_utils.h"
#include "redline/text/text_measurer.h"

#include <algorithm>

namespace redline::positioning {

using config::StrategyKind;

GeometryResult LineIndexStrategy::resolve(const ResolveRequest& request) {
    if (!request.profile) return GeometryResult::unavailable(kind(), "no host profile");

    const auto line = host_.lineForIndex(request.element, request.hostRange.start);
    if (!line) {
        return GeometryResult::unavailable(kind(), std::string("line for index: ") + toString(line.error));
    }
    const auto lineRange = host_.rangeForLine(request.element, *line);
    if (!lineRange) {
        return GeometryResult::unavailable(kind(), std::string("range for line: ") + toString(lineRange.error));
    }
    const auto lineStart = hostOffsetToCodeUnit(request, lineRange->start);
    if (!lineStart || *lineStart > request.units.start) {
        return GeometryResult::unavailable(kind(), "line does not contain range start");
    }

    const float lineHeight = request.profile->font.lineHeight();
    Rect lineBounds;
    bool estimated = false;
    const QueryResult<Rect> measured = host_.queryBounds(request.element, *lineRange);
    if (measured && measured->w > 0.0f && measured->h > 0.0f) {
        lineBounds = *measured;
    } else if (request.elementFrame) {
        lineBounds = Rect{request.elementFrame->x,
                          request.elementFrame->y + static_cast<float>(*line) * lineHeight,
                          request.elementFrame->w,
                          lineHeight};
        estimated = true;
    } else {
        return GeometryResult::unavailable(kind(), "no line geometry");
    }

    const text::MeasureStyle style = measureStyleFor(*request.profile);
    const std::string_view prefix = logicalSubstr(request.text, *lineStart, request.units.start - *lineStart);
    const std::string_view errorText = logicalSubstr(request.text, request.units.start, request.units.length);

    Rect rect;
    rect.x = lineBounds.x + measurer_.measure(prefix, style);
    rect.y = lineBounds.y;
    rect.w = std::max(measurer_.measure(errorText, style), kMinimumEstimatedWidth);
    rect.h = lineBounds.h;
    return GeometryResult::success(rect, estimated ? kConfidenceLineEstimated : kConfidenceLineMeasured, kind());
}

GeometryResult FontMetricsStrategy::resolve(const ResolveRequest& request) {
    if (!request.profile) return GeometryResult::unavailable(kind(), "no host profile");
    if (!request.elementFrame || request.elementFrame->w <= 0.0f) {
        return GeometryResult::unavailable(kind(), "no element frame");
    }

    const Rect& frame = *request.elementFrame;
    const text::MeasureStyle style = measureStyleFor(*request.profile);
    const float lineHeight = request.profile->font.lineHeight();
    const text::LineLocation start = measurer_.locate(request.text, request.units.start, style, frame.w);
    const text::LineLocation end = measurer_.locate(request.text, request.units.end(), style, frame.w);

    Rect rect;
    rect.y = frame.y + static_cast<float>(start.line) * lineHeight;
    if (start.line == end.line) {
        rect.x = frame.x + start.x;
        rect.w = std::max(end.x - start.x, 1.0f);
        rect.h = lineHeight;
    } else {
        // Wrapped error: cover the full width of every line it touches.
        rect.x = frame.x;
        rect.w = frame.w;
        rect.h = static_cast<float>(end.line - start.line + 1) * lineHeight;
    }
    return GeometryResult::success(rect, kConfidenceFontMetrics, kind());
}

} // namespace redline::positioning
