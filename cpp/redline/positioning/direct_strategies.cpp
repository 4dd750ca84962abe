#include "redline/positioning/direct_strategies.h"

namespace redline::positioning {

using config::StrategyKind;

GeometryResult RangeBoundsStrategy::resolve(const ResolveRequest& request) {
    const QueryResult<Rect> bounds = host_.queryBounds(request.element, request.hostRange);
    if (!bounds) {
        return GeometryResult::unavailable(kind(), std::string("bounds query: ") + toString(bounds.error));
    }
    // Many hosts answer with a zero-size rect instead of failing.
    if (bounds->w <= 0.0f || bounds->h <= 0.0f) {
        return GeometryResult::unavailable(kind(), "degenerate rect");
    }
    return GeometryResult::success(*bounds, kConfidenceDirect, kind());
}

GeometryResult TextMarkerStrategy::resolve(const ResolveRequest& request) {
    const auto start = host_.markerForIndex(request.element, request.hostRange.start);
    if (!start) {
        return GeometryResult::unavailable(kind(), std::string("start marker: ") + toString(start.error));
    }
    const auto end = host_.markerForIndex(request.element, request.hostRange.end());
    if (!end) {
        return GeometryResult::unavailable(kind(), std::string("end marker: ") + toString(end.error));
    }
    const QueryResult<Rect> bounds = host_.boundsForMarkers(request.element, *start, *end);
    if (!bounds) {
        return GeometryResult::unavailable(kind(), std::string("marker bounds: ") + toString(bounds.error));
    }
    if (bounds->w <= 0.0f || bounds->h <= 0.0f) {
        return GeometryResult::unavailable(kind(), "degenerate rect");
    }
    return GeometryResult::success(*bounds, kConfidenceDirect, kind());
}

} // namespace redline::positioning
