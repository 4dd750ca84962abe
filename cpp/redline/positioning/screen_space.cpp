#include "redline/positioning/screen_space.h"

#include <algorithm>
#include <cmath>

namespace redline::positioning {

Rect screenSpaceConvert(const Rect& rect, Origin from, Origin to, float displayHeight) {
    if (from == to) return rect;
    Rect out = rect;
    out.y = displayHeight - rect.y - rect.h;
    return out;
}

bool validateBounds(const Rect& rect, const config::BoundsLimits& limits) {
    if (!std::isfinite(rect.x) || !std::isfinite(rect.y) || !std::isfinite(rect.w) || !std::isfinite(rect.h)) {
        return false;
    }
    if (rect.w <= 0.0f || rect.h <= 0.0f) return false;
    return rect.w <= limits.maxWidth && rect.h <= limits.maxHeight;
}

bool withinEditArea(const Rect& rect, const Rect& frame, float tolerance) {
    return rect.x >= frame.x - tolerance
        && rect.y >= frame.y - tolerance
        && rect.maxX() <= frame.maxX() + tolerance
        && rect.maxY() <= frame.maxY() + tolerance;
}

Rect unionRect(const Rect& a, const Rect& b) {
    const float minX = std::min(a.x, b.x);
    const float minY = std::min(a.y, b.y);
    const float maxX = std::max(a.maxX(), b.maxX());
    const float maxY = std::max(a.maxY(), b.maxY());
    return Rect{minX, minY, maxX - minX, maxY - minY};
}

} // namespace redline::positioning
