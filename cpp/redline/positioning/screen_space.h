#ifndef REDLINE_POSITIONING_SCREEN_SPACE_H
#define REDLINE_POSITIONING_SCREEN_SPACE_H

#include "redline/config/host_profile.h"
#include "redline/core/types.h"
#include <cstdint>

namespace redline::positioning {

enum class Origin : std::uint8_t {
    TopLeft = 0,    // host device space
    BottomLeft = 1, // overlay presentation space
};

/**
 * Convert a rect between origins on a display of height `displayHeight`:
 * y' = displayHeight - y - h. Identity when both origins match.
 */
Rect screenSpaceConvert(const Rect& rect, Origin from, Origin to, float displayHeight);

/**
 * Sanity check for host-reported geometry: finite, positive and no larger
 * than the host's limits for a single error.
 */
bool validateBounds(const Rect& rect, const config::BoundsLimits& limits);

/**
 * True when `rect` lies inside `frame` grown by `tolerance` on every side.
 */
bool withinEditArea(const Rect& rect, const Rect& frame, float tolerance);

Rect unionRect(const Rect& a, const Rect& b);

} // namespace redline::positioning

#endif // REDLINE_POSITIONING_SCREEN_SPACE_H
