#ifndef REDLINE_POSITIONING_POSITION_RESOLVER_H
#define REDLINE_POSITIONING_POSITION_RESOLVER_H

#include "redline/config/host_profile.h"
#include "redline/core/types.h"
#include "redline/host/host_surface.h"
#include "redline/positioning/position_strategy.h"
#include <optional>
#include <string>
#include <string_view>

namespace redline::text {
class TextMeasurer;
}

namespace redline::positioning {

/**
 * Overlay-space result of resolving one error span. `rect` has a bottom-left
 * origin. When `resolved` is false, `reason` says why.
 */
struct ResolvedBounds {
    bool resolved{false};
    Rect rect;
    double confidence{0.0};
    config::StrategyKind source{config::StrategyKind::RangeBounds};
    std::string reason;
};

/**
 * PositionResolver: the renderer's entry point. Converts the grapheme range
 * of a text snapshot into host ranges, runs the host's strategy chain and
 * flips the winning rect into overlay space. Nothing is cached; geometry is
 * recomputed on every call.
 */
class PositionResolver {
public:
    PositionResolver(host::HostSurface& host, text::TextMeasurer& measurer);

    /**
     * @param elementFrame Frame of the element when already known; queried otherwise
     */
    ResolvedBounds resolve(
        const config::HostProfile& profile,
        host::ElementRef element,
        std::string_view text,
        const GraphemeRange& range,
        std::optional<Rect> elementFrame = std::nullopt);

private:
    host::HostSurface& host_;
    text::TextMeasurer& measurer_;
};

} // namespace redline::positioning

#endif // REDLINE_POSITIONING_POSITION_RESOLVER_H
