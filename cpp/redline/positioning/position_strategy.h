#ifndef REDLINE_POSITIONING_POSITION_STRATEGY_H
#define REDLINE_POSITIONING_POSITION_STRATEGY_H

#include "redline/config/host_profile.h"
#include "redline/core/types.h"
#include "redline/host/host_surface.h"
#include "redline/text/grapheme_index.h"
#include "redline/text/text_types.h"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace redline::text {
class TextMeasurer;
}

namespace redline::positioning {

constexpr double kConfidenceDirect = 0.95;
constexpr double kConfidenceElementTree = 0.90;
constexpr double kConfidenceElementEstimated = 0.85;
constexpr double kConfidenceLineMeasured = 0.85;
constexpr double kConfidenceLineEstimated = 0.75;
constexpr double kConfidenceFontMetrics = 0.60;
constexpr double kMinimumUsableConfidence = 0.50;

// Narrowest underline an estimate may produce.
constexpr float kMinimumEstimatedWidth = 20.0f;

struct GeometryResult {
    bool available{false};
    Rect bounds;
    double confidence{0.0};
    config::StrategyKind source{config::StrategyKind::RangeBounds};
    std::string reason;

    static GeometryResult success(const Rect& bounds, double confidence, config::StrategyKind source) {
        GeometryResult r;
        r.available = true;
        r.bounds = bounds;
        r.confidence = confidence;
        r.source = source;
        return r;
    }
    static GeometryResult unavailable(config::StrategyKind source, std::string reason) {
        GeometryResult r;
        r.source = source;
        r.reason = std::move(reason);
        return r;
    }
};

/**
 * One resolution attempt. `units` is always UTF-16 code units into `text`;
 * `hostRange` is the same range in the host's index space.
 */
struct ResolveRequest {
    host::ElementRef element;
    std::string_view text;
    GraphemeRange range;
    CodeUnitRange units;
    CodeUnitRange hostRange;
    const text::GraphemeIndex* index{nullptr};
    const config::HostProfile* profile{nullptr};
    // Frame of the editable element, when known. Lets estimates anchor
    // without another tree query.
    std::optional<Rect> elementFrame;
};

struct StrategyDeps {
    host::HostSurface& host;
    text::TextMeasurer& measurer;
};

/**
 * PositionStrategy: one technique for mapping a text range to device-space
 * geometry. Implementations report Unavailable instead of guessing.
 */
class PositionStrategy {
public:
    virtual ~PositionStrategy() = default;
    virtual config::StrategyKind kind() const = 0;
    virtual GeometryResult resolve(const ResolveRequest& request) = 0;
};

text::MeasureStyle measureStyleFor(const config::HostProfile& profile);

/**
 * Convert a host-space offset back to UTF-16 code units.
 */
std::optional<std::uint32_t> hostOffsetToCodeUnit(const ResolveRequest& request, std::uint32_t hostOffset);

} // namespace redline::positioning

#endif // REDLINE_POSITIONING_POSITION_STRATEGY_H
