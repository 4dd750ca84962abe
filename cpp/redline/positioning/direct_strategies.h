#ifndef REDLINE_POSITIONING_DIRECT_STRATEGIES_H
#define REDLINE_POSITIONING_DIRECT_STRATEGIES_H

#include "redline/positioning/position_strategy.h"

namespace redline::positioning {

/**
 * Bounds for the range asked of the root element directly.
 */
class RangeBoundsStrategy : public PositionStrategy {
public:
    explicit RangeBoundsStrategy(host::HostSurface& host) : host_(host) {}

    config::StrategyKind kind() const override { return config::StrategyKind::RangeBounds; }
    GeometryResult resolve(const ResolveRequest& request) override;

private:
    host::HostSurface& host_;
};

/**
 * Bounds between two host position markers built for the range ends.
 */
class TextMarkerStrategy : public PositionStrategy {
public:
    explicit TextMarkerStrategy(host::HostSurface& host) : host_(host) {}

    config::StrategyKind kind() const override { return config::StrategyKind::TextMarker; }
    GeometryResult resolve(const ResolveRequest& request) override;

private:
    host::HostSurface& host_;
};

} // namespace redline::positioning

#endif // REDLINE_POSITIONING_DIRECT_STRATEGIES_H
