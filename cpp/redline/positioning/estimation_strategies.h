#ifndef REDLINE_POSITIONING_ESTIMATION_STRATEGIES_H
#define REDLINE_POSITIONING_ESTIMATION_STRATEGIES_H

#include "redline/positioning/position_strategy.h"

namespace redline::positioning {

/**
 * Line geometry from the host plus a measured horizontal offset.
 *
 * Asks the host which line holds the range start, the range of that line and
 * its bounds, then measures the text between the line start and the error.
 * Without line bounds the line is placed from the element frame and the
 * configured line height, at lower confidence.
 */
class LineIndexStrategy : public PositionStrategy {
public:
    LineIndexStrategy(host::HostSurface& host, text::TextMeasurer& measurer)
        : host_(host)
        , measurer_(measurer) {}

    config::StrategyKind kind() const override { return config::StrategyKind::LineIndex; }
    GeometryResult resolve(const ResolveRequest& request) override;

private:
    host::HostSurface& host_;
    text::TextMeasurer& measurer_;
};

/**
 * Last resort: lays the text out inside the element frame with the host's
 * configured font. Issues no host queries.
 */
class FontMetricsStrategy : public PositionStrategy {
public:
    explicit FontMetricsStrategy(text::TextMeasurer& measurer) : measurer_(measurer) {}

    config::StrategyKind kind() const override { return config::StrategyKind::FontMetrics; }
    GeometryResult resolve(const ResolveRequest& request) override;

private:
    text::TextMeasurer& measurer_;
};

} // namespace redline::positioning

#endif // REDLINE_POSITIONING_ESTIMATION_STRATEGIES_H
