#ifndef REDLINE_POSITIONING_STRATEGY_CHAIN_H
#define REDLINE_POSITIONING_STRATEGY_CHAIN_H

#include "redline/positioning/position_strategy.h"
#include <memory>
#include <vector>

namespace redline::positioning {

/**
 * StrategyChain: ordered fallback over position strategies.
 *
 * Strategies run in order and the first acceptable result is returned as is;
 * results are never blended and later strategies are not invoked. A result
 * is acceptable when its confidence is usable, its rect passes
 * validateBounds() for the host, and it lies inside the element frame when
 * one is known. A strategy that throws counts as unavailable.
 */
class StrategyChain {
public:
    StrategyChain() = default;
    explicit StrategyChain(std::vector<std::unique_ptr<PositionStrategy>> strategies);

    void append(std::unique_ptr<PositionStrategy> strategy);

    GeometryResult resolve(const ResolveRequest& request) const;

    std::size_t size() const { return strategies_.size(); }
    bool empty() const { return strategies_.empty(); }
    std::vector<config::StrategyKind> kinds() const;

private:
    std::vector<std::unique_ptr<PositionStrategy>> strategies_;
};

std::unique_ptr<PositionStrategy> createStrategy(config::StrategyKind kind, StrategyDeps deps);

/**
 * Chain in the profile's strategy order.
 */
StrategyChain buildChain(const config::HostProfile& profile, StrategyDeps deps);

} // namespace redline::positioning

#endif // REDLINE_POSITIONING_STRATEGY_CHAIN_H
