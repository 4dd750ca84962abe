#include "redline/positioning/strategy_chain.h"
#include "redline/core/logging.h"
#include "redline/positioning/direct_strategies.h"
#include "redline/positioning/element_tree_strategy.h"
#include "redline/positioning/estimation_strategies.h"
#include "redline/positioning/screen_space.h"

#include <exception>

namespace redline::positioning {

using config::StrategyKind;

StrategyChain::StrategyChain(std::vector<std::unique_ptr<PositionStrategy>> strategies)
    : strategies_(std::move(strategies)) {
}

void StrategyChain::append(std::unique_ptr<PositionStrategy> strategy) {
    if (strategy) strategies_.push_back(std::move(strategy));
}

std::vector<StrategyKind> StrategyChain::kinds() const {
    std::vector<StrategyKind> out;
    out.reserve(strategies_.size());
    for (const auto& s : strategies_) out.push_back(s->kind());
    return out;
}

GeometryResult StrategyChain::resolve(const ResolveRequest& request) const {
    GeometryResult last = GeometryResult::unavailable(StrategyKind::RangeBounds, "no strategies configured");
    const config::BoundsLimits limits = request.profile ? request.profile->bounds : config::BoundsLimits{};

    for (const auto& strategy : strategies_) {
        GeometryResult result;
        try {
            result = strategy->resolve(request);
        } catch (const std::exception& e) {
            REDLINE_LOG_WARN("strategy %s threw: %s", config::toString(strategy->kind()), e.what());
            last = GeometryResult::unavailable(strategy->kind(), std::string("threw: ") + e.what());
            continue;
        }

        if (result.available) {
            if (result.confidence < kMinimumUsableConfidence) {
                result = GeometryResult::unavailable(strategy->kind(), "confidence below minimum");
            } else if (!validateBounds(result.bounds, limits)) {
                result = GeometryResult::unavailable(strategy->kind(), "bounds failed validation");
            } else if (request.elementFrame
                       && !withinEditArea(result.bounds, *request.elementFrame, limits.editAreaTolerance)) {
                result = GeometryResult::unavailable(strategy->kind(), "bounds outside edit area");
            }
        }
        if (result.available) {
            REDLINE_LOG_DEBUG("resolved with %s (confidence %.2f)", config::toString(result.source), result.confidence);
            return result;
        }
        REDLINE_LOG_DEBUG("strategy %s unavailable: %s", config::toString(strategy->kind()), result.reason.c_str());
        last = std::move(result);
    }
    return last;
}

std::unique_ptr<PositionStrategy> createStrategy(StrategyKind kind, StrategyDeps deps) {
    switch (kind) {
        case StrategyKind::RangeBounds: return std::make_unique<RangeBoundsStrategy>(deps.host);
        case StrategyKind::ElementTree: return std::make_unique<ElementTreeStrategy>(deps.host, deps.measurer);
        case StrategyKind::TextMarker: return std::make_unique<TextMarkerStrategy>(deps.host);
        case StrategyKind::LineIndex: return std::make_unique<LineIndexStrategy>(deps.host, deps.measurer);
        case StrategyKind::FontMetrics: return std::make_unique<FontMetricsStrategy>(deps.measurer);
    }
    return nullptr;
}

StrategyChain buildChain(const config::HostProfile& profile, StrategyDeps deps) {
    StrategyChain chain;
    for (StrategyKind kind : profile.strategies) {
        chain.append(createStrategy(kind, deps));
    }
    return chain;
}

} // namespace redline::positioning
