#ifndef REDLINE_POSITIONING_ELEMENT_TREE_STRATEGY_H
#define REDLINE_POSITIONING_ELEMENT_TREE_STRATEGY_H

#include "redline/positioning/position_strategy.h"
#include "redline/positioning/text_part_map.h"

namespace redline::positioning {

/**
 * Resolves against the child elements that own the text.
 *
 * Chromium-based hosts often return a zero-size rect for range queries on
 * the root but answer correctly when the same query is issued to the leaf
 * element holding the characters. A range that spans several leaves (for
 * example across a paragraph break) resolves to the union of their rects.
 * When a leaf refuses the query its slice is estimated inside the leaf frame.
 */
class ElementTreeStrategy : public PositionStrategy {
public:
    ElementTreeStrategy(host::HostSurface& host, text::TextMeasurer& measurer)
        : host_(host)
        , measurer_(measurer) {}

    config::StrategyKind kind() const override { return config::StrategyKind::ElementTree; }
    GeometryResult resolve(const ResolveRequest& request) override;

private:
    std::optional<Rect> estimateWithinPart(const ResolveRequest& request, const TextPart& part,
                                           const CodeUnitRange& local);

    host::HostSurface& host_;
    text::TextMeasurer& measurer_;
};

} // namespace redline::positioning

#endif // REDLINE_POSITIONING_ELEMENT_TREE_STRATEGY_H
