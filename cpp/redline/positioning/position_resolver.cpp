#include "redline/positioning/position_resolver.h"
#include "redline/core/logging.h"
#include "redline/positioning/screen_space.h"
#include "redline/positioning/strategy_chain.h"
#include "redline/text/grapheme_index.h"

#include <exception>

namespace redline::positioning {

namespace {

ResolvedBounds unresolved(std::string reason) {
    ResolvedBounds out;
    out.reason = std::move(reason);
    return out;
}

// Host calls made outside the strategy chain; a throwing host reads as unavailable.
template <typename Fn>
auto queryOrUnavailable(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        REDLINE_LOG_WARN("host query threw: %s", e.what());
        return decltype(fn())::failure(QueryError::Unavailable);
    }
}

} // namespace

PositionResolver::PositionResolver(host::HostSurface& host, text::TextMeasurer& measurer)
    : host_(host)
    , measurer_(measurer) {
}

ResolvedBounds PositionResolver::resolve(
    const config::HostProfile& profile,
    host::ElementRef element,
    std::string_view text,
    const GraphemeRange& range,
    std::optional<Rect> elementFrame) {
    if (profile.strategies.empty()) {
        return unresolved("positioning disabled for host");
    }
    if (range.empty()) {
        return unresolved("empty range");
    }

    const auto index = text::GraphemeIndex::build(text);
    if (!index) {
        return unresolved("text is not valid UTF-8");
    }
    const auto units = index->toCodeUnits(range);
    const auto hostRange = text::toHostRange(*index, range, profile.indexUnit);
    if (!units || !hostRange) {
        return unresolved("range outside text");
    }

    if (!elementFrame) {
        const QueryResult<Rect> frame = queryOrUnavailable([&] { return host_.elementFrame(element); });
        if (frame) elementFrame = *frame;
    }

    ResolveRequest request;
    request.element = element;
    request.text = text;
    request.range = range;
    request.units = *units;
    request.hostRange = *hostRange;
    request.index = &*index;
    request.profile = &profile;
    request.elementFrame = elementFrame;

    const StrategyChain chain = buildChain(profile, StrategyDeps{host_, measurer_});
    const GeometryResult result = chain.resolve(request);
    if (!result.available) {
        return unresolved(result.reason);
    }

    const QueryResult<float> displayHeight = queryOrUnavailable([&] { return host_.displayHeight(); });
    if (!displayHeight) {
        REDLINE_LOG_WARN("display height unavailable: %s", toString(displayHeight.error));
        return unresolved("display height unavailable");
    }

    ResolvedBounds out;
    out.resolved = true;
    out.rect = screenSpaceConvert(result.bounds, Origin::TopLeft, Origin::BottomLeft, *displayHeight);
    out.confidence = result.confidence;
    out.source = result.source;
    return out;
}

} // namespace redline::positioning
