#include <gtest/gtest.h>
#include "fake_host_surface.h"
#include "redline/positioning/direct_strategies.h"
#include "redline/positioning/element_tree_strategy.h"
#include "redline/positioning/estimation_strategies.h"
#include "redline/positioning/strategy_chain.h"
#include "redline/text/font_manager.h"
#include "redline/text/text_measurer.h"

#include <memory>
#include <stdexcept>

using namespace redline;
using namespace redline::positioning;
using redline::config::HostCategory;
using redline::config::StrategyKind;
using redline::host::ChildElement;
using redline::host::ElementRef;
using redline::host::ElementRole;
using redline::test::FakeHostSurface;

namespace {

class StubStrategy : public PositionStrategy {
public:
    StubStrategy(StrategyKind kind, GeometryResult result, bool throws = false)
        : kind_(kind)
        , result_(std::move(result))
        , throws_(throws) {}

    StrategyKind kind() const override { return kind_; }
    GeometryResult resolve(const ResolveRequest&) override {
        ++calls;
        if (throws_) throw std::runtime_error("host went away");
        return result_;
    }

    int calls{0};

private:
    StrategyKind kind_;
    GeometryResult result_;
    bool throws_;
};

} // namespace

// =============================================================================
// Fixture
// =============================================================================

class StrategyChainTest : public ::testing::Test {
protected:
    FakeHostSurface host;
    text::FontManager fonts;
    text::TextMeasurer measurer{fonts};
    config::HostProfile profile = config::defaultProfile(HostCategory::Custom);
    std::optional<text::GraphemeIndex> index;
    ResolveRequest request;

    void SetUp() override {
        // No font is loaded, so widths are 5pt per grapheme.
        profile.font.size = 10.0f;
        profile.font.averageAdvanceRatio = 0.5f;
        profile.font.lineHeightMultiplier = 1.2f;
        host.text = "I saw teh cat";
        prepare(host.text, GraphemeRange{6, 9});
    }

    void prepare(const std::string& text, const GraphemeRange& range) {
        host.text = text;
        index = text::GraphemeIndex::build(host.text);
        ASSERT_TRUE(index.has_value());
        request = ResolveRequest{};
        request.element = ElementRef{1};
        request.text = host.text;
        request.range = range;
        request.units = *index->toCodeUnits(range);
        request.hostRange = *text::toHostRange(*index, range, profile.indexUnit);
        request.index = &*index;
        request.profile = &profile;
        request.elementFrame = Rect{100.0f, 200.0f, 400.0f, 120.0f};
    }

    StubStrategy* add(StrategyChain& chain, StrategyKind kind, GeometryResult result, bool throws = false) {
        auto stub = std::make_unique<StubStrategy>(kind, std::move(result), throws);
        StubStrategy* raw = stub.get();
        chain.append(std::move(stub));
        return raw;
    }
};

// =============================================================================
// Chain semantics
// =============================================================================

TEST_F(StrategyChainTest, FirstAcceptableResultWins) {
    StrategyChain chain;
    auto* first = add(chain, StrategyKind::RangeBounds, GeometryResult::unavailable(StrategyKind::RangeBounds, "nope"));
    auto* second = add(chain, StrategyKind::TextMarker,
                       GeometryResult::success(Rect{120, 210, 30, 16}, kConfidenceDirect, StrategyKind::TextMarker));
    auto* third = add(chain, StrategyKind::FontMetrics,
                      GeometryResult::success(Rect{0, 0, 1, 1}, kConfidenceFontMetrics, StrategyKind::FontMetrics));

    const GeometryResult result = chain.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_EQ(result.source, StrategyKind::TextMarker);
    EXPECT_EQ(result.bounds, (Rect{120, 210, 30, 16}));
    EXPECT_DOUBLE_EQ(result.confidence, kConfidenceDirect);
    EXPECT_EQ(first->calls, 1);
    EXPECT_EQ(second->calls, 1);
    EXPECT_EQ(third->calls, 0);
}

TEST_F(StrategyChainTest, ThrowingStrategyIsSkipped) {
    StrategyChain chain;
    add(chain, StrategyKind::ElementTree, GeometryResult{}, true);
    add(chain, StrategyKind::LineIndex,
        GeometryResult::success(Rect{120, 210, 30, 16}, kConfidenceLineMeasured, StrategyKind::LineIndex));
    const GeometryResult result = chain.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_EQ(result.source, StrategyKind::LineIndex);
}

TEST_F(StrategyChainTest, RejectsImplausibleResults) {
    StrategyChain chain;
    // Wider than the host limit.
    add(chain, StrategyKind::RangeBounds,
        GeometryResult::success(Rect{100, 210, 5000, 16}, kConfidenceDirect, StrategyKind::RangeBounds));
    // Far outside the element frame.
    add(chain, StrategyKind::TextMarker,
        GeometryResult::success(Rect{900, 900, 30, 16}, kConfidenceDirect, StrategyKind::TextMarker));
    // Below the usable confidence.
    add(chain, StrategyKind::LineIndex,
        GeometryResult::success(Rect{120, 210, 30, 16}, 0.4, StrategyKind::LineIndex));
    auto* last = add(chain, StrategyKind::FontMetrics,
                     GeometryResult::success(Rect{120, 210, 30, 16}, kConfidenceFontMetrics, StrategyKind::FontMetrics));

    const GeometryResult result = chain.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_EQ(result.source, StrategyKind::FontMetrics);
    EXPECT_EQ(last->calls, 1);
}

TEST_F(StrategyChainTest, AllUnavailableReportsLastReason) {
    StrategyChain chain;
    add(chain, StrategyKind::RangeBounds, GeometryResult::unavailable(StrategyKind::RangeBounds, "first"));
    add(chain, StrategyKind::TextMarker, GeometryResult::unavailable(StrategyKind::TextMarker, "second"));
    const GeometryResult result = chain.resolve(request);
    EXPECT_FALSE(result.available);
    EXPECT_EQ(result.reason, "second");
    EXPECT_FALSE(StrategyChain().resolve(request).available);
}

TEST_F(StrategyChainTest, BuildChainFollowsProfileOrder) {
    profile.strategies = {StrategyKind::ElementTree, StrategyKind::TextMarker, StrategyKind::FontMetrics};
    const StrategyChain chain = buildChain(profile, StrategyDeps{host, measurer});
    EXPECT_EQ(chain.kinds(), profile.strategies);

    const auto terminal = config::defaultProfile(HostCategory::Terminal);
    EXPECT_TRUE(buildChain(terminal, StrategyDeps{host, measurer}).empty());
}

// =============================================================================
// Direct strategies
// =============================================================================

TEST_F(StrategyChainTest, RangeBoundsRejectsZeroSizeRect) {
    host.boundsHook = [](ElementRef, CodeUnitRange) { return QueryResult<Rect>::success(Rect{120, 210, 0, 0}); };
    RangeBoundsStrategy strategy(host);
    EXPECT_FALSE(strategy.resolve(request).available);

    host.boundsHook = [](ElementRef, CodeUnitRange) { return QueryResult<Rect>::success(Rect{120, 210, 30, 16}); };
    const GeometryResult result = strategy.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_DOUBLE_EQ(result.confidence, kConfidenceDirect);
}

TEST_F(StrategyChainTest, TextMarkerUsesRangeEnds) {
    host.markerHook = [](std::uint32_t i) { return QueryResult<host::TextMarker>::success(host::TextMarker{i + 1000}); };
    host.markerBoundsHook = [](host::TextMarker a, host::TextMarker b) {
        return QueryResult<Rect>::success(Rect{static_cast<float>(a.token), 0, static_cast<float>(b.token - a.token), 16});
    };
    TextMarkerStrategy strategy(host);
    const GeometryResult result = strategy.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_FLOAT_EQ(result.bounds.x, 1006.0f);
    EXPECT_FLOAT_EQ(result.bounds.w, 3.0f);
}

// =============================================================================
// Element tree
// =============================================================================

TEST_F(StrategyChainTest, ElementTreeUnionsPartsAcrossParagraphs) {
    prepare("first part\nsecond", GraphemeRange{6, 14});
    host.children[1] = {
        ChildElement{ElementRef{2}, ElementRole::StaticText, Rect{100, 200, 200, 16}, "first part", false, 0},
        ChildElement{ElementRef{3}, ElementRole::StaticText, Rect{100, 220, 200, 16}, "second", false, 0},
    };
    host.boundsHook = [](ElementRef e, CodeUnitRange r) {
        if (e.id == 2 && r == CodeUnitRange{6, 4}) return QueryResult<Rect>::success(Rect{140, 200, 40, 16});
        if (e.id == 3 && r == CodeUnitRange{0, 3}) return QueryResult<Rect>::success(Rect{100, 220, 30, 16});
        return QueryResult<Rect>::success(Rect{});
    };

    ElementTreeStrategy strategy(host, measurer);
    const GeometryResult result = strategy.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_EQ(result.bounds, (Rect{100, 200, 80, 36}));
    EXPECT_DOUBLE_EQ(result.confidence, kConfidenceElementTree);
}

TEST_F(StrategyChainTest, ElementTreeEstimatesRefusingPart) {
    prepare("first part\nsecond", GraphemeRange{6, 14});
    host.children[1] = {
        ChildElement{ElementRef{2}, ElementRole::StaticText, Rect{100, 200, 200, 16}, "first part", false, 0},
        ChildElement{ElementRef{3}, ElementRole::StaticText, Rect{100, 220, 200, 16}, "second", false, 0},
    };
    host.boundsHook = [](ElementRef e, CodeUnitRange) {
        if (e.id == 2) return QueryResult<Rect>::success(Rect{140, 200, 40, 16});
        return QueryResult<Rect>::failure(QueryError::Unavailable);
    };

    ElementTreeStrategy strategy(host, measurer);
    const GeometryResult result = strategy.resolve(request);
    ASSERT_TRUE(result.available);
    // "sec" estimated at 15pt wide on the second part's first line.
    EXPECT_EQ(result.bounds, (Rect{100, 200, 80, 32}));
    EXPECT_DOUBLE_EQ(result.confidence, kConfidenceElementEstimated);
}

TEST_F(StrategyChainTest, ElementTreeWithoutPartsIsUnavailable) {
    ElementTreeStrategy strategy(host, measurer);
    EXPECT_FALSE(strategy.resolve(request).available);
}

// =============================================================================
// Estimation strategies
// =============================================================================

TEST_F(StrategyChainTest, LineIndexMeasuresFromLineStart) {
    host.lineForIndexHook = [](std::uint32_t) { return QueryResult<std::uint32_t>::success(0u); };
    host.rangeForLineHook = [](std::uint32_t) { return QueryResult<CodeUnitRange>::success(CodeUnitRange{0, 13}); };
    host.boundsHook = [](ElementRef, CodeUnitRange) { return QueryResult<Rect>::success(Rect{100, 200, 300, 16}); };

    LineIndexStrategy strategy(host, measurer);
    const GeometryResult result = strategy.resolve(request);
    ASSERT_TRUE(result.available);
    // "I saw " is 30pt; "teh" is 15pt, widened to the minimum.
    EXPECT_EQ(result.bounds, (Rect{130, 200, kMinimumEstimatedWidth, 16}));
    EXPECT_DOUBLE_EQ(result.confidence, kConfidenceLineMeasured);
}

TEST_F(StrategyChainTest, LineIndexFallsBackToLineHeight) {
    prepare("first\nI saw teh cat", GraphemeRange{12, 15});
    host.lineForIndexHook = [](std::uint32_t) { return QueryResult<std::uint32_t>::success(1u); };
    host.rangeForLineHook = [](std::uint32_t) { return QueryResult<CodeUnitRange>::success(CodeUnitRange{6, 13}); };

    LineIndexStrategy strategy(host, measurer);
    const GeometryResult result = strategy.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_FLOAT_EQ(result.bounds.x, 130.0f);
    EXPECT_FLOAT_EQ(result.bounds.y, 212.0f);
    EXPECT_FLOAT_EQ(result.bounds.h, 12.0f);
    EXPECT_DOUBLE_EQ(result.confidence, kConfidenceLineEstimated);
}

TEST_F(StrategyChainTest, FontMetricsLaysOutInsideFrame) {
    FontMetricsStrategy strategy(measurer);
    const GeometryResult result = strategy.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_EQ(result.bounds, (Rect{130, 200, 15, 12}));
    EXPECT_DOUBLE_EQ(result.confidence, kConfidenceFontMetrics);
}

TEST_F(StrategyChainTest, FontMetricsWrapsNarrowFrames) {
    request.elementFrame = Rect{100.0f, 200.0f, 40.0f, 120.0f};
    FontMetricsStrategy strategy(measurer);
    const GeometryResult result = strategy.resolve(request);
    ASSERT_TRUE(result.available);
    EXPECT_EQ(result.bounds, (Rect{100, 212, 15, 12}));
}

TEST_F(StrategyChainTest, FontMetricsNeedsFrame) {
    request.elementFrame.reset();
    FontMetricsStrategy strategy(measurer);
    EXPECT_FALSE(strategy.resolve(request).available);
}
