#include <gtest/gtest.h>
#include "fake_host_surface.h"
#include "redline/correction_engine.h"
#include "redline/text/font_manager.h"
#include "redline/text/text_measurer.h"

#include <stdexcept>
#include <thread>

using namespace redline;
using redline::host::ChildElement;
using redline::host::ElementRef;
using redline::host::ElementRole;
using redline::replacement::FailureKind;
using redline::replacement::ReplacementContext;
using redline::replacement::ReplacementOutcome;
using redline::test::FakeHostSurface;

namespace {
constexpr const char* kEditor = "com.microsoft.VSCode";
}

class CorrectionEngineTest : public ::testing::Test {
protected:
    FakeHostSurface host;
    config::HostRegistry registry;
    text::FontManager fonts;
    text::TextMeasurer measurer{fonts};
    CorrectionEngine engine{host, registry, measurer};
    const ElementRef element{1};

    void SetUp() override {
        host.text = "I saw teh cat";
        host.boundsHook = [](ElementRef, CodeUnitRange) { return QueryResult<Rect>::success(Rect{130, 210, 18, 16}); };
    }

    ReplacementContext context(std::uint64_t snapshot) const {
        ReplacementContext ctx;
        ctx.element = element;
        ctx.range = GraphemeRange{6, 9};
        ctx.errorText = "teh";
        ctx.currentText = host.text;
        ctx.suggestion = "the";
        ctx.snapshotId = snapshot;
        return ctx;
    }
};

TEST_F(CorrectionEngineTest, ResolvesThroughHostProfile) {
    const auto bounds = engine.resolve(kEditor, element, host.text, GraphemeRange{6, 9});
    ASSERT_TRUE(bounds.resolved);
    EXPECT_FLOAT_EQ(bounds.rect.y, 774.0f);

    EXPECT_FALSE(engine.resolve("com.apple.Terminal", element, host.text, GraphemeRange{6, 9}).resolved);
}

TEST_F(CorrectionEngineTest, StaleSnapshotIsSuperseded) {
    engine.noteTextChanged(element, 2);
    const ReplacementOutcome stale = engine.attemptReplacement(kEditor, context(1));
    EXPECT_EQ(stale.kind, FailureKind::Superseded);
    EXPECT_EQ(host.selectionCalls, 0);

    EXPECT_TRUE(engine.attemptReplacement(kEditor, context(2)).succeeded());
}

TEST_F(CorrectionEngineTest, NewerSnapshotIsNotSuperseded) {
    engine.noteTextChanged(element, 2);
    EXPECT_TRUE(engine.attemptReplacement(kEditor, context(3)).succeeded());

    // A late notification never moves the snapshot backwards.
    engine.noteTextChanged(element, 1);
    EXPECT_EQ(engine.attemptReplacement(kEditor, context(1)).kind, FailureKind::Superseded);
}

TEST_F(CorrectionEngineTest, ReplacementInFlightBlocksOthers) {
    positioning::ResolvedBounds during;
    ReplacementOutcome second;
    host.onPaste = [&] {
        std::thread other([&] {
            during = engine.resolve(kEditor, element, host.text, GraphemeRange{6, 9});
            second = engine.attemptReplacement(kEditor, context(0));
        });
        other.join();
    };

    const ReplacementOutcome first = engine.attemptReplacement(kEditor, context(0));
    EXPECT_TRUE(first.succeeded());
    EXPECT_FALSE(during.resolved);
    EXPECT_EQ(during.reason, "surface busy");
    EXPECT_EQ(second.kind, FailureKind::SurfaceBusy);
    EXPECT_EQ(host.pasteCalls, 1);

    // Once the replacement is done the element is free again.
    EXPECT_TRUE(engine.resolve(kEditor, element, host.text, GraphemeRange{6, 9}).resolved);
}

TEST_F(CorrectionEngineTest, OtherElementsAreNotBlocked) {
    positioning::ResolvedBounds elsewhere;
    host.onPaste = [&] {
        std::thread other([&] { elsewhere = engine.resolve(kEditor, ElementRef{2}, "I saw teh cat", GraphemeRange{6, 9}); });
        other.join();
    };
    ASSERT_TRUE(engine.attemptReplacement(kEditor, context(0)).succeeded());
    EXPECT_TRUE(elsewhere.resolved);
}

TEST_F(CorrectionEngineTest, FiltersSpansInsideExclusions) {
    host.text = "ping @teh now";
    host.children[1] = {ChildElement{ElementRef{2}, ElementRole::StaticText, {}, "@teh", false, 0}};

    ErrorSpan mention;
    mention.range = GraphemeRange{6, 9};
    mention.message = "spelling";
    ErrorSpan real;
    real.range = GraphemeRange{10, 13};
    real.message = "spelling";

    const auto kept = engine.filterSpans(kEditor, element, host.text, {mention, mention, real});
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].range, (GraphemeRange{10, 13}));
}

TEST_F(CorrectionEngineTest, RunsHostCallsOnExecutor) {
    host::ForeignCallExecutor executor;
    CorrectionEngine guarded(host, registry, measurer, &executor);
    const auto bounds = guarded.resolve(kEditor, element, host.text, GraphemeRange{6, 9});
    EXPECT_TRUE(bounds.resolved);
    EXPECT_TRUE(guarded.attemptReplacement(kEditor, context(0)).succeeded());
    executor.shutdown();
}

TEST_F(CorrectionEngineTest, ElementStateIsReleased) {
    for (std::uint64_t id = 1; id <= 20; ++id) {
        engine.resolve(kEditor, ElementRef{id}, host.text, GraphemeRange{6, 9});
    }
    EXPECT_EQ(engine.trackedElementCount(), 0u);

    std::size_t duringPaste = 0;
    host.onPaste = [&] { duringPaste = engine.trackedElementCount(); };
    ASSERT_TRUE(engine.attemptReplacement(kEditor, context(0)).succeeded());
    EXPECT_EQ(duringPaste, 1u);
    EXPECT_EQ(engine.trackedElementCount(), 0u);

    engine.noteTextChanged(element, 5);
    engine.noteTextChanged(ElementRef{2}, 1);
    EXPECT_EQ(engine.trackedElementCount(), 2u);
    engine.forgetElement(element);
    EXPECT_EQ(engine.trackedElementCount(), 1u);
    EXPECT_TRUE(engine.attemptReplacement(kEditor, context(0)).succeeded());
}

TEST_F(CorrectionEngineTest, ThrowingHostIsContainedWithoutExecutor) {
    host.children[1] = {ChildElement{ElementRef{2}, ElementRole::Group, {}, "", false, 0}};
    host.childrenHook = [](ElementRef e) {
        if (e.id == 2) throw std::runtime_error("element gone");
    };
    EXPECT_NO_THROW(engine.detectExclusions(kEditor, element, host.text));

    host.onPaste = [] { throw std::runtime_error("messaging error"); };
    ReplacementOutcome outcome;
    EXPECT_NO_THROW(outcome = engine.attemptReplacement(kEditor, context(0)));
    EXPECT_EQ(outcome.kind, FailureKind::HostUnresponsive);

    // The failed attempt released the element.
    host.onPaste = nullptr;
    EXPECT_TRUE(engine.attemptReplacement(kEditor, context(0)).succeeded());
}
