#ifndef REDLINE_CORRECTION_ENGINE_H
#define REDLINE_CORRECTION_ENGINE_H

#include "redline/config/host_registry.h"
#include "redline/core/types.h"
#include "redline/exclusion/exclusion_detector.h"
#include "redline/host/foreign_call_executor.h"
#include "redline/host/host_surface.h"
#include "redline/positioning/position_resolver.h"
#include "redline/replacement/replacement_types.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace redline {

namespace text {
class TextMeasurer;
}

/**
 * CorrectionEngine: the service object the surrounding application creates
 * once and hands to the renderer and the acceptance UI.
 *
 * Per element it allows any number of concurrent resolutions or exactly one
 * replacement, never both: a resolution that finds a replacement in flight
 * returns Unresolved, and a second replacement is rejected as SurfaceBusy.
 * A replacement whose snapshot is older than the last noteTextChanged() for
 * its element is dropped as Superseded without touching the host.
 *
 * When an executor is given, every host call runs on it under the host
 * profile's timeout.
 */
class CorrectionEngine {
public:
    CorrectionEngine(
        host::HostSurface& host,
        const config::HostRegistry& registry,
        text::TextMeasurer& measurer,
        host::ForeignCallExecutor* executor = nullptr);

    CorrectionEngine(const CorrectionEngine&) = delete;
    CorrectionEngine& operator=(const CorrectionEngine&) = delete;

    const config::HostProfile& profileFor(std::string_view bundleId) const { return registry_.profileFor(bundleId); }

    std::vector<exclusion::ExclusionZone> detectExclusions(
        std::string_view bundleId, host::ElementRef element, std::string_view text);

    /**
     * Deduplicated spans that fall outside every exclusion zone of `text`.
     */
    std::vector<ErrorSpan> filterSpans(
        std::string_view bundleId, host::ElementRef element, std::string_view text, const std::vector<ErrorSpan>& spans);

    positioning::ResolvedBounds resolve(
        std::string_view bundleId,
        host::ElementRef element,
        std::string_view text,
        const GraphemeRange& range,
        std::optional<Rect> elementFrame = std::nullopt);

    replacement::ReplacementOutcome attemptReplacement(
        std::string_view bundleId, const replacement::ReplacementContext& context);

    /**
     * Record that the element's text changed; contexts from older snapshots
     * are superseded.
     */
    void noteTextChanged(host::ElementRef element, std::uint64_t snapshotId);

    /**
     * Drop what is remembered about an element that no longer exists.
     */
    void forgetElement(host::ElementRef element);

    /**
     * Elements with a recorded snapshot or an operation in flight.
     */
    std::size_t trackedElementCount() const;

private:
    // An element's lock slot, shared by every operation on that element and
    // removed from the table with its last holder.
    class SurfaceLease {
    public:
        SurfaceLease(CorrectionEngine& engine, host::ElementRef element);
        ~SurfaceLease();

        SurfaceLease(const SurfaceLease&) = delete;
        SurfaceLease& operator=(const SurfaceLease&) = delete;

        std::shared_mutex& mutex() { return *mutex_; }

    private:
        CorrectionEngine& engine_;
        host::ElementRef element_;
        std::shared_ptr<std::shared_mutex> mutex_;
    };

    bool isSuperseded(const replacement::ReplacementContext& context);

    host::HostSurface& host_;
    const config::HostRegistry& registry_;
    text::TextMeasurer& measurer_;
    host::ForeignCallExecutor* executor_;

    mutable std::mutex tableMutex_;
    std::map<host::ElementRef, std::shared_ptr<std::shared_mutex>> surfaceLocks_;
    std::map<host::ElementRef, std::uint64_t> latestSnapshot_;
};

} // namespace redline

#endif // REDLINE_CORRECTION_ENGINE_H
