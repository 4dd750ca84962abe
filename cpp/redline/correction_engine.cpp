#include "redline/correction_engine.h"
#include "redline/core/logging.h"
#include "redline/host/guarded_host_surface.h"
#include "redline/replacement/replacement_executor.h"

#include <algorithm>
#include <chrono>

namespace redline {

namespace {

// Host to call through for one operation: the raw host, or a guarded view
// bounded by the profile's timeout.
class HostScope {
public:
    HostScope(host::HostSurface& raw, host::ForeignCallExecutor* executor, const config::HostProfile& profile)
        : raw_(raw) {
        if (executor) {
            guarded_.emplace(raw, *executor, std::chrono::milliseconds(profile.timing.callTimeoutMs));
        }
    }

    host::HostSurface& get() { return guarded_ ? static_cast<host::HostSurface&>(*guarded_) : raw_; }

private:
    host::HostSurface& raw_;
    std::optional<host::GuardedHostSurface> guarded_;
};

} // namespace

CorrectionEngine::CorrectionEngine(
    host::HostSurface& host,
    const config::HostRegistry& registry,
    text::TextMeasurer& measurer,
    host::ForeignCallExecutor* executor)
    : host_(host)
    , registry_(registry)
    , measurer_(measurer)
    , executor_(executor) {
}

CorrectionEngine::SurfaceLease::SurfaceLease(CorrectionEngine& engine, host::ElementRef element)
    : engine_(engine)
    , element_(element) {
    std::lock_guard<std::mutex> lock(engine_.tableMutex_);
    auto& slot = engine_.surfaceLocks_[element_];
    if (!slot) slot = std::make_shared<std::shared_mutex>();
    mutex_ = slot;
}

CorrectionEngine::SurfaceLease::~SurfaceLease() {
    // Copies are only made and dropped under the table mutex, so the count
    // is exact here: two means only the table and this lease remain.
    std::lock_guard<std::mutex> lock(engine_.tableMutex_);
    auto it = engine_.surfaceLocks_.find(element_);
    if (it != engine_.surfaceLocks_.end() && it->second == mutex_ && mutex_.use_count() == 2) {
        engine_.surfaceLocks_.erase(it);
    }
    mutex_.reset();
}

bool CorrectionEngine::isSuperseded(const replacement::ReplacementContext& context) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = latestSnapshot_.find(context.element);
    return it != latestSnapshot_.end() && context.snapshotId < it->second;
}

void CorrectionEngine::noteTextChanged(host::ElementRef element, std::uint64_t snapshotId) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    std::uint64_t& latest = latestSnapshot_[element];
    latest = std::max(latest, snapshotId);
}

void CorrectionEngine::forgetElement(host::ElementRef element) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    latestSnapshot_.erase(element);
}

std::size_t CorrectionEngine::trackedElementCount() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    std::size_t count = latestSnapshot_.size();
    for (const auto& entry : surfaceLocks_) {
        if (latestSnapshot_.find(entry.first) == latestSnapshot_.end()) ++count;
    }
    return count;
}

std::vector<exclusion::ExclusionZone> CorrectionEngine::detectExclusions(
    std::string_view bundleId,
    host::ElementRef element,
    std::string_view text) {
    const config::HostProfile& profile = profileFor(bundleId);
    HostScope scope(host_, executor_, profile);
    exclusion::ExclusionDetector detector(scope.get());
    return detector.detect(element, text, profile.exclusions);
}

std::vector<ErrorSpan> CorrectionEngine::filterSpans(
    std::string_view bundleId,
    host::ElementRef element,
    std::string_view text,
    const std::vector<ErrorSpan>& spans) {
    const auto zones = detectExclusions(bundleId, element, text);
    return exclusion::filterSpans(exclusion::dedupeSpans(spans), zones);
}

positioning::ResolvedBounds CorrectionEngine::resolve(
    std::string_view bundleId,
    host::ElementRef element,
    std::string_view text,
    const GraphemeRange& range,
    std::optional<Rect> elementFrame) {
    SurfaceLease lease(*this, element);
    std::shared_lock<std::shared_mutex> reading(lease.mutex(), std::try_to_lock);
    if (!reading.owns_lock()) {
        positioning::ResolvedBounds busy;
        busy.reason = "surface busy";
        return busy;
    }

    const config::HostProfile& profile = profileFor(bundleId);
    HostScope scope(host_, executor_, profile);
    positioning::PositionResolver resolver(scope.get(), measurer_);
    return resolver.resolve(profile, element, text, range, elementFrame);
}

replacement::ReplacementOutcome CorrectionEngine::attemptReplacement(
    std::string_view bundleId,
    const replacement::ReplacementContext& context) {
    using replacement::FailureKind;
    using replacement::ReplacementOutcome;

    if (isSuperseded(context)) {
        return ReplacementOutcome::failure(FailureKind::Superseded, "text changed since analysis");
    }

    SurfaceLease lease(*this, context.element);
    std::unique_lock<std::shared_mutex> writing(lease.mutex(), std::try_to_lock);
    if (!writing.owns_lock()) {
        REDLINE_LOG_DEBUG("replacement rejected, element %llu busy",
                          static_cast<unsigned long long>(context.element.id));
        return ReplacementOutcome::failure(FailureKind::SurfaceBusy, "another operation is running");
    }
    // The text may have changed while waiting for the lock holder.
    if (isSuperseded(context)) {
        return ReplacementOutcome::failure(FailureKind::Superseded, "text changed since analysis");
    }

    const config::HostProfile& profile = profileFor(bundleId);
    HostScope scope(host_, executor_, profile);
    replacement::ReplacementExecutor executor(scope.get(), profile);
    return executor.execute(context);
}

} // namespace redline
