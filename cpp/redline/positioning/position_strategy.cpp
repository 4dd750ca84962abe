#include "redline/positioning/position_strategy.h"

namespace redline::positioning {

text::MeasureStyle measureStyleFor(const config::HostProfile& profile) {
    text::MeasureStyle style;
    style.family = profile.font.family;
    style.size = profile.font.size;
    style.averageAdvanceRatio = profile.font.averageAdvanceRatio;
    return style;
}

std::optional<std::uint32_t> hostOffsetToCodeUnit(const ResolveRequest& request, std::uint32_t hostOffset) {
    if (!request.profile || request.profile->indexUnit == text::IndexUnit::Utf16CodeUnit) {
        return hostOffset;
    }
    if (!request.index) return std::nullopt;
    return request.index->codeUnitOffset(hostOffset);
}

} // namespace redline::positioning
