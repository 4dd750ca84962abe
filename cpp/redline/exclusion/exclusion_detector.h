#ifndef REDLINE_EXCLUSION_EXCLUSION_DETECTOR_H
#define REDLINE_EXCLUSION_EXCLUSION_DETECTOR_H

#include "redline/config/host_profile.h"
#include "redline/core/types.h"
#include "redline/host/host_surface.h"
#include "redline/text/grapheme_index.h"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace redline::exclusion {

enum class ExclusionKind : std::uint8_t {
    Mention = 0,
    Link = 1,
    Code = 2,
    Quote = 3,
};

const char* toString(ExclusionKind kind);

struct ExclusionZone {
    GraphemeRange range;
    ExclusionKind kind{ExclusionKind::Mention};

    bool operator==(const ExclusionZone& o) const { return range == o.range && kind == o.kind; }
};

// Chunk sizes tried in turn at each offset of the attribute scan.
constexpr std::array<std::uint32_t, 6> kAttributeChunkSizes{100, 50, 25, 10, 5, 1};
constexpr std::uint32_t kChildScanMaxDepth = 5;

/**
 * ExclusionDetector: finds the parts of a text that must not be corrected.
 *
 * Individual query failures only reduce what is detected; detect() never
 * fails as a whole.
 */
class ExclusionDetector {
public:
    explicit ExclusionDetector(host::HostSurface& host) : host_(host) {}

    /**
     * Zones for `text`, merged and sorted, in grapheme offsets.
     */
    std::vector<ExclusionZone> detect(host::ElementRef element, std::string_view text,
                                      config::ExclusionTechnique techniques);

    /**
     * Styled runs found by scanning background and font attributes in chunks.
     * A chunk that fails is retried at the next smaller size; when even a
     * single unit fails the scan skips one code unit.
     * @return Zones in code units
     */
    std::vector<std::pair<CodeUnitRange, ExclusionKind>> attributeScan(host::ElementRef element, std::uint32_t length);

    /**
     * Links, code groups, block quotes and mentions exposed as child elements.
     * @return Zones in code units
     */
    std::vector<std::pair<CodeUnitRange, ExclusionKind>> childScan(host::ElementRef element, std::string_view text);

private:
    void walkChildren(host::ElementRef element, std::string_view text, std::uint32_t depth, std::size_t& cursor,
                      std::vector<std::pair<CodeUnitRange, ExclusionKind>>& out);

    host::HostSurface& host_;
};

/**
 * Sort by start and coalesce zones of the same kind that overlap or touch.
 */
std::vector<ExclusionZone> mergeZones(std::vector<ExclusionZone> zones);

/**
 * Spans that overlap no zone, in their original order.
 */
std::vector<ErrorSpan> filterSpans(const std::vector<ErrorSpan>& spans, const std::vector<ExclusionZone>& zones);

/**
 * Drop spans identical to the one right before them (same range and message).
 */
std::vector<ErrorSpan> dedupeSpans(const std::vector<ErrorSpan>& spans);

} // namespace redline::exclusion

#endif // REDLINE_EXCLUSION_EXCLUSION_DETECTOR_H
