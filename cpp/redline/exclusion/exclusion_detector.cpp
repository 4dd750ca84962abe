#include "redline/exclusion/exclusion_detector.h"
#include "redline/core/logging.h"
#include "redline/core/string_utils.h"

#include <algorithm>
#include <exception>

namespace redline::exclusion {

using config::ExclusionTechnique;
using UnitZone = std::pair<CodeUnitRange, ExclusionKind>;

const char* toString(ExclusionKind kind) {
    switch (kind) {
        case ExclusionKind::Mention: return "mention";
        case ExclusionKind::Link: return "link";
        case ExclusionKind::Code: return "code";
        case ExclusionKind::Quote: return "quote";
    }
    return "unknown";
}

std::vector<ExclusionZone> ExclusionDetector::detect(
    host::ElementRef element,
    std::string_view text,
    ExclusionTechnique techniques) {
    const auto index = text::GraphemeIndex::build(text);
    if (!index) return {};

    std::vector<UnitZone> found;
    if (config::hasFlag(techniques, ExclusionTechnique::AttributeScan)) {
        const auto scanned = attributeScan(element, index->codeUnitCount());
        found.insert(found.end(), scanned.begin(), scanned.end());
    }
    if (config::hasFlag(techniques, ExclusionTechnique::ChildScan)) {
        const auto scanned = childScan(element, text);
        found.insert(found.end(), scanned.begin(), scanned.end());
    }

    std::vector<ExclusionZone> zones;
    zones.reserve(found.size());
    for (const auto& [units, kind] : found) {
        const GraphemeRange g = index->enclosingGraphemes(units);
        if (!g.empty()) zones.push_back(ExclusionZone{g, kind});
    }
    return mergeZones(std::move(zones));
}

std::vector<UnitZone> ExclusionDetector::attributeScan(host::ElementRef element, std::uint32_t length) {
    std::vector<UnitZone> out;
    std::uint32_t offset = 0;
    while (offset < length) {
        const std::uint32_t remaining = length - offset;
        bool scanned = false;
        for (std::uint32_t chunk : kAttributeChunkSizes) {
            const CodeUnitRange range{offset, std::min(chunk, remaining)};
            QueryResult<std::vector<host::StyleRun>> runs;
            try {
                runs = host_.queryStyleRuns(element, range);
            } catch (const std::exception& e) {
                REDLINE_LOG_WARN("style query threw at %u+%u: %s", range.start, range.length, e.what());
                return out;
            }
            if (!runs) {
                REDLINE_LOG_DEBUG("style query failed at %u+%u: %s", range.start, range.length, toString(runs.error));
                // A host that timed out once will time out on every retry.
                if (runs.error == QueryError::NotSupported || runs.error == QueryError::Timeout) return out;
                // Fails near the end of long texts; retry smaller.
                continue;
            }
            for (const host::StyleRun& run : *runs) {
                if (!run.hasBackground || run.range.empty()) continue;
                out.emplace_back(run.range, run.monospace ? ExclusionKind::Code : ExclusionKind::Mention);
            }
            offset += range.length;
            scanned = true;
            break;
        }
        if (!scanned) {
            ++offset;
        }
    }
    return out;
}

std::vector<UnitZone> ExclusionDetector::childScan(host::ElementRef element, std::string_view text) {
    std::vector<UnitZone> out;
    std::size_t cursor = 0;
    try {
        walkChildren(element, text, 0, cursor, out);
    } catch (const std::exception& e) {
        // Zones found before the failure still apply.
        REDLINE_LOG_WARN("child scan threw: %s", e.what());
    }
    return out;
}

void ExclusionDetector::walkChildren(
    host::ElementRef element,
    std::string_view text,
    std::uint32_t depth,
    std::size_t& cursor,
    std::vector<UnitZone>& out) {
    if (depth >= kChildScanMaxDepth) return;
    const auto children = host_.queryChildren(element);
    if (!children) return;

    for (const host::ChildElement& child : *children) {
        std::optional<ExclusionKind> kind;
        if (child.role == host::ElementRole::Link) {
            kind = ExclusionKind::Link;
        } else if (child.codeStyle) {
            kind = ExclusionKind::Code;
        } else if (child.blockQuoteLevel > 0) {
            kind = ExclusionKind::Quote;
        } else if (child.role == host::ElementRole::StaticText) {
            if (startsWith(child.text, "http://") || startsWith(child.text, "https://")) {
                kind = ExclusionKind::Link;
            } else if (startsWith(child.text, "@") || startsWith(child.text, "#")) {
                kind = ExclusionKind::Mention;
            }
        }

        if (!kind || child.text.empty()) {
            // Containers carry no text of their own; their children might.
            walkChildren(child.element, text, depth + 1, cursor, out);
            continue;
        }

        // Match in document order first, then anywhere.
        std::size_t at = text.find(child.text, cursor);
        if (at == std::string_view::npos) at = text.find(child.text);
        if (at == std::string_view::npos) {
            REDLINE_LOG_DEBUG("%s element text not found in snapshot", toString(*kind));
            continue;
        }
        const CodeUnitRange range{byteToLogicalIndex(text, at), utf16Length(child.text)};
        out.emplace_back(range, *kind);
        cursor = std::max(cursor, at + child.text.size());
    }
}

std::vector<ExclusionZone> mergeZones(std::vector<ExclusionZone> zones) {
    std::sort(zones.begin(), zones.end(), [](const ExclusionZone& a, const ExclusionZone& b) {
        if (a.range.start != b.range.start) return a.range.start < b.range.start;
        return a.range.end < b.range.end;
    });

    std::vector<ExclusionZone> merged;
    for (const ExclusionZone& zone : zones) {
        // Coalesce with the latest zone of the same kind that reaches this one.
        auto target = std::find_if(merged.rbegin(), merged.rend(), [&](const ExclusionZone& m) {
            return m.kind == zone.kind && zone.range.start <= m.range.end;
        });
        if (target != merged.rend()) {
            target->range.end = std::max(target->range.end, zone.range.end);
        } else {
            merged.push_back(zone);
        }
    }
    return merged;
}

std::vector<ErrorSpan> filterSpans(const std::vector<ErrorSpan>& spans, const std::vector<ExclusionZone>& zones) {
    std::vector<ErrorSpan> out;
    out.reserve(spans.size());
    for (const ErrorSpan& span : spans) {
        const bool excluded = std::any_of(zones.begin(), zones.end(), [&](const ExclusionZone& z) {
            return span.range.overlaps(z.range);
        });
        if (!excluded) out.push_back(span);
    }
    return out;
}

std::vector<ErrorSpan> dedupeSpans(const std::vector<ErrorSpan>& spans) {
    std::vector<ErrorSpan> out;
    out.reserve(spans.size());
    for (const ErrorSpan& span : spans) {
        if (!out.empty() && out.back().range == span.range && out.back().message == span.message) continue;
        out.push_back(span);
    }
    return out;
}

} // namespace redline::exclusion
