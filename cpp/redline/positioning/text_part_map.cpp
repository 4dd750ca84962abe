#include "redline/positioning/text_part_map.h"
#include "redline/core/logging.h"
#include "redline/core/string_utils.h"

namespace redline::positioning {

TextPartMap TextPartMap::build(host::HostSurface& host, host::ElementRef root, std::string_view fullText) {
    TextPartMap map;
    std::size_t cursor = 0;
    map.collect(host, root, fullText, cursor, 0);
    return map;
}

void TextPartMap::collect(
    host::HostSurface& host,
    host::ElementRef element,
    std::string_view fullText,
    std::size_t& cursor,
    std::uint32_t depth) {
    if (depth >= kMaxDepth) return;
    const auto children = host.queryChildren(element);
    if (!children) return;

    for (const host::ChildElement& child : *children) {
        if (child.role != host::ElementRole::StaticText || child.text.empty()) {
            collect(host, child.element, fullText, cursor, depth + 1);
            continue;
        }
        const std::size_t at = fullText.find(child.text, cursor);
        if (at == std::string_view::npos) {
            REDLINE_LOG_DEBUG("text part '%s' not found after byte %zu", child.text.c_str(), cursor);
            continue;
        }
        TextPart part;
        part.range.start = byteToLogicalIndex(fullText, at);
        part.range.length = utf16Length(child.text);
        part.frame = child.frame;
        part.element = child.element;
        part.text = child.text;
        parts_.push_back(std::move(part));
        cursor = at + child.text.size();
    }
}

std::vector<const TextPart*> TextPartMap::overlapping(const CodeUnitRange& range) const {
    std::vector<const TextPart*> out;
    for (const auto& part : parts_) {
        if (rangesIntersect(part.range, range)) out.push_back(&part);
    }
    return out;
}

} // namespace redline::positioning
