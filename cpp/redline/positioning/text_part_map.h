#ifndef REDLINE_POSITIONING_TEXT_PART_MAP_H
#define REDLINE_POSITIONING_TEXT_PART_MAP_H

#include "redline/core/types.h"
#include "redline/host/host_surface.h"
#include <string>
#include <string_view>
#include <vector>

namespace redline::positioning {

/**
 * A leaf text element and the slice of the full text it renders.
 */
struct TextPart {
    CodeUnitRange range; // code units into the full text
    Rect frame;
    host::ElementRef element;
    std::string text;
};

/**
 * TextPartMap: leaf text elements under a root, in document order, each
 * matched back to its position in the root's full text.
 *
 * Built in one pass over the tree. Children whose text cannot be found after
 * the previous part are left out, so the map may have gaps.
 */
class TextPartMap {
public:
    static constexpr std::uint32_t kMaxDepth = 8;

    static TextPartMap build(host::HostSurface& host, host::ElementRef root, std::string_view fullText);

    /**
     * Parts whose range intersects `range`, in document order.
     */
    std::vector<const TextPart*> overlapping(const CodeUnitRange& range) const;

    const std::vector<TextPart>& parts() const { return parts_; }
    bool empty() const { return parts_.empty(); }

private:
    void collect(host::HostSurface& host, host::ElementRef element, std::string_view fullText,
                 std::size_t& cursor, std::uint32_t depth);

    std::vector<TextPart> parts_;
};

} // namespace redline::positioning

#endif // REDLINE_POSITIONING_TEXT_PART_MAP_H
