#ifndef REDLINE_HOST_HOST_SURFACE_H
#define REDLINE_HOST_HOST_SURFACE_H

#include "redline/core/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace redline::host {

/**
 * Opaque reference to an element inside the host's accessibility tree.
 * Never assumed alive; every use goes through the host again.
 */
struct ElementRef {
    std::uint64_t id{0};

    bool valid() const { return id != 0; }
    bool operator==(const ElementRef& o) const { return id == o.id; }
    bool operator!=(const ElementRef& o) const { return id != o.id; }
    bool operator<(const ElementRef& o) const { return id < o.id; }
};

enum class ElementRole : std::uint8_t {
    StaticText = 0,
    TextArea = 1,
    Group = 2,
    Link = 3,
    Other = 4,
};

struct ChildElement {
    ElementRef element;
    ElementRole role{ElementRole::Other};
    Rect frame;
    std::string text;
    bool codeStyle{false};
    std::uint32_t blockQuoteLevel{0};
};

// Styling attributes the host reports over a sub-range of text.
struct StyleRun {
    CodeUnitRange range;
    bool hasBackground{false};
    bool monospace{false};
};

// Host-specific position handle.
struct TextMarker {
    std::uint64_t token{0};
};

struct ClipboardItem {
    std::string typeTag;
    std::vector<std::uint8_t> bytes;

    bool operator==(const ClipboardItem& o) const { return typeTag == o.typeTag && bytes == o.bytes; }
};

using ClipboardContents = std::vector<ClipboardItem>;

/**
 * HostSurface: capabilities of one connected host application.
 *
 * Ranges are in the host's index space (UTF-16 code units unless the host
 * profile says otherwise). Rects are in device space with a top-left origin.
 * Any call may fail at any time; none may be assumed to succeed because an
 * earlier call did.
 *
 * Optional capabilities default to QueryError::NotSupported.
 */
class HostSurface {
public:
    virtual ~HostSurface() = default;

    // =========================================================================
    // Tree queries
    // =========================================================================

    virtual QueryResult<bool> probeLiveness(ElementRef element) = 0;
    virtual QueryResult<std::uint32_t> characterCount(ElementRef element) = 0;
    virtual QueryResult<Rect> elementFrame(ElementRef element) = 0;
    virtual QueryResult<Rect> queryBounds(ElementRef element, CodeUnitRange range) = 0;
    virtual QueryResult<std::vector<ChildElement>> queryChildren(ElementRef element) = 0;
    virtual QueryResult<std::string> queryText(ElementRef element, CodeUnitRange range) = 0;

    virtual QueryResult<std::vector<StyleRun>> queryStyleRuns(ElementRef element, CodeUnitRange range);
    virtual QueryResult<TextMarker> markerForIndex(ElementRef element, std::uint32_t index);
    virtual QueryResult<Rect> boundsForMarkers(ElementRef element, TextMarker start, TextMarker end);
    virtual QueryResult<std::uint32_t> lineForIndex(ElementRef element, std::uint32_t index);
    virtual QueryResult<CodeUnitRange> rangeForLine(ElementRef element, std::uint32_t line);

    // =========================================================================
    // Mutation
    // =========================================================================

    virtual QueryError setSelection(ElementRef element, CodeUnitRange range) = 0;
    virtual QueryResult<std::string> readSelection(ElementRef element) = 0;
    virtual QueryError replaceSelectedText(ElementRef element, const std::string& text);

    virtual QueryResult<ClipboardContents> readClipboard() = 0;
    virtual QueryError writeClipboard(const ClipboardContents& contents) = 0;
    virtual QueryResult<std::int64_t> clipboardChangeCount() = 0;
    virtual QueryError injectCopy();
    virtual QueryError injectPaste() = 0;

    /**
     * Height of the display containing the host window, for Y flipping.
     */
    virtual QueryResult<float> displayHeight() = 0;
};

} // namespace redline::host

#endif // REDLINE_HOST_HOST_SURFACE_H
