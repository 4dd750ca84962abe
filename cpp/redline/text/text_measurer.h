#ifndef REDLINE_TEXT_TEXT_MEASURER_H
#define REDLINE_TEXT_TEXT_MEASURER_H

#include "redline/text/font_manager.h"
#include "redline/text/text_types.h"
#include <cstdint>
#include <mutex>
#include <string_view>

typedef struct hb_buffer_t hb_buffer_t;

namespace redline::text {

/**
 * TextMeasurer: horizontal extent of text in points, for strategies that must
 * estimate geometry instead of asking the host.
 *
 * Shapes with HarfBuzz when a font is loaded for the requested family (or a
 * default font exists); otherwise multiplies the grapheme count by the
 * style's average advance. Thread-safe.
 */
class TextMeasurer {
public:
    explicit TextMeasurer(FontManager& fonts);
    ~TextMeasurer();

    TextMeasurer(const TextMeasurer&) = delete;
    TextMeasurer& operator=(const TextMeasurer&) = delete;

    /**
     * Advance width of a single line of UTF-8 text.
     */
    float measure(std::string_view utf8, const MeasureStyle& style);

    /**
     * Line and x offset of `codeUnitOffset` after greedy word wrapping at
     * `wrapWidth`. Explicit newlines always break. A non-positive wrap width
     * disables soft wrapping.
     */
    LineLocation locate(std::string_view utf8, std::uint32_t codeUnitOffset, const MeasureStyle& style, float wrapWidth);

    /**
     * True when measurement shapes real glyphs rather than estimating.
     */
    bool hasFontFor(const MeasureStyle& style) const;

private:
    float shape(std::uint32_t fontId, std::string_view utf8, float size);
    float estimate(std::string_view utf8, const MeasureStyle& style) const;

    FontManager& fonts_;
    hb_buffer_t* hbBuffer_{nullptr};
    std::mutex mutex_;
};

} // namespace redline::text

#endif // REDLINE_TEXT_TEXT_MEASURER_H
