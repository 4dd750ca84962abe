#include "redline/text/text_measurer.h"
#include "redline/core/string_utils.h"
#include "redline/text/grapheme_index.h"

#include <hb.h>

#include <vector>

namespace redline::text {

namespace {

struct Word {
    std::size_t begin{0}; // byte offsets into the text
    std::size_t end{0};
    bool newline{false};  // word is a hard line break
};

// Words keep their trailing spaces so wrapped widths include them.
std::vector<Word> splitWords(std::string_view text) {
    std::vector<Word> words;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] == '\n') {
            words.push_back(Word{pos, pos + 1, true});
            ++pos;
            continue;
        }
        std::size_t end = pos;
        while (end < text.size() && text[end] != ' ' && text[end] != '\n') ++end;
        while (end < text.size() && text[end] == ' ') ++end;
        words.push_back(Word{pos, end, false});
        pos = end;
    }
    return words;
}

} // namespace

TextMeasurer::TextMeasurer(FontManager& fonts)
    : fonts_(fonts)
    , hbBuffer_(hb_buffer_create()) {
}

TextMeasurer::~TextMeasurer() {
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

bool TextMeasurer::hasFontFor(const MeasureStyle& style) const {
    return fonts_.findFont(style.family) != 0;
}

float TextMeasurer::measure(std::string_view utf8, const MeasureStyle& style) {
    if (utf8.empty()) return 0.0f;
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint32_t fontId = fonts_.findFont(style.family);
    if (fontId == 0) {
        return estimate(utf8, style);
    }
    return shape(fontId, utf8, style.size);
}

float TextMeasurer::shape(std::uint32_t fontId, std::string_view utf8, float size) {
    const FontHandle* handle = fonts_.getFont(fontId);
    if (!handle || !handle->hbFont || !hbBuffer_ || !fonts_.setFontSize(fontId, size)) {
        return 0.0f;
    }

    hb_buffer_reset(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, utf8.data(), static_cast<int>(utf8.size()), 0, -1);
    hb_buffer_guess_segment_properties(hbBuffer_);
    hb_shape(handle->hbFont, hbBuffer_, nullptr, 0);

    unsigned int glyphCount = 0;
    hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);

    // Scale is size * 64, so advances are 26.6 fixed point.
    hb_position_t total = 0;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        total += glyphPos[i].x_advance;
    }
    return static_cast<float>(total) / 64.0f;
}

float TextMeasurer::estimate(std::string_view utf8, const MeasureStyle& style) const {
    std::uint32_t count = 0;
    if (const auto index = GraphemeIndex::build(utf8)) {
        count = index->graphemeCount();
    } else {
        count = utf16Length(utf8);
    }
    return static_cast<float>(count) * style.size * style.averageAdvanceRatio;
}

LineLocation TextMeasurer::locate(
    std::string_view utf8,
    std::uint32_t codeUnitOffset,
    const MeasureStyle& style,
    float wrapWidth) {
    const std::size_t target = logicalToByteIndex(utf8, codeUnitOffset);
    LineLocation loc;
    float x = 0.0f;

    for (const Word& word : splitWords(utf8)) {
        if (word.newline) {
            if (target <= word.begin) break;
            ++loc.line;
            x = 0.0f;
            continue;
        }
        const std::string_view piece = utf8.substr(word.begin, word.end - word.begin);
        const float width = measure(piece, style);
        if (wrapWidth > 0.0f && x > 0.0f && x + width > wrapWidth) {
            ++loc.line;
            x = 0.0f;
        }
        if (target < word.end) {
            x += measure(utf8.substr(word.begin, target - word.begin), style);
            loc.x = x;
            return loc;
        }
        x += width;
    }
    loc.x = x;
    return loc;
}

} // namespace redline::text
