#ifndef REDLINE_TEXT_TEXT_TYPES_H
#define REDLINE_TEXT_TEXT_TYPES_H

#include <cstdint>
#include <string>

namespace redline::text {

// Font metrics in font units, or scaled when returned by getScaledMetrics().
struct FontMetrics {
    float unitsPerEM{1000.0f};
    float ascender{800.0f};   // Positive, above baseline
    float descender{-200.0f}; // Negative, below baseline
    float lineGap{0.0f};
};

// Font request for measurement. `averageAdvanceRatio` drives the estimate
// used when no matching font is loaded.
struct MeasureStyle {
    std::string family;
    float size{13.0f};
    float averageAdvanceRatio{0.55f};
};

// Where a code unit offset lands after greedy line wrapping.
struct LineLocation {
    std::uint32_t line{0};
    float x{0.0f};
};

} // namespace redline::text

#endif // REDLINE_TEXT_TEXT_TYPES_H
