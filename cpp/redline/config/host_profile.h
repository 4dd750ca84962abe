#ifndef REDLINE_CONFIG_HOST_PROFILE_H
#define REDLINE_CONFIG_HOST_PROFILE_H

#include "redline/text/grapheme_index.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redline::config {

enum class HostCategory : std::uint8_t {
    Native = 0,
    Electron = 1,
    Browser = 2,
    Terminal = 3,
    Custom = 4,
};

// Position resolution techniques, in no particular order.
enum class StrategyKind : std::uint8_t {
    RangeBounds = 0,
    ElementTree = 1,
    TextMarker = 2,
    LineIndex = 3,
    FontMetrics = 4,
};

enum class ExclusionTechnique : std::uint32_t {
    None = 0,
    AttributeScan = 1 << 0,
    ChildScan = 1 << 1,
};

inline ExclusionTechnique operator|(ExclusionTechnique a, ExclusionTechnique b) {
    return static_cast<ExclusionTechnique>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}
inline ExclusionTechnique operator&(ExclusionTechnique a, ExclusionTechnique b) {
    return static_cast<ExclusionTechnique>(static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b));
}
inline bool hasFlag(ExclusionTechnique flags, ExclusionTechnique flag) {
    return (static_cast<std::uint32_t>(flags) & static_cast<std::uint32_t>(flag)) != 0;
}

enum class ReplacementMethod : std::uint8_t {
    ClipboardPaste = 0, // select, write clipboard, inject paste
    DirectSetText = 1,  // select, set selected text through the tree
};

struct FontConfig {
    std::string family{"System"};
    float size{13.0f};
    float lineHeightMultiplier{1.2f};
    // Average advance as a fraction of the font size, used without a loaded font.
    float averageAdvanceRatio{0.55f};

    float lineHeight() const { return size * lineHeightMultiplier; }
};

struct TimingConfig {
    std::uint32_t callTimeoutMs{250};
    std::uint32_t copySettleMs{0};
    std::uint32_t pasteSettleMs{0};
};

struct BoundsLimits {
    float maxWidth{800.0f};
    float maxHeight{200.0f};
    float editAreaTolerance{20.0f};
};

/**
 * HostProfile: everything host-specific the engine needs. Values are tuned
 * per application and live in data, not in code paths.
 */
struct HostProfile {
    std::string id;
    std::string displayName;
    std::vector<std::string> bundleIds;
    HostCategory category{HostCategory::Native};
    std::vector<StrategyKind> strategies;
    ExclusionTechnique exclusions{ExclusionTechnique::None};
    FontConfig font;
    ReplacementMethod replacementMethod{ReplacementMethod::ClipboardPaste};
    bool preservesFormatting{false};
    // Custom-data entry type that carries the rich-text delta.
    std::string richTextType;
    text::IndexUnit indexUnit{text::IndexUnit::Utf16CodeUnit};
    TimingConfig timing;
    BoundsLimits bounds;
};

/**
 * Default profile for a host category. Terminal hosts get no strategies.
 */
HostProfile defaultProfile(HostCategory category);

const char* toString(HostCategory category);
const char* toString(StrategyKind kind);
std::optional<HostCategory> parseHostCategory(std::string_view name);
std::optional<StrategyKind> parseStrategyKind(std::string_view name);
std::optional<ExclusionTechnique> parseExclusionTechnique(std::string_view name);
std::optional<ReplacementMethod> parseReplacementMethod(std::string_view name);
std::optional<text::IndexUnit> parseIndexUnit(std::string_view name);

} // namespace redline::config

#endif // REDLINE_CONFIG_HOST_PROFILE_H
