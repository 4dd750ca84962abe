#include "redline/config/host_profile.h"

#include <initializer_list>

namespace redline::config {

HostProfile defaultProfile(HostCategory category) {
    HostProfile profile;
    profile.category = category;
    switch (category) {
        case HostCategory::Native:
            profile.id = "native";
            profile.displayName = "Native application";
            profile.strategies = {StrategyKind::RangeBounds, StrategyKind::LineIndex,
                                  StrategyKind::TextMarker, StrategyKind::FontMetrics};
            profile.exclusions = ExclusionTechnique::ChildScan;
            profile.replacementMethod = ReplacementMethod::DirectSetText;
            break;
        case HostCategory::Electron:
            profile.id = "electron";
            profile.displayName = "Electron application";
            profile.strategies = {StrategyKind::TextMarker, StrategyKind::RangeBounds, StrategyKind::ElementTree,
                                  StrategyKind::LineIndex, StrategyKind::FontMetrics};
            profile.exclusions = ExclusionTechnique::ChildScan;
            profile.font.size = 14.0f;
            profile.timing.pasteSettleMs = 50;
            break;
        case HostCategory::Browser:
            profile.id = "browser";
            profile.displayName = "Web browser";
            profile.strategies = {StrategyKind::TextMarker, StrategyKind::RangeBounds,
                                  StrategyKind::ElementTree, StrategyKind::LineIndex};
            profile.exclusions = ExclusionTechnique::ChildScan;
            profile.font.size = 14.0f;
            profile.timing.pasteSettleMs = 50;
            break;
        case HostCategory::Terminal:
            profile.id = "terminal";
            profile.displayName = "Terminal";
            profile.font.family = "Menlo";
            profile.font.averageAdvanceRatio = 0.6f;
            break;
        case HostCategory::Custom:
            profile.id = "custom";
            profile.displayName = "Custom host";
            profile.strategies = {StrategyKind::RangeBounds, StrategyKind::FontMetrics};
            break;
    }
    return profile;
}

const char* toString(HostCategory category) {
    switch (category) {
        case HostCategory::Native: return "native";
        case HostCategory::Electron: return "electron";
        case HostCategory::Browser: return "browser";
        case HostCategory::Terminal: return "terminal";
        case HostCategory::Custom: return "custom";
    }
    return "unknown";
}

const char* toString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::RangeBounds: return "rangeBounds";
        case StrategyKind::ElementTree: return "elementTree";
        case StrategyKind::TextMarker: return "textMarker";
        case StrategyKind::LineIndex: return "lineIndex";
        case StrategyKind::FontMetrics: return "fontMetrics";
    }
    return "unknown";
}

std::optional<HostCategory> parseHostCategory(std::string_view name) {
    for (HostCategory c : {HostCategory::Native, HostCategory::Electron, HostCategory::Browser,
                           HostCategory::Terminal, HostCategory::Custom}) {
        if (name == toString(c)) return c;
    }
    return std::nullopt;
}

std::optional<StrategyKind> parseStrategyKind(std::string_view name) {
    for (StrategyKind k : {StrategyKind::RangeBounds, StrategyKind::ElementTree, StrategyKind::TextMarker,
                           StrategyKind::LineIndex, StrategyKind::FontMetrics}) {
        if (name == toString(k)) return k;
    }
    return std::nullopt;
}

std::optional<ExclusionTechnique> parseExclusionTechnique(std::string_view name) {
    if (name == "attributeScan") return ExclusionTechnique::AttributeScan;
    if (name == "childScan") return ExclusionTechnique::ChildScan;
    return std::nullopt;
}

std::optional<ReplacementMethod> parseReplacementMethod(std::string_view name) {
    if (name == "clipboardPaste") return ReplacementMethod::ClipboardPaste;
    if (name == "directSetText") return ReplacementMethod::DirectSetText;
    return std::nullopt;
}

std::optional<text::IndexUnit> parseIndexUnit(std::string_view name) {
    if (name == "utf16") return text::IndexUnit::Utf16CodeUnit;
    if (name == "grapheme") return text::IndexUnit::Grapheme;
    return std::nullopt;
}

} // namespace redline::config
