#include "redline/config/host_registry.h"
#include "redline/core/logging.h"

#include <nlohmann/json.hpp>

#include <string>

namespace redline::config {

using Json = nlohmann::json;

namespace {

HostProfile slackProfile() {
    HostProfile p = defaultProfile(HostCategory::Electron);
    p.id = "slack";
    p.displayName = "Slack";
    p.bundleIds = {"com.tinyspeck.slackmacgap"};
    // Root range queries return zero-size rects; children answer correctly.
    p.strategies = {StrategyKind::ElementTree, StrategyKind::TextMarker,
                    StrategyKind::RangeBounds, StrategyKind::LineIndex};
    p.exclusions = ExclusionTechnique::ChildScan;
    p.font.family = "Lato";
    p.font.size = 15.0f;
    p.preservesFormatting = true;
    p.richTextType = "slack/texty";
    p.timing.copySettleMs = 50;
    p.timing.pasteSettleMs = 100;
    return p;
}

HostProfile teamsProfile() {
    HostProfile p = defaultProfile(HostCategory::Electron);
    p.id = "teams";
    p.displayName = "Microsoft Teams";
    p.bundleIds = {"com.microsoft.teams2", "com.microsoft.teams"};
    p.strategies = {StrategyKind::ElementTree, StrategyKind::RangeBounds,
                    StrategyKind::LineIndex, StrategyKind::FontMetrics};
    p.exclusions = ExclusionTechnique::AttributeScan | ExclusionTechnique::ChildScan;
    p.font.family = "Segoe UI";
    p.font.size = 14.0f;
    p.timing.pasteSettleMs = 100;
    return p;
}

bool readString(const Json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

bool readBool(const Json& obj, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_boolean()) return false;
    out = it->get<bool>();
    return true;
}

bool readFloat(const Json& obj, const char* key, float& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number() || it->get<double>() < 0.0) return false;
    out = it->get<float>();
    return true;
}

bool readMillis(const Json& obj, const char* key, std::uint32_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number_unsigned()) return false;
    out = it->get<std::uint32_t>();
    return true;
}

template <typename T, typename ParseFn>
bool readEnum(const Json& obj, const char* key, T& out, ParseFn parse) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_string()) return false;
    const auto parsed = parse(it->get<std::string>());
    if (!parsed) return false;
    out = *parsed;
    return true;
}

ConfigError applyHostJson(const Json& entry, HostProfile& p) {
    if (!readString(entry, "displayName", p.displayName)) return ConfigError::InvalidField;
    if (!readEnum(entry, "category", p.category, parseHostCategory)) return ConfigError::InvalidField;
    if (!readEnum(entry, "indexUnit", p.indexUnit, parseIndexUnit)) return ConfigError::InvalidField;

    if (auto it = entry.find("bundleIds"); it != entry.end()) {
        if (!it->is_array()) return ConfigError::InvalidField;
        p.bundleIds.clear();
        for (const Json& id : *it) {
            if (!id.is_string()) return ConfigError::InvalidField;
            p.bundleIds.push_back(id.get<std::string>());
        }
    }
    if (auto it = entry.find("strategies"); it != entry.end()) {
        if (!it->is_array()) return ConfigError::InvalidField;
        p.strategies.clear();
        for (const Json& name : *it) {
            if (!name.is_string()) return ConfigError::InvalidField;
            const auto kind = parseStrategyKind(name.get<std::string>());
            if (!kind) return ConfigError::InvalidField;
            p.strategies.push_back(*kind);
        }
    }
    if (auto it = entry.find("exclusions"); it != entry.end()) {
        if (!it->is_array()) return ConfigError::InvalidField;
        p.exclusions = ExclusionTechnique::None;
        for (const Json& name : *it) {
            if (!name.is_string()) return ConfigError::InvalidField;
            const auto technique = parseExclusionTechnique(name.get<std::string>());
            if (!technique) return ConfigError::InvalidField;
            p.exclusions = p.exclusions | *technique;
        }
    }
    if (auto it = entry.find("font"); it != entry.end()) {
        if (!it->is_object()) return ConfigError::InvalidField;
        if (!readString(*it, "family", p.font.family)) return ConfigError::InvalidField;
        if (!readFloat(*it, "size", p.font.size)) return ConfigError::InvalidField;
        if (!readFloat(*it, "lineHeightMultiplier", p.font.lineHeightMultiplier)) return ConfigError::InvalidField;
        if (!readFloat(*it, "averageAdvanceRatio", p.font.averageAdvanceRatio)) return ConfigError::InvalidField;
    }
    if (auto it = entry.find("replacement"); it != entry.end()) {
        if (!it->is_object()) return ConfigError::InvalidField;
        if (!readEnum(*it, "method", p.replacementMethod, parseReplacementMethod)) return ConfigError::InvalidField;
        if (!readBool(*it, "preservesFormatting", p.preservesFormatting)) return ConfigError::InvalidField;
        if (!readString(*it, "richTextType", p.richTextType)) return ConfigError::InvalidField;
    }
    if (auto it = entry.find("timing"); it != entry.end()) {
        if (!it->is_object()) return ConfigError::InvalidField;
        if (!readMillis(*it, "callTimeoutMs", p.timing.callTimeoutMs)) return ConfigError::InvalidField;
        if (!readMillis(*it, "copySettleMs", p.timing.copySettleMs)) return ConfigError::InvalidField;
        if (!readMillis(*it, "pasteSettleMs", p.timing.pasteSettleMs)) return ConfigError::InvalidField;
    }
    if (auto it = entry.find("bounds"); it != entry.end()) {
        if (!it->is_object()) return ConfigError::InvalidField;
        if (!readFloat(*it, "maxWidth", p.bounds.maxWidth)) return ConfigError::InvalidField;
        if (!readFloat(*it, "maxHeight", p.bounds.maxHeight)) return ConfigError::InvalidField;
        if (!readFloat(*it, "editAreaTolerance", p.bounds.editAreaTolerance)) return ConfigError::InvalidField;
    }
    if (p.preservesFormatting && p.richTextType.empty()) return ConfigError::MissingField;
    return ConfigError::Ok;
}

} // namespace

const char* toString(ConfigError error) {
    switch (error) {
        case ConfigError::Ok: return "ok";
        case ConfigError::MalformedJson: return "malformed json";
        case ConfigError::NotAnObject: return "not an object";
        case ConfigError::MissingField: return "missing field";
        case ConfigError::InvalidField: return "invalid field";
        case ConfigError::UnknownBase: return "unknown base profile";
    }
    return "unknown";
}

HostRegistry::HostRegistry() {
    profiles_.push_back(defaultProfile(HostCategory::Native));

    HostProfile electron = defaultProfile(HostCategory::Electron);
    electron.bundleIds = {"com.microsoft.VSCode", "com.hnc.Discord", "notion.id"};
    profiles_.push_back(std::move(electron));

    HostProfile browser = defaultProfile(HostCategory::Browser);
    browser.bundleIds = {"com.google.Chrome", "com.brave.Browser", "com.microsoft.edgemac", "org.mozilla.firefox"};
    profiles_.push_back(std::move(browser));

    HostProfile terminal = defaultProfile(HostCategory::Terminal);
    terminal.bundleIds = {"com.apple.Terminal", "com.googlecode.iterm2"};
    profiles_.push_back(std::move(terminal));

    profiles_.push_back(defaultProfile(HostCategory::Custom));
    profiles_.push_back(slackProfile());
    profiles_.push_back(teamsProfile());
}

const HostProfile& HostRegistry::profileFor(std::string_view bundleId) const {
    for (const auto& profile : profiles_) {
        for (const auto& id : profile.bundleIds) {
            if (id == bundleId) return profile;
        }
    }
    return profiles_.front();
}

const HostProfile* HostRegistry::findById(std::string_view id) const {
    for (const auto& profile : profiles_) {
        if (profile.id == id) return &profile;
    }
    return nullptr;
}

void HostRegistry::registerProfile(HostProfile profile) {
    for (auto& existing : profiles_) {
        if (existing.id == profile.id) {
            existing = std::move(profile);
            return;
        }
    }
    profiles_.push_back(std::move(profile));
}

ConfigError HostRegistry::loadFromJson(std::string_view json) {
    const Json doc = Json::parse(json.begin(), json.end(), nullptr, false);
    if (doc.is_discarded()) return ConfigError::MalformedJson;
    if (!doc.is_object()) return ConfigError::NotAnObject;
    auto hosts = doc.find("hosts");
    if (hosts == doc.end()) return ConfigError::MissingField;
    if (!hosts->is_array()) return ConfigError::InvalidField;

    // Staged copy so a bad entry leaves the registry untouched. Later entries
    // may extend earlier ones from the same table.
    HostRegistry staged = *this;
    for (const Json& entry : *hosts) {
        if (!entry.is_object()) return ConfigError::NotAnObject;
        auto idIt = entry.find("id");
        if (idIt == entry.end() || !idIt->is_string()) return ConfigError::MissingField;
        const std::string id = idIt->get<std::string>();

        std::string base = id;
        if (!readString(entry, "extends", base)) return ConfigError::InvalidField;
        HostProfile profile;
        if (const HostProfile* existing = staged.findById(base)) {
            profile = *existing;
            if (base != id) profile.bundleIds.clear();
        } else if (base != id) {
            return ConfigError::UnknownBase;
        } else {
            profile = defaultProfile(HostCategory::Custom);
            profile.bundleIds.clear();
        }
        profile.id = id;

        const ConfigError err = applyHostJson(entry, profile);
        if (err != ConfigError::Ok) {
            REDLINE_LOG_WARN("host table entry '%s' rejected: %s", id.c_str(), toString(err));
            return err;
        }
        staged.registerProfile(std::move(profile));
    }

    profiles_ = std::move(staged.profiles_);
    return ConfigError::Ok;
}

} // namespace redline::config
