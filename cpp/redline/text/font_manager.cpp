#include "redline/text/font_manager.h"
#include "redline/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace redline::text {

namespace {

std::string familyKey(std::string_view family) {
    std::string key(family);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return key;
}

// Unscaled vertical metrics. sTypo values are preferred when present since
// they are what most hosts lay lines out with.
FontMetrics readMetrics(FT_Face face) {
    FontMetrics m;
    m.unitsPerEM = face->units_per_EM > 0 ? static_cast<float>(face->units_per_EM) : 1000.0f;

    const auto* os2 = static_cast<const TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        m.ascender = static_cast<float>(os2->sTypoAscender);
        m.descender = static_cast<float>(os2->sTypoDescender);
        m.lineGap = static_cast<float>(os2->sTypoLineGap);
    } else {
        m.ascender = static_cast<float>(face->ascender);
        m.descender = static_cast<float>(face->descender);
        m.lineGap = static_cast<float>(face->height - face->ascender + face->descender);
    }
    return m;
}

} // namespace

FontHandle::~FontHandle() {
    // The HarfBuzz font references the face; release it first.
    if (hbFont) hb_font_destroy(hbFont);
    if (ftFace) FT_Done_Face(ftFace);
}

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (ftLibrary_) return true;
    if (FT_Init_FreeType(&ftLibrary_) != 0) {
        REDLINE_LOG_WARN("FreeType initialization failed");
        ftLibrary_ = nullptr;
        return false;
    }
    return true;
}

void FontManager::shutdown() {
    // Faces must go before the library that created them.
    fonts_.clear();
    families_.clear();
    defaultFontId_ = 0;
    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName) {
    if (!ftLibrary_ || !fontData || dataSize == 0) return 0;

    // FreeType reads from this buffer for the lifetime of the face; the
    // vector's heap block does not move when the vector itself is moved.
    std::vector<std::uint8_t> bytes(fontData, fontData + dataSize);
    FT_Face face = nullptr;
    if (FT_New_Memory_Face(ftLibrary_, bytes.data(), static_cast<FT_Long>(bytes.size()), 0, &face) != 0 || !face) {
        REDLINE_LOG_WARN("font data rejected by FreeType (%zu bytes)", dataSize);
        return 0;
    }
    return adoptFace(face, std::move(bytes), familyName);
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath, const std::string& familyName) {
    if (!ftLibrary_) return 0;

    FT_Face face = nullptr;
    if (FT_New_Face(ftLibrary_, filePath.c_str(), 0, &face) != 0 || !face) {
        REDLINE_LOG_DEBUG("no usable font at %s", filePath.c_str());
        return 0;
    }
    return adoptFace(face, {}, familyName);
}

std::uint32_t FontManager::adoptFace(FT_Face face, std::vector<std::uint8_t> fontData, const std::string& familyName) {
    auto handle = std::make_unique<FontHandle>();
    handle->ftFace = face;
    handle->fontData = std::move(fontData);
    handle->familyName = familyName.empty() && face->family_name ? face->family_name : familyName;
    handle->hbFont = hb_ft_font_create_referenced(face);
    if (!handle->hbFont) {
        return 0;
    }
    handle->metrics = readMetrics(face);

    const std::uint32_t fontId = nextFontId_++;
    handle->id = fontId;
    families_.emplace(familyKey(handle->familyName), fontId);
    REDLINE_LOG_DEBUG("loaded font %u (%s)", fontId, handle->familyName.c_str());
    fonts_.emplace(fontId, std::move(handle));

    if (defaultFontId_ == 0) defaultFontId_ = fontId;
    return fontId;
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    if (fonts_.erase(fontId) == 0) return false;

    for (auto it = families_.begin(); it != families_.end();) {
        it = it->second == fontId ? families_.erase(it) : std::next(it);
    }
    if (defaultFontId_ == fontId) {
        defaultFontId_ = fonts_.empty() ? 0 : fonts_.begin()->first;
    }
    return true;
}

bool FontManager::registerAlias(const std::string& alias, std::uint32_t fontId) {
    if (fonts_.find(fontId) == fonts_.end()) return false;
    families_[familyKey(alias)] = fontId;
    return true;
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    auto it = fonts_.find(fontId == 0 ? defaultFontId_ : fontId);
    return it != fonts_.end() ? it->second.get() : nullptr;
}

std::uint32_t FontManager::findFont(std::string_view family) const {
    auto it = families_.find(familyKey(family));
    if (it != families_.end()) return it->second;
    return hasFont(0) ? defaultFontId_ : 0;
}

FontMetrics FontManager::getScaledMetrics(std::uint32_t fontId, float fontSize) const {
    FontMetrics out;
    const FontHandle* handle = getFont(fontId);
    if (!handle) {
        out.ascender = fontSize * 0.8f;
        out.descender = fontSize * -0.2f;
        out.lineGap = fontSize * 0.1f;
        return out;
    }
    const FontMetrics& m = handle->metrics;
    const float scale = fontSize / m.unitsPerEM;
    out.unitsPerEM = m.unitsPerEM;
    out.ascender = m.ascender * scale;
    out.descender = m.descender * scale;
    out.lineGap = m.lineGap * scale;
    return out;
}

bool FontManager::setFontSize(std::uint32_t fontId, float fontSize) {
    const FontHandle* handle = getFont(fontId);
    if (!handle || !handle->ftFace || fontSize <= 0.0f) return false;

    // 26.6 fixed point at 72 DPI, so one unit is one point.
    const auto size26d6 = static_cast<FT_F26Dot6>(fontSize * 64.0f);
    if (FT_Set_Char_Size(handle->ftFace, 0, size26d6, 72, 72) != 0) return false;
    if (handle->hbFont) {
        hb_font_set_scale(handle->hbFont, static_cast<int>(size26d6), static_cast<int>(size26d6));
    }
    return true;
}

} // namespace redline::text
