#ifndef REDLINE_TEXT_FONT_MANAGER_H
#define REDLINE_TEXT_FONT_MANAGER_H

#include "redline/text/text_types.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace redline::text {

/**
 * FontHandle: a loaded face with its HarfBuzz font. Owns both and releases
 * them on destruction.
 */
struct FontHandle {
    FontHandle() = default;
    ~FontHandle();
    FontHandle(const FontHandle&) = delete;
    FontHandle& operator=(const FontHandle&) = delete;

    std::uint32_t id{0};
    std::string familyName;
    FT_Face ftFace{nullptr};
    hb_font_t* hbFont{nullptr};

    // Unscaled metrics, in font units
    FontMetrics metrics;

    // Backing bytes for faces opened from memory; empty for file faces
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: owns the FreeType library and the fonts used to estimate where
 * text lands inside a host whose tree cannot report geometry.
 *
 * Hosts render with their own fonts; loading the same family here is what
 * makes the estimate close. Families are matched case-insensitively, and a
 * host family that has no file of its own (for example "System") can be
 * pointed at a loaded font with registerAlias(). Without any font the
 * measurer falls back to an average advance.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();
    void shutdown();
    bool isInitialized() const { return ftLibrary_ != nullptr; }

    // =========================================================================
    // Font Loading
    // =========================================================================

    /**
     * Load a font from memory.
     * @param fontData Raw TTF/OTF data (copied)
     * @param dataSize Size of font data in bytes
     * @param familyName Family to register under; the face's own name when empty
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize, const std::string& familyName = "");

    /**
     * Load the first face of a font file.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath, const std::string& familyName = "");

    bool unloadFont(std::uint32_t fontId);

    /**
     * Resolve `alias` to an already loaded font.
     * @return False when the font is not loaded
     */
    bool registerAlias(const std::string& alias, std::uint32_t fontId);

    // =========================================================================
    // Font Access
    // =========================================================================

    /**
     * @param fontId Font ID (0 = default font)
     * @return Pointer to FontHandle, or nullptr if not found
     */
    const FontHandle* getFont(std::uint32_t fontId) const;

    /**
     * Font registered for `family` (by name or alias), else the default font.
     * @return Font ID, or 0 when no font is loaded
     */
    std::uint32_t findFont(std::string_view family) const;

    std::uint32_t getDefaultFontId() const { return defaultFontId_; }
    bool hasFont(std::uint32_t fontId) const { return getFont(fontId) != nullptr; }

    // =========================================================================
    // Font Metrics
    // =========================================================================

    /**
     * Metrics scaled to `fontSize`, or proportional defaults if the font is missing.
     */
    FontMetrics getScaledMetrics(std::uint32_t fontId, float fontSize) const;

    /**
     * Set the size used by FreeType and HarfBuzz for subsequent shaping.
     * @return True if successful
     */
    bool setFontSize(std::uint32_t fontId, float fontSize);

private:
    std::uint32_t adoptFace(FT_Face face, std::vector<std::uint8_t> fontData, const std::string& familyName);

    FT_Library ftLibrary_{nullptr};
    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;
    // Lowercased family names and aliases to font ids
    std::unordered_map<std::string, std::uint32_t> families_;
    std::uint32_t nextFontId_{1};
    std::uint32_t defaultFontId_{0};
};

} // namespace redline::text

#endif // REDLINE_TEXT_FONT_MANAGER_H
