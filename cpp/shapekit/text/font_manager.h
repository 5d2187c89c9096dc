#ifndef SHAPEKIT_TEXT_FONT_MANAGER_H
#define SHAPEKIT_TEXT_FONT_MANAGER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace shapekit::text {

// Vertical metrics. Unscaled values are in font units; getScaledMetrics
// returns them in canvas units for a given font size.
struct FontMetrics {
    float unitsPerEM;
    float ascender;             // Positive, above baseline
    float descender;            // Negative, below baseline
    float lineGap;
};

/**
 * FontHandle: a loaded font with its FreeType face and HarfBuzz font.
 */
struct FontHandle {
    std::uint32_t id;
    std::string familyName;

    FT_Face ftFace;
    hb_font_t* hbFont;          // scale = unitsPerEM, advances come back in font units

    FontMetrics metrics;

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: owns the FreeType library and the loaded fonts.
 *
 * Failures are reported through return values: 0 for "no font", false for
 * "not done". Text shapes fall back to estimated metrics when no font is
 * available, so a missing font never surfaces as an exception.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Release every font and the FreeType library.
     */
    void shutdown();

    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Font Loading
    // =========================================================================

    /**
     * Load a font from memory.
     * @param fontData Raw TTF/OTF data (copied and owned by FontManager)
     * @param dataSize Size of font data in bytes
     * @param familyName Optional family name override
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& familyName = ""
    );

    /**
     * Load a font from a file path.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath);

    /**
     * Unload a font by ID. The default font moves to another loaded font.
     * @return True if font was found and unloaded
     */
    bool unloadFont(std::uint32_t fontId);

    // =========================================================================
    // Font Access
    // =========================================================================

    /**
     * @param fontId Font ID (0 = default font)
     * @return Pointer to FontHandle, or nullptr if not found
     */
    const FontHandle* getFont(std::uint32_t fontId) const;

    std::uint32_t getDefaultFontId() const { return defaultFontId_; }

    // Bumped whenever the set of loaded fonts or the default changes.
    // Measurements taken under an older generation may be stale.
    std::uint64_t generation() const noexcept { return generation_; }

    bool hasFont(std::uint32_t fontId) const;
    std::vector<std::uint32_t> getLoadedFontIds() const;

    /**
     * Metrics for a font at a specific size.
     * @return Scaled metrics, or the fallback metrics if the font is not loaded
     */
    FontMetrics getScaledMetrics(std::uint32_t fontId, float fontSize) const;

private:
    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontHandle>> fonts_;

    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;
    std::uint64_t generation_ = 0;

    std::unique_ptr<FontHandle> createFontHandle(
        std::uint32_t id,
        FT_Face face,
        std::vector<std::uint8_t>&& fontData,
        const std::string& familyName
    );

    void releaseHandle(FontHandle& handle);

    // Extract metrics from FT_Face
    FontMetrics extractMetrics(FT_Face face) const;
};

// Fallback metrics (ascender 0.8, descender -0.2, line gap 0.1 of the size).
FontMetrics fallbackMetrics(float fontSize);

} // namespace shapekit::text

#endif // SHAPEKIT_TEXT_FONT_MANAGER_H
