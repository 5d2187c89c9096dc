#include "shapekit/text/font_manager.h"
#include "shapekit/core/constants.h"
#include "shapekit/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <fstream>
#include <utility>

namespace shapekit::text {

FontMetrics fallbackMetrics(float fontSize) {
    FontMetrics metrics{};
    metrics.unitsPerEM = 1000.0f;
    metrics.ascender = fontSize * constants::FALLBACK_ASCENDER;
    metrics.descender = fontSize * constants::FALLBACK_DESCENDER;
    metrics.lineGap = fontSize * constants::FALLBACK_LINE_GAP;
    return metrics;
}

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        SHAPEKIT_LOG_WARN("FT_Init_FreeType failed (error %d)", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& [id, handle] : fonts_) {
        if (handle) {
            releaseHandle(*handle);
        }
    }
    if (!fonts_.empty()) {
        ++generation_;
    }
    fonts_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    // FreeType reads from this buffer for the lifetime of the face
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,  // face index
        &face
    );

    if (error || !face) {
        SHAPEKIT_LOG_WARN("FT_New_Memory_Face failed (error %d)", static_cast<int>(error));
        return 0;
    }

    std::string family = familyName;
    if (family.empty() && face->family_name) {
        family = face->family_name;
    }
    if (family.empty()) {
        family = "Unknown";
    }

    std::uint32_t fontId = nextFontId_++;
    auto handle = createFontHandle(fontId, face, std::move(dataCopy), family);

    if (!handle) {
        FT_Done_Face(face);
        return 0;
    }

    fonts_[fontId] = std::move(handle);
    ++generation_;

    // First font loaded becomes the default
    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }

    SHAPEKIT_LOG_DEBUG("loaded font %u (%s)", fontId, family.c_str());
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        SHAPEKIT_LOG_WARN("cannot open font file %s", filePath.c_str());
        return 0;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size());
}

bool FontManager::unloadFont(std::uint32_t fontId) {
    auto it = fonts_.find(fontId);
    if (it == fonts_.end()) {
        return false;
    }

    if (it->second) {
        releaseHandle(*it->second);
    }
    fonts_.erase(it);
    ++generation_;

    if (defaultFontId_ == fontId) {
        defaultFontId_ = fonts_.empty() ? 0 : fonts_.begin()->first;
    }

    return true;
}

const FontHandle* FontManager::getFont(std::uint32_t fontId) const {
    std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;

    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

bool FontManager::hasFont(std::uint32_t fontId) const {
    return getFont(fontId) != nullptr;
}

std::vector<std::uint32_t> FontManager::getLoadedFontIds() const {
    std::vector<std::uint32_t> ids;
    ids.reserve(fonts_.size());
    for (const auto& [id, _] : fonts_) {
        ids.push_back(id);
    }
    return ids;
}

FontMetrics FontManager::getScaledMetrics(std::uint32_t fontId, float fontSize) const {
    const FontHandle* handle = getFont(fontId);
    if (!handle) {
        return fallbackMetrics(fontSize);
    }

    float scale = fontSize / handle->metrics.unitsPerEM;

    FontMetrics scaled{};
    scaled.unitsPerEM = handle->metrics.unitsPerEM;
    scaled.ascender = handle->metrics.ascender * scale;
    scaled.descender = handle->metrics.descender * scale;
    scaled.lineGap = handle->metrics.lineGap * scale;
    return scaled;
}

std::unique_ptr<FontHandle> FontManager::createFontHandle(
    std::uint32_t id,
    FT_Face face,
    std::vector<std::uint8_t>&& fontData,
    const std::string& familyName
) {
    auto handle = std::make_unique<FontHandle>();
    handle->id = id;
    handle->familyName = familyName;
    handle->ftFace = face;
    handle->hbFont = nullptr;
    handle->fontData = std::move(fontData);

    // HarfBuzz face over the FreeType face; the font keeps the default
    // scale (units per EM), so shaped advances are in font units.
    hb_face_t* hbFace = hb_ft_face_create_referenced(face);
    if (!hbFace) {
        return nullptr;
    }
    handle->hbFont = hb_font_create(hbFace);
    hb_face_destroy(hbFace);
    if (!handle->hbFont) {
        return nullptr;
    }

    handle->metrics = extractMetrics(face);
    return handle;
}

void FontManager::releaseHandle(FontHandle& handle) {
    if (handle.hbFont) {
        hb_font_destroy(handle.hbFont);
        handle.hbFont = nullptr;
    }
    if (handle.ftFace) {
        FT_Done_Face(handle.ftFace);
        handle.ftFace = nullptr;
    }
}

FontMetrics FontManager::extractMetrics(FT_Face face) const {
    FontMetrics metrics{};

    if (!face || face->units_per_EM == 0) {
        metrics.unitsPerEM = 1000.0f;
        metrics.ascender = 800.0f;
        metrics.descender = -200.0f;
        metrics.lineGap = 0.0f;
        return metrics;
    }

    metrics.unitsPerEM = static_cast<float>(face->units_per_EM);
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);

    // sTypoAscender/Descender are generally more reliable
    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        metrics.ascender = static_cast<float>(os2->sTypoAscender);
        metrics.descender = static_cast<float>(os2->sTypoDescender);
        metrics.lineGap = static_cast<float>(os2->sTypoLineGap);
    }

    return metrics;
}

} // namespace shapekit::text
