#include "shapekit/text/text_measure.h"
#include "shapekit/text/font_manager.h"
#include "shapekit/core/constants.h"
#include "shapekit/core/logging.h"

#include <hb.h>

#include <algorithm>

namespace shapekit::text {

namespace {

// Code points in a UTF-8 line (continuation bytes are not counted).
std::size_t countCodePoints(std::string_view line) {
    std::size_t count = 0;
    for (unsigned char c : line) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

template <typename Fn>
std::size_t forEachLine(std::string_view text, Fn&& fn) {
    std::size_t lines = 0;
    std::size_t start = 0;
    while (true) {
        const std::size_t end = text.find('\n', start);
        fn(text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        ++lines;
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return lines;
}

} // namespace

TextExtent estimateTextExtent(std::string_view text, float fontSize) {
    const FontMetrics metrics = fallbackMetrics(fontSize);
    const float lineHeight = metrics.ascender - metrics.descender + metrics.lineGap;

    TextExtent extent;
    extent.lineCount = forEachLine(text, [&](std::string_view line) {
        const float width = static_cast<float>(countCodePoints(line)) * constants::FALLBACK_GLYPH_ADVANCE * fontSize;
        extent.width = std::max(extent.width, width);
    });
    extent.height = static_cast<float>(extent.lineCount) * lineHeight;
    return extent;
}

TextMeasurer::TextMeasurer(const FontManager& fonts)
    : fonts_(fonts),
      hbBuffer_(hb_buffer_create()) {}

TextMeasurer::~TextMeasurer() {
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

TextExtent TextMeasurer::measure(std::string_view text, std::uint32_t fontId, float fontSize) const {
    const FontHandle* font = fonts_.getFont(fontId);
    if (!font || !font->hbFont || !hb_buffer_allocation_successful(hbBuffer_)) {
        SHAPEKIT_LOG_WARN("font %u not loaded, estimating text extent", fontId);
        return estimateTextExtent(text, fontSize);
    }

    const FontMetrics metrics = fonts_.getScaledMetrics(fontId, fontSize);
    const float lineHeight = metrics.ascender - metrics.descender + metrics.lineGap;
    const float unitScale = fontSize / font->metrics.unitsPerEM;

    // Ligatures off so each character keeps its own advance
    hb_feature_t features[2];
    hb_feature_from_string("-liga", -1, &features[0]);
    hb_feature_from_string("-clig", -1, &features[1]);

    TextExtent extent;
    extent.lineCount = forEachLine(text, [&](std::string_view line) {
        if (line.empty()) return;

        hb_buffer_reset(hbBuffer_);
        hb_buffer_add_utf8(hbBuffer_, line.data(), static_cast<int>(line.size()), 0, -1);
        hb_buffer_guess_segment_properties(hbBuffer_);
        hb_shape(font->hbFont, hbBuffer_, features, 2);

        unsigned int glyphCount = 0;
        hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
        if (!glyphPos) return;

        float advance = 0.0f;
        for (unsigned int i = 0; i < glyphCount; ++i) {
            advance += static_cast<float>(glyphPos[i].x_advance);
        }
        extent.width = std::max(extent.width, advance * unitScale);
    });
    extent.height = static_cast<float>(extent.lineCount) * lineHeight;
    return extent;
}

} // namespace shapekit::text
