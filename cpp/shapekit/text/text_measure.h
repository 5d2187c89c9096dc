#ifndef SHAPEKIT_TEXT_TEXT_MEASURE_H
#define SHAPEKIT_TEXT_TEXT_MEASURE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

typedef struct hb_buffer_t hb_buffer_t;

namespace shapekit::text {

class FontManager;

// Unscaled extent of a block of text. Lines are separated by '\n'.
struct TextExtent {
    float width = 0.0f;        // widest line
    float height = 0.0f;       // lineCount * line height
    std::size_t lineCount = 0;
};

// Extent from fallback metrics: every code point advances
// FALLBACK_GLYPH_ADVANCE * fontSize.
TextExtent estimateTextExtent(std::string_view text, float fontSize);

/**
 * TextMeasurer: measures text with HarfBuzz advances and font metrics.
 *
 * Falls back to estimateTextExtent when the requested font is not loaded.
 * Holds one reusable shaping buffer; not thread-safe.
 */
class TextMeasurer {
public:
    explicit TextMeasurer(const FontManager& fonts);
    ~TextMeasurer();

    TextMeasurer(const TextMeasurer&) = delete;
    TextMeasurer& operator=(const TextMeasurer&) = delete;

    TextExtent measure(std::string_view text, std::uint32_t fontId, float fontSize) const;

    const FontManager& fonts() const { return fonts_; }

private:
    const FontManager& fonts_;
    hb_buffer_t* hbBuffer_ = nullptr;
};

} // namespace shapekit::text

#endif // SHAPEKIT_TEXT_TEXT_MEASURE_H
