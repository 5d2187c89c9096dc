#pragma once

/**
 * @file constants.h
 * @brief Tunable constants shared by the shape behaviors.
 *
 * All distances are in world units. Selection UI converts screen-space
 * tolerances before calling into the behaviors.
 */

#include <cstddef>
#include <cstdint>

namespace shapekit::constants {

// =============================================================================
// Hit-testing
// =============================================================================

/// Extra slack added to stroke half-width when testing open paths and rays
constexpr float HIT_TOLERANCE = 3.0f;

/// Radius of the rendered dot shape
constexpr float DOT_RADIUS = 4.0f;

/// Half-length used to stand in for an unbounded line or ray
constexpr float INFINITE_LINE_EXTENT = 100000.0f;

// =============================================================================
// Curve sampling
// =============================================================================

/// Polygon vertices used to approximate an ellipse outline
constexpr std::size_t ELLIPSE_SEGMENTS = 32;

/// Samples taken along a bent arrow's quadratic curve
constexpr std::size_t ARROW_CURVE_SAMPLES = 16;

/// Arrowhead leg length, relative to the stroke width
constexpr float ARROWHEAD_LENGTH_FACTOR = 4.0f;

// =============================================================================
// Text
// =============================================================================

/// Fallback advance per glyph (fraction of font size) when no font is loaded
constexpr float FALLBACK_GLYPH_ADVANCE = 0.6f;

/// Fallback ascender/descender/line gap (fraction of font size)
constexpr float FALLBACK_ASCENDER = 0.8f;
constexpr float FALLBACK_DESCENDER = -0.2f;
constexpr float FALLBACK_LINE_GAP = 0.1f;

/// Default text size for new text shapes
constexpr float DEFAULT_FONT_SIZE = 16.0f;

// =============================================================================
// Shape defaults
// =============================================================================

constexpr const char* DEFAULT_SHAPE_NAME = "Shape";
constexpr const char* DEFAULT_PARENT_ID = "page0";

constexpr std::uint32_t DEFAULT_STROKE_RGBA = 0x000000FFu;
constexpr std::uint32_t DEFAULT_FILL_RGBA = 0xFFFFFFFFu;
constexpr float DEFAULT_STROKE_WIDTH = 2.0f;

} // namespace shapekit::constants
