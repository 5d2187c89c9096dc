#ifndef SHAPEKIT_SHAPES_VARIANTS_VARIANTS_H
#define SHAPEKIT_SHAPES_VARIANTS_VARIANTS_H

#include "shapekit/shapes/shape_behavior.h"

// Per-kind overrides layered onto the default behavior by the registry.

namespace shapekit::variants {

ShapeBehaviorOverrides dotOverrides();
ShapeBehaviorOverrides circleOverrides();
ShapeBehaviorOverrides ellipseOverrides();
ShapeBehaviorOverrides lineOverrides();
ShapeBehaviorOverrides rayOverrides();
ShapeBehaviorOverrides polylineOverrides();
ShapeBehaviorOverrides rectangleOverrides();
ShapeBehaviorOverrides drawOverrides();
ShapeBehaviorOverrides arrowOverrides();
ShapeBehaviorOverrides textOverrides();
ShapeBehaviorOverrides groupOverrides();

// Arrow handle ids.
inline constexpr const char* kArrowStart = "start";
inline constexpr const char* kArrowEnd = "end";
inline constexpr const char* kArrowBend = "bend";

} // namespace shapekit::variants

#endif // SHAPEKIT_SHAPES_VARIANTS_VARIANTS_H
