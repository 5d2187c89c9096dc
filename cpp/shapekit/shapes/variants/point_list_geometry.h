#ifndef SHAPEKIT_SHAPES_VARIANTS_POINT_LIST_GEOMETRY_H
#define SHAPEKIT_SHAPES_VARIANTS_POINT_LIST_GEOMETRY_H

#include "shapekit/shapes/shape_behavior.h"

#include <vector>

// Geometry shared by the kinds that store a list of points relative to
// Shape::point (polyline and freehand draw).

namespace shapekit::variants {

const std::vector<Point2>& pointsOf(const Shape& shape);
std::vector<Point2>& pointsOf(Shape& shape);

// Box around the relative points, without the shape offset. Zero box at the
// origin for an empty list.
Bounds localPointBounds(const std::vector<Point2>& points) noexcept;

// Open path in world space: shape offset applied, then rotation about center.
std::vector<Point2> worldPoints(const Shape& shape, Point2 center);

Bounds pointListBounds(const ShapeBehavior& self, const Shape& shape);
bool pointListHitTest(const ShapeBehavior& self, const Shape& shape, Point2 point);
bool pointListHitTestBounds(const ShapeBehavior& self, const Shape& shape, const Bounds& bounds);

// Rescales the initial shape's points into bounds; a negative scale mirrors
// that axis.
void pointListTransform(const ShapeBehavior& self, Shape& shape, const Bounds& bounds, const TransformInfo& info);

// Maps v from [fromMin, fromMin + fromSize] onto [0, toSize], mirrored when
// flip is set. A zero-size source maps everything to 0.
float rescaleAxis(float v, float fromMin, float fromSize, float toSize, bool flip) noexcept;

} // namespace shapekit::variants

#endif // SHAPEKIT_SHAPES_VARIANTS_POINT_LIST_GEOMETRY_H
