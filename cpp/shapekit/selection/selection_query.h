#ifndef SHAPEKIT_SELECTION_SELECTION_QUERY_H
#define SHAPEKIT_SELECTION_SELECTION_QUERY_H

#include "shapekit/shapes/shape_registry.h"

#include <vector>

// Picking and marquee queries over a list of shapes in draw order
// (back to front). Hidden and locked shapes never match.

namespace shapekit::selection {

// Front-most shape whose hitTest accepts point, or nullptr.
const Shape* pickTopmost(
    const std::vector<const Shape*>& shapes,
    Point2 point,
    const ShapeRegistry& registry = ShapeRegistry::builtin());

// Ids of shapes whose hitTestBounds accepts the brush, in draw order.
std::vector<ShapeId> marqueeSelect(
    const std::vector<const Shape*>& shapes,
    const Bounds& brush,
    const ShapeRegistry& registry = ShapeRegistry::builtin());

Bounds getCommonBounds(const std::vector<Bounds>& bounds);

// Union of the shapes' rotated bounds.
Bounds getSelectionBounds(
    const std::vector<const Shape*>& shapes,
    const ShapeRegistry& registry = ShapeRegistry::builtin());

} // namespace shapekit::selection

#endif // SHAPEKIT_SELECTION_SELECTION_QUERY_H
