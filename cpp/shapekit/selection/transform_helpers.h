#ifndef SHAPEKIT_SELECTION_TRANSFORM_HELPERS_H
#define SHAPEKIT_SELECTION_TRANSFORM_HELPERS_H

#include "shapekit/shapes/shape_registry.h"

#include <vector>

namespace shapekit::selection {

struct TransformedBounds {
    Bounds bounds;
    float scaleX;   // signed; negative when the drag crossed the opposite edge
    float scaleY;
};

/**
 * Resize of a selection box by dragging one handle by delta.
 *
 * The dragged edges move and the opposite edges stay put; dragging through
 * the opposite edge flips that axis. With lockAspect the box keeps the
 * initial aspect ratio: corners take the larger of the two scales, edges
 * scale the other axis about the center.
 */
TransformedBounds getTransformedBoundingBox(
    const Bounds& initial,
    TransformHandle handle,
    Point2 delta,
    bool lockAspect);

// Maps a shape's box from the initial selection box into the new one,
// keeping its proportional offset and size. A flipped axis mirrors the offset.
Bounds getRelativeTransformedBoundingBox(
    const Bounds& bounds,
    const Bounds& initialBounds,
    const Bounds& initialShapeBounds,
    bool flipX,
    bool flipY);

/**
 * Applies one resize step to a selection.
 *
 * snapshots[i] is the pre-drag copy of *shapes[i]; every step is computed
 * from the snapshots, so repeated calls during a drag do not accumulate.
 * A single shape goes through transformSingle. With several shapes each one
 * gets its relative box via transform, or is only moved when its kind
 * cannot transform.
 *
 * Throws std::invalid_argument when the two lists differ in length.
 */
void transformSelection(
    const std::vector<Shape*>& shapes,
    const std::vector<Shape>& snapshots,
    TransformHandle handle,
    Point2 delta,
    bool lockAspect,
    const ShapeRegistry& registry = ShapeRegistry::builtin());

} // namespace shapekit::selection

#endif // SHAPEKIT_SELECTION_TRANSFORM_HELPERS_H
