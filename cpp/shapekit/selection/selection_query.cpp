#include "shapekit/selection/selection_query.h"
#include "shapekit/geometry/bounds.h"

namespace shapekit::selection {

namespace {

bool selectable(const Shape* shape) {
    return shape && !shape->isHidden && !shape->isLocked;
}

} // namespace

const Shape* pickTopmost(const std::vector<const Shape*>& shapes, Point2 point, const ShapeRegistry& registry) {
    for (auto it = shapes.rbegin(); it != shapes.rend(); ++it) {
        const Shape* shape = *it;
        if (!selectable(shape)) continue;
        if (registry.getShapeUtils(*shape).hitTest(*shape, point)) {
            return shape;
        }
    }
    return nullptr;
}

std::vector<ShapeId> marqueeSelect(const std::vector<const Shape*>& shapes, const Bounds& brush, const ShapeRegistry& registry) {
    std::vector<ShapeId> hits;
    for (const Shape* shape : shapes) {
        if (!selectable(shape)) continue;
        if (registry.getShapeUtils(*shape).hitTestBounds(*shape, brush)) {
            hits.push_back(shape->id);
        }
    }
    return hits;
}

Bounds getCommonBounds(const std::vector<Bounds>& bounds) {
    return geometry::commonBounds(bounds);
}

Bounds getSelectionBounds(const std::vector<const Shape*>& shapes, const ShapeRegistry& registry) {
    std::vector<Bounds> bounds;
    bounds.reserve(shapes.size());
    for (const Shape* shape : shapes) {
        if (!shape) continue;
        bounds.push_back(registry.getShapeUtils(*shape).getRotatedBounds(*shape));
    }
    return geometry::commonBounds(bounds);
}

} // namespace shapekit::selection
