#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/shapes/shape_registry.h"
#include "shapekit/core/logging.h"
#include "shapekit/geometry/bounds.h"

#include <vector>

namespace shapekit::variants {

namespace {

Bounds groupBounds(const ShapeBehavior&, const Shape& shape) {
    const Point2 size = shape.as<GroupData>().size;
    return Bounds::fromMinMax(shape.point.x, shape.point.y, shape.point.x + size.x, shape.point.y + size.y);
}

void groupTransform(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo&) {
    shape.as<GroupData>().size = Point2{bounds.width, bounds.height};
    shape.point = Point2{bounds.minX, bounds.minY};
}

// Fits the group to the union of its children's rotated bounds.
void groupChildrenChange(const ShapeBehavior& self, Shape& shape, const std::vector<const Shape*>& children) {
    const ShapeRegistry& registry = self.context().registry ? *self.context().registry : ShapeRegistry::builtin();

    std::vector<Bounds> childBounds;
    childBounds.reserve(children.size());
    for (const Shape* child : children) {
        if (!child) continue;
        childBounds.push_back(registry.getShapeUtils(*child).getRotatedBounds(*child));
    }

    if (childBounds.empty()) {
        SHAPEKIT_LOG_DEBUG("group %s has no children to fit", shape.id.c_str());
        return;
    }

    const Bounds fitted = geometry::commonBounds(childBounds);
    shape.point = Point2{fitted.minX, fitted.minY};
    shape.as<GroupData>().size = Point2{fitted.width, fitted.height};
}

render::RenderNode renderGroup(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    node.paths.push_back(render::rectPath(self.getBounds(shape), 0.0f));
    return node;
}

} // namespace

ShapeBehaviorOverrides groupOverrides() {
    ShapeBehaviorOverrides o;
    o.canStyleFill = false;
    o.ops.getBounds = &groupBounds;
    o.ops.transform = &groupTransform;
    o.ops.onChildrenChange = &groupChildrenChange;
    o.ops.render = &renderGroup;
    return o;
}

} // namespace shapekit::variants
