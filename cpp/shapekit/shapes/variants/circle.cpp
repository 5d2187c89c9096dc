#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/geometry/bounds.h"
#include "shapekit/geometry/vec.h"

#include <algorithm>
#include <cmath>

namespace shapekit::variants {

namespace {

// point is the top-left of the bounding square
Point2 circleCenter(const Shape& shape) {
    const float r = shape.as<CircleData>().radius;
    return Point2{shape.point.x + r, shape.point.y + r};
}

Bounds circleBounds(const ShapeBehavior&, const Shape& shape) {
    const float d = shape.as<CircleData>().radius * 2.0f;
    return Bounds::fromMinMax(shape.point.x, shape.point.y, shape.point.x + d, shape.point.y + d);
}

// Rotation does not change a circle's extent.
Bounds circleRotatedBounds(const ShapeBehavior& self, const Shape& shape) {
    return self.getBounds(shape);
}

bool circleHitTest(const ShapeBehavior&, const Shape& shape, Point2 point) {
    const float r = shape.as<CircleData>().radius;
    return vec::dist(point, circleCenter(shape)) <= r + shape.style.strokeWidth * 0.5f;
}

bool circleHitTestBounds(const ShapeBehavior& self, const Shape& shape, const Bounds& bounds) {
    if (geometry::boundsContain(bounds, self.getBounds(shape))) return true;
    // Closest point of the brush to the center
    const Point2 c = circleCenter(shape);
    const Point2 nearest{
        std::max(bounds.minX, std::min(c.x, bounds.maxX)),
        std::max(bounds.minY, std::min(c.y, bounds.maxY)),
    };
    return vec::dist(nearest, c) <= shape.as<CircleData>().radius;
}

void circleTransform(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo& info) {
    const float radius = info.initialShape.as<CircleData>().radius * std::min(std::abs(info.scaleX), std::abs(info.scaleY));
    const float ox = info.scaleX < 0.0f ? 1.0f - info.transformOrigin.x : info.transformOrigin.x;
    const float oy = info.scaleY < 0.0f ? 1.0f - info.transformOrigin.y : info.transformOrigin.y;

    shape.as<CircleData>().radius = radius;
    shape.point = Point2{
        bounds.minX + (bounds.width - radius * 2.0f) * ox,
        bounds.minY + (bounds.height - radius * 2.0f) * oy,
    };
}

void circleTransformSingle(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo&) {
    shape.as<CircleData>().radius = std::min(bounds.width, bounds.height) * 0.5f;
    shape.point = Point2{bounds.minX, bounds.minY};
}

render::RenderNode renderCircle(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    const float r = shape.as<CircleData>().radius;
    node.paths.push_back(render::ellipsePath(circleCenter(shape), r, r));
    return node;
}

} // namespace

ShapeBehaviorOverrides circleOverrides() {
    ShapeBehaviorOverrides o;
    o.canChangeAspectRatio = false;
    o.ops.getBounds = &circleBounds;
    o.ops.getRotatedBounds = &circleRotatedBounds;
    o.ops.hitTest = &circleHitTest;
    o.ops.hitTestBounds = &circleHitTestBounds;
    o.ops.transform = &circleTransform;
    o.ops.transformSingle = &circleTransformSingle;
    o.ops.render = &renderCircle;
    return o;
}

} // namespace shapekit::variants
