#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/geometry/bounds.h"

#include <algorithm>
#include <cmath>

namespace shapekit::variants {

namespace {

Bounds rectangleBounds(const ShapeBehavior&, const Shape& shape) {
    const Point2 size = shape.as<RectangleData>().size;
    return Bounds::fromMinMax(shape.point.x, shape.point.y, shape.point.x + size.x, shape.point.y + size.y);
}

bool rectangleHitTest(const ShapeBehavior& self, const Shape& shape, Point2 point) {
    return geometry::pointInRotatedBounds(point, self.getBounds(shape), shape.rotation);
}

void rectangleTransform(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo& info) {
    RectangleData& rect = shape.as<RectangleData>();

    if (shape.rotation == 0.0f && !shape.isAspectRatioLocked) {
        rect.size = Point2{bounds.width, bounds.height};
        shape.point = Point2{bounds.minX, bounds.minY};
        return;
    }

    // Rotated or locked: scale uniformly and keep the shape's place in the selection
    const float scale = std::min(std::abs(info.scaleX), std::abs(info.scaleY));
    const Point2 initialSize = info.initialShape.as<RectangleData>().size;
    rect.size = Point2{initialSize.x * scale, initialSize.y * scale};

    const float ox = info.scaleX < 0.0f ? 1.0f - info.transformOrigin.x : info.transformOrigin.x;
    const float oy = info.scaleY < 0.0f ? 1.0f - info.transformOrigin.y : info.transformOrigin.y;
    shape.point = Point2{
        bounds.minX + (bounds.width - rect.size.x) * ox,
        bounds.minY + (bounds.height - rect.size.y) * oy,
    };

    const bool flipped = (info.scaleX < 0.0f) != (info.scaleY < 0.0f);
    shape.rotation = flipped ? -info.initialShape.rotation : info.initialShape.rotation;
}

void rectangleTransformSingle(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo&) {
    shape.as<RectangleData>().size = Point2{bounds.width, bounds.height};
    shape.point = Point2{bounds.minX, bounds.minY};
}

render::RenderNode renderRectangle(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    node.paths.push_back(render::rectPath(self.getBounds(shape), shape.as<RectangleData>().cornerRadius));
    return node;
}

} // namespace

ShapeBehaviorOverrides rectangleOverrides() {
    ShapeBehaviorOverrides o;
    o.ops.getBounds = &rectangleBounds;
    o.ops.hitTest = &rectangleHitTest;
    o.ops.transform = &rectangleTransform;
    o.ops.transformSingle = &rectangleTransformSingle;
    o.ops.render = &renderRectangle;
    return o;
}

} // namespace shapekit::variants
