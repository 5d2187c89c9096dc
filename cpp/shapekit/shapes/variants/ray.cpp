#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/geometry/bounds.h"
#include "shapekit/geometry/vec.h"

namespace shapekit::variants {

namespace {

Point2 rayEnd(const Shape& shape) {
    return vec::add(shape.point, vec::mul(vec::uni(shape.as<RayData>().direction), constants::INFINITE_LINE_EXTENT));
}

bool rayHitTest(const ShapeBehavior&, const Shape& shape, Point2 point) {
    return vec::distToSegment(point, shape.point, rayEnd(shape)) <= constants::HIT_TOLERANCE;
}

bool rayHitTestBounds(const ShapeBehavior&, const Shape& shape, const Bounds& bounds) {
    return geometry::segmentIntersectsBounds(shape.point, rayEnd(shape), bounds);
}

render::RenderNode renderRay(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    node.hasTransform = false;
    node.transform = render::Transform2D{};
    render::Path path;
    path.segments.push_back(render::Segment::moveTo(shape.point));
    path.segments.push_back(render::Segment::lineTo(rayEnd(shape)));
    node.paths.push_back(path);
    return node;
}

} // namespace

ShapeBehaviorOverrides rayOverrides() {
    ShapeBehaviorOverrides o;
    o.canTransform = false;
    o.canChangeAspectRatio = false;
    o.canStyleFill = false;
    o.ops.hitTest = &rayHitTest;
    o.ops.hitTestBounds = &rayHitTestBounds;
    o.ops.render = &renderRay;
    return o;
}

} // namespace shapekit::variants
