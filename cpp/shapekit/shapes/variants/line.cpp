#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/geometry/bounds.h"
#include "shapekit/geometry/vec.h"

namespace shapekit::variants {

namespace {

// The unbounded line is stood in for by a segment INFINITE_LINE_EXTENT
// either side of point.
void lineSegment(const Shape& shape, Point2& a, Point2& b) {
    const Point2 d = vec::mul(vec::uni(shape.as<LineData>().direction), constants::INFINITE_LINE_EXTENT);
    a = vec::sub(shape.point, d);
    b = vec::add(shape.point, d);
}

bool lineHitTest(const ShapeBehavior&, const Shape& shape, Point2 point) {
    Point2 a{};
    Point2 b{};
    lineSegment(shape, a, b);
    return vec::distToSegment(point, a, b) <= constants::HIT_TOLERANCE;
}

bool lineHitTestBounds(const ShapeBehavior&, const Shape& shape, const Bounds& bounds) {
    Point2 a{};
    Point2 b{};
    lineSegment(shape, a, b);
    return geometry::segmentIntersectsBounds(a, b, bounds);
}

render::RenderNode renderLine(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    node.hasTransform = false;
    node.transform = render::Transform2D{};
    Point2 a{};
    Point2 b{};
    lineSegment(shape, a, b);
    render::Path path;
    path.segments.push_back(render::Segment::moveTo(a));
    path.segments.push_back(render::Segment::lineTo(b));
    node.paths.push_back(path);
    return node;
}

} // namespace

ShapeBehaviorOverrides lineOverrides() {
    ShapeBehaviorOverrides o;
    o.canTransform = false;
    o.canChangeAspectRatio = false;
    o.canStyleFill = false;
    o.ops.hitTest = &lineHitTest;
    o.ops.hitTestBounds = &lineHitTestBounds;
    o.ops.render = &renderLine;
    return o;
}

} // namespace shapekit::variants
