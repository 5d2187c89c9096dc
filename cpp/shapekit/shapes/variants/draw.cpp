#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/variants/point_list_geometry.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/geometry/vec.h"

namespace shapekit::variants {

namespace {

// Freehand strokes are drawn through the midpoints of consecutive samples,
// using each sample as the quadratic control point.
render::Path smoothPath(const std::vector<Point2>& points, Point2 offset) {
    if (points.size() < 3) {
        return render::polylinePath(points, offset);
    }

    render::Path path;
    path.segments.push_back(render::Segment::moveTo(vec::add(points[0], offset)));
    for (std::size_t i = 1; i + 1 < points.size(); ++i) {
        const Point2 control = vec::add(points[i], offset);
        const Point2 to = vec::add(vec::med(points[i], points[i + 1]), offset);
        path.segments.push_back(render::Segment::quadTo(control, to));
    }
    path.segments.push_back(render::Segment::lineTo(vec::add(points.back(), offset)));
    return path;
}

render::RenderNode renderDraw(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    node.paths.push_back(smoothPath(shape.as<DrawData>().points, shape.point));
    return node;
}

} // namespace

ShapeBehaviorOverrides drawOverrides() {
    ShapeBehaviorOverrides o;
    o.canStyleFill = false;
    o.ops.getBounds = &pointListBounds;
    o.ops.hitTest = &pointListHitTest;
    o.ops.hitTestBounds = &pointListHitTestBounds;
    o.ops.transform = &pointListTransform;
    o.ops.render = &renderDraw;
    return o;
}

} // namespace shapekit::variants
