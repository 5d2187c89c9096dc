#include "shapekit/shapes/variants/point_list_geometry.h"
#include "shapekit/core/logging.h"
#include "shapekit/geometry/bounds.h"
#include "shapekit/geometry/vec.h"

#include <utility>

namespace shapekit::variants {

const std::vector<Point2>& pointsOf(const Shape& shape) {
    if (shape.type == ShapeType::Draw) return shape.as<DrawData>().points;
    return shape.as<PolylineData>().points;
}

std::vector<Point2>& pointsOf(Shape& shape) {
    if (shape.type == ShapeType::Draw) return shape.as<DrawData>().points;
    return shape.as<PolylineData>().points;
}

Bounds localPointBounds(const std::vector<Point2>& points) noexcept {
    return geometry::boundsFromPoints(points);
}

std::vector<Point2> worldPoints(const Shape& shape, Point2 center) {
    const std::vector<Point2>& points = pointsOf(shape);
    std::vector<Point2> out;
    out.reserve(points.size());
    for (const Point2& p : points) {
        out.push_back(vec::rotWith(vec::add(p, shape.point), center, shape.rotation));
    }
    return out;
}

Bounds pointListBounds(const ShapeBehavior&, const Shape& shape) {
    return geometry::translateBounds(localPointBounds(pointsOf(shape)), shape.point);
}

bool pointListHitTest(const ShapeBehavior& self, const Shape& shape, Point2 point) {
    const std::vector<Point2>& points = pointsOf(shape);
    if (points.empty()) return false;

    // Bring the test point into the unrotated, shape-relative frame
    const Point2 local = vec::sub(vec::rotWith(point, self.getCenter(shape), -shape.rotation), shape.point);
    const float reach = shape.style.strokeWidth * 0.5f + constants::HIT_TOLERANCE;

    if (points.size() == 1) {
        return vec::dist(local, points[0]) <= reach;
    }
    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        if (vec::distToSegment(local, points[i], points[i + 1]) <= reach) return true;
    }
    return false;
}

bool pointListHitTestBounds(const ShapeBehavior& self, const Shape& shape, const Bounds& bounds) {
    const std::vector<Point2> world = worldPoints(shape, self.getCenter(shape));
    if (world.empty()) return false;
    return geometry::boundsContainPolygon(bounds, world.data(), world.size())
        || geometry::boundsCollidePolyline(bounds, world.data(), world.size());
}

float rescaleAxis(float v, float fromMin, float fromSize, float toSize, bool flip) noexcept {
    if (fromSize == 0.0f) return 0.0f;
    const float t = (v - fromMin) / fromSize;
    return toSize * (flip ? 1.0f - t : t);
}

void pointListTransform(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo& info) {
    const std::vector<Point2>& initial = pointsOf(info.initialShape);
    const Bounds from = localPointBounds(initial);
    if (from.width == 0.0f || from.height == 0.0f) {
        SHAPEKIT_LOG_WARN("degenerate point list on shape %s", shape.id.c_str());
    }

    std::vector<Point2> next;
    next.reserve(initial.size());
    for (const Point2& p : initial) {
        next.push_back(Point2{
            rescaleAxis(p.x, from.minX, from.width, bounds.width, info.scaleX < 0.0f),
            rescaleAxis(p.y, from.minY, from.height, bounds.height, info.scaleY < 0.0f),
        });
    }
    pointsOf(shape) = std::move(next);
    shape.point = Point2{bounds.minX, bounds.minY};
}

} // namespace shapekit::variants
