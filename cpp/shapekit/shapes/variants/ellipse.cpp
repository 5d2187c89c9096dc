#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/geometry/bounds.h"
#include "shapekit/geometry/vec.h"

#include <cmath>
#include <vector>

namespace shapekit::variants {

namespace {

constexpr float kPi = 3.14159265358979323846f;

Point2 ellipseCenter(const Shape& shape) {
    const EllipseData& e = shape.as<EllipseData>();
    return Point2{shape.point.x + e.radiusX, shape.point.y + e.radiusY};
}

Bounds ellipseBounds(const ShapeBehavior&, const Shape& shape) {
    const EllipseData& e = shape.as<EllipseData>();
    return Bounds::fromMinMax(
        shape.point.x, shape.point.y,
        shape.point.x + e.radiusX * 2.0f, shape.point.y + e.radiusY * 2.0f);
}

Bounds ellipseRotatedBounds(const ShapeBehavior&, const Shape& shape) {
    const EllipseData& e = shape.as<EllipseData>();
    return geometry::rotatedEllipseBounds(ellipseCenter(shape), e.radiusX, e.radiusY, shape.rotation);
}

bool ellipseHitTest(const ShapeBehavior&, const Shape& shape, Point2 point) {
    const EllipseData& e = shape.as<EllipseData>();
    const Point2 center = ellipseCenter(shape);
    const Point2 local = vec::sub(vec::rotWith(point, center, -shape.rotation), center);
    const float rx = e.radiusX + shape.style.strokeWidth * 0.5f;
    const float ry = e.radiusY + shape.style.strokeWidth * 0.5f;
    if (rx <= 0.0f || ry <= 0.0f) return false;
    const float nx = local.x / rx;
    const float ny = local.y / ry;
    return nx * nx + ny * ny <= 1.0f;
}

// Outline approximated by ELLIPSE_SEGMENTS vertices, in world space.
std::vector<Point2> ellipsePolygon(const Shape& shape) {
    const EllipseData& e = shape.as<EllipseData>();
    const Point2 center = ellipseCenter(shape);
    std::vector<Point2> polygon;
    polygon.reserve(constants::ELLIPSE_SEGMENTS);
    for (std::size_t i = 0; i < constants::ELLIPSE_SEGMENTS; ++i) {
        const float t = 2.0f * kPi * static_cast<float>(i) / static_cast<float>(constants::ELLIPSE_SEGMENTS);
        const Point2 p{center.x + e.radiusX * std::cos(t), center.y + e.radiusY * std::sin(t)};
        polygon.push_back(vec::rotWith(p, center, shape.rotation));
    }
    return polygon;
}

bool ellipseHitTestBounds(const ShapeBehavior&, const Shape& shape, const Bounds& bounds) {
    const std::vector<Point2> polygon = ellipsePolygon(shape);
    return geometry::boundsContainPolygon(bounds, polygon.data(), polygon.size())
        || geometry::boundsCollidePolygon(bounds, polygon.data(), polygon.size());
}

void ellipseTransform(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo& info) {
    EllipseData& e = shape.as<EllipseData>();
    e.radiusX = bounds.width * 0.5f;
    e.radiusY = bounds.height * 0.5f;
    shape.point = Point2{bounds.minX, bounds.minY};

    const bool flipped = (info.scaleX < 0.0f) != (info.scaleY < 0.0f);
    shape.rotation = flipped ? -info.initialShape.rotation : info.initialShape.rotation;
}

render::RenderNode renderEllipse(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    const EllipseData& e = shape.as<EllipseData>();
    node.paths.push_back(render::ellipsePath(ellipseCenter(shape), e.radiusX, e.radiusY));
    return node;
}

} // namespace

ShapeBehaviorOverrides ellipseOverrides() {
    ShapeBehaviorOverrides o;
    o.ops.getBounds = &ellipseBounds;
    o.ops.getRotatedBounds = &ellipseRotatedBounds;
    o.ops.hitTest = &ellipseHitTest;
    o.ops.hitTestBounds = &ellipseHitTestBounds;
    o.ops.transform = &ellipseTransform;
    o.ops.render = &renderEllipse;
    return o;
}

} // namespace shapekit::variants
