#include "shapekit/render/render_node.h"

#include <algorithm>
#include <cmath>

namespace shapekit::render {

namespace {
constexpr float kPi = 3.14159265358979323846f;
}

Transform2D rotationAbout(Point2 pivot, float angle) noexcept {
    const float cosA = std::cos(angle);
    const float sinA = std::sin(angle);
    Transform2D t;
    t.a = cosA;
    t.b = sinA;
    t.c = -sinA;
    t.d = cosA;
    t.e = pivot.x - cosA * pivot.x + sinA * pivot.y;
    t.f = pivot.y - sinA * pivot.x - cosA * pivot.y;
    return t;
}

Style resolveStyle(const ShapeStyle& style, bool canFill) {
    Style out;
    out.fillEnabled = canFill && style.isFilled;
    out.fillRGBA = style.fillRGBA;
    out.strokeEnabled = style.strokeWidth > 0.0f;
    out.stroke.rgba = style.strokeRGBA;
    out.stroke.width = style.strokeWidth;
    switch (style.dash) {
        case DashStyle::Solid:
            break;
        case DashStyle::Dashed:
            out.stroke.dash = {style.strokeWidth * 2.0f, style.strokeWidth * 2.0f};
            break;
        case DashStyle::Dotted:
            out.stroke.dash = {0.0f, style.strokeWidth * 2.0f};
            break;
    }
    return out;
}

Path ellipsePath(Point2 center, float radiusX, float radiusY) {
    Path path;
    path.segments.push_back(Segment::moveTo(Point2{center.x + radiusX, center.y}));
    path.segments.push_back(Segment::arc(center, Point2{radiusX, radiusY}, 0.0f, 2.0f * kPi));
    path.segments.push_back(Segment::close());
    path.closed = true;
    return path;
}

Path rectPath(const Bounds& bounds, float cornerRadius) {
    Path path;
    path.closed = true;
    const float r = std::max(0.0f, std::min(cornerRadius, std::min(bounds.width, bounds.height) * 0.5f));

    if (r == 0.0f) {
        path.segments.push_back(Segment::moveTo(Point2{bounds.minX, bounds.minY}));
        path.segments.push_back(Segment::lineTo(Point2{bounds.maxX, bounds.minY}));
        path.segments.push_back(Segment::lineTo(Point2{bounds.maxX, bounds.maxY}));
        path.segments.push_back(Segment::lineTo(Point2{bounds.minX, bounds.maxY}));
        path.segments.push_back(Segment::close());
        return path;
    }

    const Point2 radius{r, r};
    path.segments.push_back(Segment::moveTo(Point2{bounds.minX + r, bounds.minY}));
    path.segments.push_back(Segment::lineTo(Point2{bounds.maxX - r, bounds.minY}));
    path.segments.push_back(Segment::arc(Point2{bounds.maxX - r, bounds.minY + r}, radius, -0.5f * kPi, 0.0f));
    path.segments.push_back(Segment::lineTo(Point2{bounds.maxX, bounds.maxY - r}));
    path.segments.push_back(Segment::arc(Point2{bounds.maxX - r, bounds.maxY - r}, radius, 0.0f, 0.5f * kPi));
    path.segments.push_back(Segment::lineTo(Point2{bounds.minX + r, bounds.maxY}));
    path.segments.push_back(Segment::arc(Point2{bounds.minX + r, bounds.maxY - r}, radius, 0.5f * kPi, kPi));
    path.segments.push_back(Segment::lineTo(Point2{bounds.minX, bounds.minY + r}));
    path.segments.push_back(Segment::arc(Point2{bounds.minX + r, bounds.minY + r}, radius, kPi, 1.5f * kPi));
    path.segments.push_back(Segment::close());
    return path;
}

Path polylinePath(const std::vector<Point2>& points, Point2 offset) {
    Path path;
    for (std::size_t i = 0; i < points.size(); ++i) {
        const Point2 p{points[i].x + offset.x, points[i].y + offset.y};
        path.segments.push_back(i == 0 ? Segment::moveTo(p) : Segment::lineTo(p));
    }
    return path;
}

} // namespace shapekit::render
