#include "shapekit/geometry/bounds.h"
#include "shapekit/geometry/vec.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace shapekit::geometry {

namespace {

float orient(Point2 a, Point2 b, Point2 c) noexcept {
    return vec::cross(vec::sub(b, a), vec::sub(c, a));
}

// c is known to be collinear with a-b.
bool onSegment(Point2 a, Point2 b, Point2 c) noexcept {
    return c.x >= std::min(a.x, b.x) && c.x <= std::max(a.x, b.x)
        && c.y >= std::min(a.y, b.y) && c.y <= std::max(a.y, b.y);
}

bool segmentCrossesBoundsEdges(Point2 a, Point2 b, const Bounds& bounds) noexcept {
    const Point2 tl{bounds.minX, bounds.minY};
    const Point2 tr{bounds.maxX, bounds.minY};
    const Point2 br{bounds.maxX, bounds.maxY};
    const Point2 bl{bounds.minX, bounds.maxY};
    return segmentsIntersect(a, b, tl, tr)
        || segmentsIntersect(a, b, tr, br)
        || segmentsIntersect(a, b, br, bl)
        || segmentsIntersect(a, b, bl, tl);
}

} // namespace

Bounds boundsFromPoints(const Point2* points, std::size_t count) noexcept {
    if (!points || count == 0) return Bounds::fromMinMax(0.0f, 0.0f, 0.0f, 0.0f);

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();

    for (std::size_t i = 0; i < count; ++i) {
        const Point2 p = points[i];
        if (p.x < minX) minX = p.x;
        if (p.x > maxX) maxX = p.x;
        if (p.y < minY) minY = p.y;
        if (p.y > maxY) maxY = p.y;
    }
    return Bounds::fromMinMax(minX, minY, maxX, maxY);
}

Corners rotateCorners(const Bounds& bounds, float angle) noexcept {
    const Point2 center = boundsCenter(bounds);
    return Corners{
        vec::rotWith(Point2{bounds.minX, bounds.minY}, center, angle),
        vec::rotWith(Point2{bounds.maxX, bounds.minY}, center, angle),
        vec::rotWith(Point2{bounds.maxX, bounds.maxY}, center, angle),
        vec::rotWith(Point2{bounds.minX, bounds.maxY}, center, angle),
    };
}

Point2 boundsCenter(const Bounds& bounds) noexcept {
    return Point2{bounds.minX + bounds.width * 0.5f, bounds.minY + bounds.height * 0.5f};
}

bool pointInBounds(Point2 point, const Bounds& bounds) noexcept {
    return point.x >= bounds.minX && point.x <= bounds.maxX
        && point.y >= bounds.minY && point.y <= bounds.maxY;
}

bool pointInRotatedBounds(Point2 point, const Bounds& bounds, float angle) noexcept {
    const Point2 local = vec::rotWith(point, boundsCenter(bounds), -angle);
    return pointInBounds(local, bounds);
}

bool pointInPolygon(Point2 point, const Point2* polygon, std::size_t count) noexcept {
    if (!polygon || count < 3) return false;
    bool inside = false;
    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        const Point2 a = polygon[i];
        const Point2 b = polygon[j];
        if ((a.y > point.y) != (b.y > point.y)) {
            const float xCross = (b.x - a.x) * (point.y - a.y) / (b.y - a.y) + a.x;
            if (point.x < xCross) inside = !inside;
        }
    }
    return inside;
}

bool boundsContainPolygon(const Bounds& bounds, const Point2* polygon, std::size_t count) noexcept {
    if (!polygon || count == 0) return false;
    for (std::size_t i = 0; i < count; ++i) {
        if (!pointInBounds(polygon[i], bounds)) return false;
    }
    return true;
}

bool boundsCollidePolygon(const Bounds& bounds, const Point2* polygon, std::size_t count) noexcept {
    if (!polygon || count == 0) return false;
    if (count == 1) return pointInBounds(polygon[0], bounds);

    for (std::size_t i = 0; i < count; ++i) {
        const Point2 a = polygon[i];
        const Point2 b = polygon[(i + 1) % count];
        if (segmentCrossesBoundsEdges(a, b, bounds)) return true;
    }

    // No edge crossings: either disjoint or one region encloses the other.
    if (pointInBounds(polygon[0], bounds)) return true;
    return pointInPolygon(Point2{bounds.minX, bounds.minY}, polygon, count);
}

bool boundsCollidePolyline(const Bounds& bounds, const Point2* points, std::size_t count) noexcept {
    if (!points || count == 0) return false;
    if (count == 1) return pointInBounds(points[0], bounds);
    for (std::size_t i = 0; i + 1 < count; ++i) {
        if (segmentIntersectsBounds(points[i], points[i + 1], bounds)) return true;
    }
    return false;
}

bool segmentsIntersect(Point2 a0, Point2 a1, Point2 b0, Point2 b1) noexcept {
    const float d1 = orient(b0, b1, a0);
    const float d2 = orient(b0, b1, a1);
    const float d3 = orient(a0, a1, b0);
    const float d4 = orient(a0, a1, b1);

    if (((d1 > 0.0f && d2 < 0.0f) || (d1 < 0.0f && d2 > 0.0f))
        && ((d3 > 0.0f && d4 < 0.0f) || (d3 < 0.0f && d4 > 0.0f))) {
        return true;
    }

    if (d1 == 0.0f && onSegment(b0, b1, a0)) return true;
    if (d2 == 0.0f && onSegment(b0, b1, a1)) return true;
    if (d3 == 0.0f && onSegment(a0, a1, b0)) return true;
    if (d4 == 0.0f && onSegment(a0, a1, b1)) return true;
    return false;
}

bool segmentIntersectsBounds(Point2 a, Point2 b, const Bounds& bounds) noexcept {
    if (pointInBounds(a, bounds) || pointInBounds(b, bounds)) return true;
    return segmentCrossesBoundsEdges(a, b, bounds);
}

bool boundsContain(const Bounds& outer, const Bounds& inner) noexcept {
    return inner.minX >= outer.minX && inner.minY >= outer.minY
        && inner.maxX <= outer.maxX && inner.maxY <= outer.maxY;
}

bool boundsCollide(const Bounds& a, const Bounds& b) noexcept {
    return a.minX <= b.maxX && a.maxX >= b.minX
        && a.minY <= b.maxY && a.maxY >= b.minY;
}

Bounds expandBounds(const Bounds& bounds, float delta) noexcept {
    return Bounds::fromMinMax(bounds.minX - delta, bounds.minY - delta, bounds.maxX + delta, bounds.maxY + delta);
}

Bounds translateBounds(const Bounds& bounds, Point2 delta) noexcept {
    return Bounds::fromMinMax(bounds.minX + delta.x, bounds.minY + delta.y, bounds.maxX + delta.x, bounds.maxY + delta.y);
}

Bounds commonBounds(const std::vector<Bounds>& bounds) noexcept {
    if (bounds.empty()) return Bounds::fromMinMax(0.0f, 0.0f, 0.0f, 0.0f);
    float minX = bounds[0].minX;
    float minY = bounds[0].minY;
    float maxX = bounds[0].maxX;
    float maxY = bounds[0].maxY;
    for (std::size_t i = 1; i < bounds.size(); ++i) {
        minX = std::min(minX, bounds[i].minX);
        minY = std::min(minY, bounds[i].minY);
        maxX = std::max(maxX, bounds[i].maxX);
        maxY = std::max(maxY, bounds[i].maxY);
    }
    return Bounds::fromMinMax(minX, minY, maxX, maxY);
}

Bounds rotatedEllipseBounds(Point2 center, float radiusX, float radiusY, float angle) noexcept {
    const float c = std::cos(angle);
    const float s = std::sin(angle);
    const float hx = std::sqrt(radiusX * radiusX * c * c + radiusY * radiusY * s * s);
    const float hy = std::sqrt(radiusX * radiusX * s * s + radiusY * radiusY * c * c);
    return Bounds::fromMinMax(center.x - hx, center.y - hy, center.x + hx, center.y + hy);
}

} // namespace shapekit::geometry
