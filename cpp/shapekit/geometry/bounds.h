#ifndef SHAPEKIT_GEOMETRY_BOUNDS_H
#define SHAPEKIT_GEOMETRY_BOUNDS_H

#include "shapekit/core/types.h"

#include <array>
#include <cstddef>
#include <vector>

// Pure, deterministic bounds/polygon helpers consumed by the shape behaviors.

namespace shapekit::geometry {

using Corners = std::array<Point2, 4>;

// Smallest box around the points. An empty set yields a zero box at the origin.
Bounds boundsFromPoints(const Point2* points, std::size_t count) noexcept;
inline Bounds boundsFromPoints(const std::vector<Point2>& points) noexcept {
    return boundsFromPoints(points.data(), points.size());
}
inline Bounds boundsFromPoints(const Corners& corners) noexcept {
    return boundsFromPoints(corners.data(), corners.size());
}

// Corners (TL, TR, BR, BL) rotated by angle about the bounds center.
Corners rotateCorners(const Bounds& bounds, float angle) noexcept;

Point2 boundsCenter(const Bounds& bounds) noexcept;

// Inclusive of the edges.
bool pointInBounds(Point2 point, const Bounds& bounds) noexcept;

// True if point lies inside bounds rotated by angle about its center.
bool pointInRotatedBounds(Point2 point, const Bounds& bounds, float angle) noexcept;

bool pointInPolygon(Point2 point, const Point2* polygon, std::size_t count) noexcept;

// True if every vertex of the polygon is inside bounds.
bool boundsContainPolygon(const Bounds& bounds, const Point2* polygon, std::size_t count) noexcept;
inline bool boundsContainPolygon(const Bounds& bounds, const Corners& corners) noexcept {
    return boundsContainPolygon(bounds, corners.data(), corners.size());
}

// True if the closed polygon's outline crosses the bounds outline, or if one
// region lies inside the other.
bool boundsCollidePolygon(const Bounds& bounds, const Point2* polygon, std::size_t count) noexcept;
inline bool boundsCollidePolygon(const Bounds& bounds, const Corners& corners) noexcept {
    return boundsCollidePolygon(bounds, corners.data(), corners.size());
}

// Open-path variant: true if any segment touches the bounds.
bool boundsCollidePolyline(const Bounds& bounds, const Point2* points, std::size_t count) noexcept;

bool segmentsIntersect(Point2 a0, Point2 a1, Point2 b0, Point2 b1) noexcept;
bool segmentIntersectsBounds(Point2 a, Point2 b, const Bounds& bounds) noexcept;

bool boundsContain(const Bounds& outer, const Bounds& inner) noexcept;
bool boundsCollide(const Bounds& a, const Bounds& b) noexcept;

Bounds expandBounds(const Bounds& bounds, float delta) noexcept;
Bounds translateBounds(const Bounds& bounds, Point2 delta) noexcept;

// Union of all boxes; an empty list yields a zero box at the origin.
Bounds commonBounds(const std::vector<Bounds>& bounds) noexcept;

// Axis-aligned box of an ellipse with the given radii rotated about center.
Bounds rotatedEllipseBounds(Point2 center, float radiusX, float radiusY, float angle) noexcept;

} // namespace shapekit::geometry

#endif // SHAPEKIT_GEOMETRY_BOUNDS_H
