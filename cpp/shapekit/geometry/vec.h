#ifndef SHAPEKIT_GEOMETRY_VEC_H
#define SHAPEKIT_GEOMETRY_VEC_H

#include "shapekit/core/types.h"

#include <algorithm>
#include <cmath>

namespace shapekit::vec {

inline Point2 add(Point2 a, Point2 b) noexcept { return Point2{a.x + b.x, a.y + b.y}; }
inline Point2 sub(Point2 a, Point2 b) noexcept { return Point2{a.x - b.x, a.y - b.y}; }
inline Point2 mul(Point2 a, float s) noexcept { return Point2{a.x * s, a.y * s}; }
inline Point2 neg(Point2 a) noexcept { return Point2{-a.x, -a.y}; }
inline Point2 med(Point2 a, Point2 b) noexcept { return Point2{(a.x + b.x) * 0.5f, (a.y + b.y) * 0.5f}; }

inline float dot(Point2 a, Point2 b) noexcept { return a.x * b.x + a.y * b.y; }
inline float cross(Point2 a, Point2 b) noexcept { return a.x * b.y - a.y * b.x; }
inline float len2(Point2 a) noexcept { return a.x * a.x + a.y * a.y; }
inline float len(Point2 a) noexcept { return std::sqrt(len2(a)); }
inline float dist2(Point2 a, Point2 b) noexcept { return len2(sub(a, b)); }
inline float dist(Point2 a, Point2 b) noexcept { return std::sqrt(dist2(a, b)); }

// Unit vector, or (0,0) for a zero-length input.
inline Point2 uni(Point2 a) noexcept {
    const float l = len(a);
    if (l == 0.0f) return Point2{0.0f, 0.0f};
    return Point2{a.x / l, a.y / l};
}

// Left-hand perpendicular.
inline Point2 per(Point2 a) noexcept { return Point2{a.y, -a.x}; }

inline Point2 lrp(Point2 a, Point2 b, float t) noexcept {
    return Point2{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

// Rotate p about center by angle radians.
inline Point2 rotWith(Point2 p, Point2 center, float angle) noexcept {
    if (angle == 0.0f) return p;
    const float s = std::sin(angle);
    const float c = std::cos(angle);
    const float px = p.x - center.x;
    const float py = p.y - center.y;
    return Point2{center.x + px * c - py * s, center.y + px * s + py * c};
}

inline float distToSegment2(Point2 p, Point2 a, Point2 b) noexcept {
    const float l2 = dist2(a, b);
    if (l2 == 0.0f) return dist2(p, a);
    float t = dot(sub(p, a), sub(b, a)) / l2;
    t = std::max(0.0f, std::min(1.0f, t));
    return dist2(p, lrp(a, b, t));
}

inline float distToSegment(Point2 p, Point2 a, Point2 b) noexcept {
    return std::sqrt(distToSegment2(p, a, b));
}

} // namespace shapekit::vec

#endif // SHAPEKIT_GEOMETRY_VEC_H
