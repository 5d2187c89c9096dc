#ifndef SHAPEKIT_CORE_UTIL_H
#define SHAPEKIT_CORE_UTIL_H

#include "shapekit/core/types.h"

#include <cmath>
#include <string>

namespace shapekit {

static inline bool isFinite(float v) noexcept {
    return std::isfinite(v);
}

static inline bool isFinite(const Point2& p) noexcept {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

// Random (v4) UUID string for new shapes.
ShapeId generateShapeId();

} // namespace shapekit

#endif // SHAPEKIT_CORE_UTIL_H
