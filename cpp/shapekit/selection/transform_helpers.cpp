#include "shapekit/selection/transform_helpers.h"
#include "shapekit/selection/selection_query.h"
#include "shapekit/core/logging.h"
#include "shapekit/geometry/vec.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace shapekit::selection {

namespace {

// Scale between two extents; a zero-size source counts as unscaled.
float scaleOf(float extent, float initialExtent) {
    return initialExtent == 0.0f ? 1.0f : extent / initialExtent;
}

float ratio(float num, float den) {
    return den == 0.0f ? 0.0f : num / den;
}

float signOf(float v) {
    return v < 0.0f ? -1.0f : 1.0f;
}

bool movesLeft(TransformHandle h) {
    return h == TransformHandle::LeftEdge || h == TransformHandle::TopLeftCorner || h == TransformHandle::BottomLeftCorner;
}

bool movesRight(TransformHandle h) {
    return h == TransformHandle::RightEdge || h == TransformHandle::TopRightCorner || h == TransformHandle::BottomRightCorner;
}

bool movesTop(TransformHandle h) {
    return h == TransformHandle::TopEdge || h == TransformHandle::TopLeftCorner || h == TransformHandle::TopRightCorner;
}

bool movesBottom(TransformHandle h) {
    return h == TransformHandle::BottomEdge || h == TransformHandle::BottomLeftCorner || h == TransformHandle::BottomRightCorner;
}

} // namespace

TransformedBounds getTransformedBoundingBox(const Bounds& initial, TransformHandle handle, Point2 delta, bool lockAspect) {
    float x0 = initial.minX;
    float y0 = initial.minY;
    float x1 = initial.maxX;
    float y1 = initial.maxY;

    if (movesLeft(handle)) x0 += delta.x;
    if (movesRight(handle)) x1 += delta.x;
    if (movesTop(handle)) y0 += delta.y;
    if (movesBottom(handle)) y1 += delta.y;

    float scaleX = scaleOf(x1 - x0, initial.width);
    float scaleY = scaleOf(y1 - y0, initial.height);

    if (lockAspect) {
        switch (handle) {
            case TransformHandle::TopLeftCorner:
            case TransformHandle::TopRightCorner:
            case TransformHandle::BottomRightCorner:
            case TransformHandle::BottomLeftCorner: {
                const float s = std::max(std::abs(scaleX), std::abs(scaleY));
                scaleX = signOf(scaleX) * s;
                scaleY = signOf(scaleY) * s;
                break;
            }
            case TransformHandle::TopEdge:
            case TransformHandle::BottomEdge:
                scaleX = std::abs(scaleY);
                break;
            case TransformHandle::LeftEdge:
            case TransformHandle::RightEdge:
                scaleY = std::abs(scaleX);
                break;
        }

        // Rebuild the moving sides from the fixed ones
        const float w = initial.width * scaleX;
        const float h = initial.height * scaleY;
        if (movesLeft(handle)) {
            x0 = initial.maxX - w;
        } else if (movesRight(handle)) {
            x1 = initial.minX + w;
        } else {
            const float cx = (initial.minX + initial.maxX) * 0.5f;
            x0 = cx - w * 0.5f;
            x1 = cx + w * 0.5f;
        }
        if (movesTop(handle)) {
            y0 = initial.maxY - h;
        } else if (movesBottom(handle)) {
            y1 = initial.minY + h;
        } else {
            const float cy = (initial.minY + initial.maxY) * 0.5f;
            y0 = cy - h * 0.5f;
            y1 = cy + h * 0.5f;
        }
    }

    if (x1 < x0) std::swap(x0, x1);
    if (y1 < y0) std::swap(y0, y1);

    return TransformedBounds{Bounds::fromMinMax(x0, y0, x1, y1), scaleX, scaleY};
}

Bounds getRelativeTransformedBoundingBox(
    const Bounds& bounds,
    const Bounds& initialBounds,
    const Bounds& initialShapeBounds,
    bool flipX,
    bool flipY
) {
    const float nx = ratio(
        flipX ? initialBounds.maxX - initialShapeBounds.maxX : initialShapeBounds.minX - initialBounds.minX,
        initialBounds.width);
    const float ny = ratio(
        flipY ? initialBounds.maxY - initialShapeBounds.maxY : initialShapeBounds.minY - initialBounds.minY,
        initialBounds.height);
    const float nw = ratio(initialShapeBounds.width, initialBounds.width);
    const float nh = ratio(initialShapeBounds.height, initialBounds.height);

    const float minX = bounds.minX + bounds.width * nx;
    const float minY = bounds.minY + bounds.height * ny;
    return Bounds::fromMinMax(minX, minY, minX + bounds.width * nw, minY + bounds.height * nh);
}

void transformSelection(
    const std::vector<Shape*>& shapes,
    const std::vector<Shape>& snapshots,
    TransformHandle handle,
    Point2 delta,
    bool lockAspect,
    const ShapeRegistry& registry
) {
    if (shapes.size() != snapshots.size()) {
        throw std::invalid_argument("transformSelection: shapes and snapshots differ in length");
    }
    if (shapes.empty()) return;

    if (shapes.size() == 1) {
        Shape& shape = *shapes[0];
        const Shape& initial = snapshots[0];
        const ShapeBehavior& utils = registry.getShapeUtils(shape);
        const TransformedBounds next = getTransformedBoundingBox(
            utils.getBounds(initial), handle, delta, lockAspect || initial.isAspectRatioLocked || !utils.canChangeAspectRatio());
        if (!utils.canTransform()) {
            utils.translateTo(shape, Point2{next.bounds.minX, next.bounds.minY});
            return;
        }
        const TransformInfo info{handle, initial, next.scaleX, next.scaleY, Point2{0.0f, 0.0f}};
        utils.transformSingle(shape, next.bounds, info);
        return;
    }

    std::vector<const Shape*> initialShapes;
    initialShapes.reserve(snapshots.size());
    for (const Shape& s : snapshots) initialShapes.push_back(&s);
    const Bounds initialCommon = getSelectionBounds(initialShapes, registry);

    const TransformedBounds next = getTransformedBoundingBox(initialCommon, handle, delta, lockAspect);
    if (next.bounds.width == 0.0f || next.bounds.height == 0.0f) {
        SHAPEKIT_LOG_WARN("selection collapsed to zero size");
    }
    const bool flipX = next.scaleX < 0.0f;
    const bool flipY = next.scaleY < 0.0f;

    for (std::size_t i = 0; i < shapes.size(); ++i) {
        Shape& shape = *shapes[i];
        const Shape& initial = snapshots[i];
        const ShapeBehavior& utils = registry.getShapeUtils(shape);

        const Bounds initialShapeBounds = utils.getRotatedBounds(initial);
        const Bounds relative = getRelativeTransformedBoundingBox(
            next.bounds, initialCommon, initialShapeBounds, flipX, flipY);

        if (!utils.canTransform()) {
            // Keep its place in the selection without resizing
            const Point2 offset{relative.minX - initialShapeBounds.minX, relative.minY - initialShapeBounds.minY};
            utils.translateTo(shape, vec::add(initial.point, offset));
            continue;
        }

        const Point2 origin{
            ratio(initialShapeBounds.minX - initialCommon.minX, initialCommon.width),
            ratio(initialShapeBounds.minY - initialCommon.minY, initialCommon.height),
        };
        const TransformInfo info{handle, initial, next.scaleX, next.scaleY, origin};
        utils.transform(shape, relative, info);
    }
}

} // namespace shapekit::selection
