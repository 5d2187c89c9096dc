#ifndef SHAPEKIT_SHAPES_SHAPE_REGISTRY_H
#define SHAPEKIT_SHAPES_SHAPE_REGISTRY_H

#include "shapekit/shapes/shape_behavior.h"

#include <memory>
#include <vector>

namespace shapekit {

namespace text {
class TextMeasurer;
}

/**
 * ShapeRegistry: one ShapeBehavior per ShapeType.
 *
 * Populated once at construction and immutable afterwards. Behaviors keep a
 * pointer back to their registry (group fitting resolves children through
 * it), so a registry never moves.
 */
class ShapeRegistry {
public:
    explicit ShapeRegistry(const text::TextMeasurer* textMeasurer = nullptr);

    ShapeRegistry(const ShapeRegistry&) = delete;
    ShapeRegistry& operator=(const ShapeRegistry&) = delete;
    ShapeRegistry(ShapeRegistry&&) = delete;
    ShapeRegistry& operator=(ShapeRegistry&&) = delete;

    // Process-wide registry without a text measurer.
    static const ShapeRegistry& builtin();

    // Throws UnknownShapeType for a value outside the enum.
    const ShapeBehavior& lookup(ShapeType type) const;

    const ShapeBehavior& getShapeUtils(const Shape& shape) const { return lookup(shape.type); }

    Shape create(ShapeType type, const ShapeInit& init = ShapeInit{}) const;

    // Drops the cached bounds held for a deleted shape. The store calls this
    // on delete; nothing else evicts entries.
    void forgetShape(const ShapeId& id) const;

    void clearBoundsCaches() const;

    std::size_t boundsCacheSize() const noexcept;

    const text::TextMeasurer* textMeasurer() const noexcept { return textMeasurer_; }

private:
    const text::TextMeasurer* textMeasurer_;
    std::vector<std::unique_ptr<ShapeBehavior>> behaviors_;
};

// Shorthands over ShapeRegistry::builtin().
const ShapeBehavior& getShapeUtils(const Shape& shape);
Shape createShape(ShapeType type, const ShapeInit& init = ShapeInit{});

} // namespace shapekit

#endif // SHAPEKIT_SHAPES_SHAPE_REGISTRY_H
