#ifndef SHAPEKIT_SHAPES_SHAPE_BEHAVIOR_H
#define SHAPEKIT_SHAPES_SHAPE_BEHAVIOR_H

#include "shapekit/core/types.h"
#include "shapekit/render/render_node.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace shapekit {

class ShapeBehavior;
class ShapeRegistry;

namespace text {
class TextMeasurer;
}

// Services a behavior may reach through ShapeBehavior::context().
struct BehaviorContext {
    const ShapeRegistry* registry = nullptr;        // for kinds that inspect other shapes
    const text::TextMeasurer* textMeasurer = nullptr; // null = fallback metrics
};

// Function table shared by all shapes of one kind. Every entry receives the
// behavior it belongs to, so defaults can call back into overridden entries
// (e.g. the default getRotatedBounds uses the kind's own getBounds).
using CreateFn = Shape(*)(const ShapeBehavior& self, const ShapeInit& init);
using TranslateFn = void(*)(const ShapeBehavior& self, Shape& shape, Point2 value);
using TransformFn = void(*)(const ShapeBehavior& self, Shape& shape, const Bounds& bounds, const TransformInfo& info);
using SetPropertyFn = void(*)(const ShapeBehavior& self, Shape& shape, ShapeProp prop, const PropValue& value);
using ApplyStylesFn = void(*)(const ShapeBehavior& self, Shape& shape, const ShapeStylePatch& style);
using ChildrenChangeFn = void(*)(const ShapeBehavior& self, Shape& shape, const std::vector<const Shape*>& children);
using BindingChangeFn = void(*)(const ShapeBehavior& self, Shape& shape, const ShapeBindings& bindings);
using HandleChangeFn = void(*)(const ShapeBehavior& self, Shape& shape, const HandlePatch& handles);
using RenderFn = render::RenderNode(*)(const ShapeBehavior& self, const Shape& shape);
using BoundsFn = Bounds(*)(const ShapeBehavior& self, const Shape& shape);
using CenterFn = Point2(*)(const ShapeBehavior& self, const Shape& shape);
using HitTestFn = bool(*)(const ShapeBehavior& self, const Shape& shape, Point2 point);
using HitTestBoundsFn = bool(*)(const ShapeBehavior& self, const Shape& shape, const Bounds& bounds);

struct ShapeBehaviorTable {
    CreateFn create = nullptr;
    TranslateFn translateBy = nullptr;
    TranslateFn translateTo = nullptr;
    TransformFn transform = nullptr;
    TransformFn transformSingle = nullptr;
    SetPropertyFn setProperty = nullptr;
    ApplyStylesFn applyStyles = nullptr;
    ChildrenChangeFn onChildrenChange = nullptr;
    BindingChangeFn onBindingChange = nullptr;
    HandleChangeFn onHandleChange = nullptr;
    RenderFn render = nullptr;
    BoundsFn getBounds = nullptr;
    BoundsFn getRotatedBounds = nullptr;
    CenterFn getCenter = nullptr;
    HitTestFn hitTest = nullptr;
    HitTestBoundsFn hitTestBounds = nullptr;
};

// Partial behavior: unset flags and null entries fall back to the defaults.
struct ShapeBehaviorOverrides {
    std::optional<bool> canTransform;
    std::optional<bool> canChangeAspectRatio;
    std::optional<bool> canStyleFill;
    ShapeBehaviorTable ops{};
};

// Overlays overrides onto base. Throws IncompleteBehavior if any entry is
// still unset afterwards.
ShapeBehavior buildShapeBehavior(ShapeType type, const ShapeBehaviorTable& base,
                                 const ShapeBehaviorOverrides& overrides, const BehaviorContext& context = BehaviorContext{});

/**
 * ShapeBehavior: the capability object for one shape kind.
 *
 * One instance is shared by every shape of its kind; shapes are passed in as
 * explicit state. The operation table is fixed at construction and only const
 * members are exposed. The one piece of internal state is the bounds cache,
 * keyed by shape id and validated against Shape::revision and the text
 * measurer's font generation.
 *
 * Mutating operations stamp a fresh revision after running, so a cached
 * entry is never served across a mutation made through this class. Entries
 * live until the owning store evicts them (ShapeRegistry::forgetShape) or the
 * cache is cleared.
 */
class ShapeBehavior {
public:
    ShapeBehavior(ShapeBehavior&&) = default;
    ShapeBehavior(const ShapeBehavior&) = delete;
    ShapeBehavior& operator=(const ShapeBehavior&) = delete;
    ShapeBehavior& operator=(ShapeBehavior&&) = delete;

    ShapeType type() const noexcept { return type_; }
    bool canTransform() const noexcept { return canTransform_; }
    bool canChangeAspectRatio() const noexcept { return canChangeAspectRatio_; }
    bool canStyleFill() const noexcept { return canStyleFill_; }

    const ShapeBehaviorTable& operations() const noexcept { return ops_; }
    const BehaviorContext& context() const noexcept { return context_; }

    // Creation
    Shape create(const ShapeInit& init = ShapeInit{}) const;

    // Mutation
    void translateBy(Shape& shape, Point2 delta) const;
    void translateTo(Shape& shape, Point2 point) const;
    void transform(Shape& shape, const Bounds& bounds, const TransformInfo& info) const;
    void transformSingle(Shape& shape, const Bounds& bounds, const TransformInfo& info) const;
    void setProperty(Shape& shape, ShapeProp prop, const PropValue& value) const;
    void applyStyles(Shape& shape, const ShapeStylePatch& style) const;

    // Reaction hooks
    void onChildrenChange(Shape& shape, const std::vector<const Shape*>& children) const;
    void onBindingChange(Shape& shape, const ShapeBindings& bindings) const;
    void onHandleChange(Shape& shape, const HandlePatch& handles) const;

    // Queries
    render::RenderNode render(const Shape& shape) const;
    Bounds getBounds(const Shape& shape) const;
    Bounds getRotatedBounds(const Shape& shape) const;
    Point2 getCenter(const Shape& shape) const;
    bool hitTest(const Shape& shape, Point2 point) const;
    bool hitTestBounds(const Shape& shape, const Bounds& bounds) const;

    // Bounds cache
    void invalidateBounds(const Shape& shape) const;
    void invalidateBounds(const ShapeId& id) const;
    void clearBoundsCache() const;
    std::size_t boundsCacheSize() const noexcept { return boundsCache_.size(); }

private:
    friend ShapeBehavior buildShapeBehavior(ShapeType type, const ShapeBehaviorTable& base,
                                            const ShapeBehaviorOverrides& overrides, const BehaviorContext& context);

    ShapeBehavior(ShapeType type, bool canTransform, bool canChangeAspectRatio, bool canStyleFill,
                  const ShapeBehaviorTable& ops, const BehaviorContext& context);

    void requireType(const Shape& shape) const;
    std::uint64_t fontGeneration() const noexcept;

    struct CachedBounds {
        std::uint64_t revision;
        std::uint64_t fontGeneration;
        Bounds bounds;
    };

    ShapeType type_;
    bool canTransform_;
    bool canChangeAspectRatio_;
    bool canStyleFill_;
    ShapeBehaviorTable ops_;
    BehaviorContext context_;
    mutable std::unordered_map<ShapeId, CachedBounds> boundsCache_;
};

// Overlays overrides onto defaults::table().
ShapeBehavior buildShapeBehavior(ShapeType type, const ShapeBehaviorOverrides& overrides, const BehaviorContext& context = BehaviorContext{});

} // namespace shapekit

#endif // SHAPEKIT_SHAPES_SHAPE_BEHAVIOR_H
