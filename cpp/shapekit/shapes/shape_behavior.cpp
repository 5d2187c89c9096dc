#include "shapekit/shapes/shape_behavior.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/text/font_manager.h"
#include "shapekit/text/text_measure.h"

#include <string>

namespace shapekit {

ShapeBehavior::ShapeBehavior(ShapeType type, bool canTransform, bool canChangeAspectRatio, bool canStyleFill,
                             const ShapeBehaviorTable& ops, const BehaviorContext& context)
    : type_(type),
      canTransform_(canTransform),
      canChangeAspectRatio_(canChangeAspectRatio),
      canStyleFill_(canStyleFill),
      ops_(ops),
      context_(context) {}

void ShapeBehavior::requireType(const Shape& shape) const {
    if (shape.type != type_) {
        throw ShapeException(
            ShapeError::ShapeTypeMismatch,
            "shape '" + shape.id + "' is a " + shapeTypeName(shape.type) + ", behavior handles " + shapeTypeName(type_));
    }
}

std::uint64_t ShapeBehavior::fontGeneration() const noexcept {
    return context_.textMeasurer ? context_.textMeasurer->fonts().generation() : 0;
}

Shape ShapeBehavior::create(const ShapeInit& init) const {
    Shape shape = ops_.create(*this, init);
    shape.touch();
    return shape;
}

// ============================================================================
// Mutation
// ============================================================================

void ShapeBehavior::translateBy(Shape& shape, Point2 delta) const {
    requireType(shape);
    ops_.translateBy(*this, shape, delta);
    shape.touch();
}

void ShapeBehavior::translateTo(Shape& shape, Point2 point) const {
    requireType(shape);
    ops_.translateTo(*this, shape, point);
    shape.touch();
}

void ShapeBehavior::transform(Shape& shape, const Bounds& bounds, const TransformInfo& info) const {
    requireType(shape);
    requireType(info.initialShape);
    ops_.transform(*this, shape, bounds, info);
    shape.touch();
}

void ShapeBehavior::transformSingle(Shape& shape, const Bounds& bounds, const TransformInfo& info) const {
    requireType(shape);
    requireType(info.initialShape);
    ops_.transformSingle(*this, shape, bounds, info);
    shape.touch();
}

void ShapeBehavior::setProperty(Shape& shape, ShapeProp prop, const PropValue& value) const {
    requireType(shape);
    ops_.setProperty(*this, shape, prop, value);
    shape.touch();
}

void ShapeBehavior::applyStyles(Shape& shape, const ShapeStylePatch& style) const {
    requireType(shape);
    ops_.applyStyles(*this, shape, style);
    shape.touch();
}

// ============================================================================
// Reaction hooks
// ============================================================================

void ShapeBehavior::onChildrenChange(Shape& shape, const std::vector<const Shape*>& children) const {
    requireType(shape);
    ops_.onChildrenChange(*this, shape, children);
    shape.touch();
}

void ShapeBehavior::onBindingChange(Shape& shape, const ShapeBindings& bindings) const {
    requireType(shape);
    ops_.onBindingChange(*this, shape, bindings);
    shape.touch();
}

void ShapeBehavior::onHandleChange(Shape& shape, const HandlePatch& handles) const {
    requireType(shape);
    ops_.onHandleChange(*this, shape, handles);
    shape.touch();
}

// ============================================================================
// Queries
// ============================================================================

render::RenderNode ShapeBehavior::render(const Shape& shape) const {
    requireType(shape);
    return ops_.render(*this, shape);
}

Bounds ShapeBehavior::getBounds(const Shape& shape) const {
    requireType(shape);
    const std::uint64_t generation = fontGeneration();
    auto it = boundsCache_.find(shape.id);
    if (it != boundsCache_.end() && it->second.revision == shape.revision
        && it->second.fontGeneration == generation) {
        return it->second.bounds;
    }
    const Bounds bounds = ops_.getBounds(*this, shape);
    boundsCache_[shape.id] = CachedBounds{shape.revision, generation, bounds};
    return bounds;
}

Bounds ShapeBehavior::getRotatedBounds(const Shape& shape) const {
    requireType(shape);
    return ops_.getRotatedBounds(*this, shape);
}

Point2 ShapeBehavior::getCenter(const Shape& shape) const {
    requireType(shape);
    return ops_.getCenter(*this, shape);
}

bool ShapeBehavior::hitTest(const Shape& shape, Point2 point) const {
    requireType(shape);
    return ops_.hitTest(*this, shape, point);
}

bool ShapeBehavior::hitTestBounds(const Shape& shape, const Bounds& bounds) const {
    requireType(shape);
    return ops_.hitTestBounds(*this, shape, bounds);
}

void ShapeBehavior::invalidateBounds(const Shape& shape) const {
    boundsCache_.erase(shape.id);
}

void ShapeBehavior::invalidateBounds(const ShapeId& id) const {
    boundsCache_.erase(id);
}

void ShapeBehavior::clearBoundsCache() const {
    boundsCache_.clear();
}

// ============================================================================
// Builder
// ============================================================================

namespace {

template <typename Fn>
void overlay(Fn& target, Fn source) {
    if (source) target = source;
}

template <typename Fn>
void requireEntry(Fn entry, ShapeType type, const char* name) {
    if (!entry) {
        throw ShapeException(
            ShapeError::IncompleteBehavior,
            std::string(shapeTypeName(type)) + " behavior has no '" + name + "' operation");
    }
}

} // namespace

ShapeBehavior buildShapeBehavior(ShapeType type, const ShapeBehaviorTable& base,
                                 const ShapeBehaviorOverrides& overrides, const BehaviorContext& context) {
    ShapeBehaviorTable ops = base;
    const ShapeBehaviorTable& o = overrides.ops;
    overlay(ops.create, o.create);
    overlay(ops.translateBy, o.translateBy);
    overlay(ops.translateTo, o.translateTo);
    overlay(ops.transform, o.transform);
    overlay(ops.transformSingle, o.transformSingle);
    overlay(ops.setProperty, o.setProperty);
    overlay(ops.applyStyles, o.applyStyles);
    overlay(ops.onChildrenChange, o.onChildrenChange);
    overlay(ops.onBindingChange, o.onBindingChange);
    overlay(ops.onHandleChange, o.onHandleChange);
    overlay(ops.render, o.render);
    overlay(ops.getBounds, o.getBounds);
    overlay(ops.getRotatedBounds, o.getRotatedBounds);
    overlay(ops.getCenter, o.getCenter);
    overlay(ops.hitTest, o.hitTest);
    overlay(ops.hitTestBounds, o.hitTestBounds);

    requireEntry(ops.create, type, "create");
    requireEntry(ops.translateBy, type, "translateBy");
    requireEntry(ops.translateTo, type, "translateTo");
    requireEntry(ops.transform, type, "transform");
    requireEntry(ops.transformSingle, type, "transformSingle");
    requireEntry(ops.setProperty, type, "setProperty");
    requireEntry(ops.applyStyles, type, "applyStyles");
    requireEntry(ops.onChildrenChange, type, "onChildrenChange");
    requireEntry(ops.onBindingChange, type, "onBindingChange");
    requireEntry(ops.onHandleChange, type, "onHandleChange");
    requireEntry(ops.render, type, "render");
    requireEntry(ops.getBounds, type, "getBounds");
    requireEntry(ops.getRotatedBounds, type, "getRotatedBounds");
    requireEntry(ops.getCenter, type, "getCenter");
    requireEntry(ops.hitTest, type, "hitTest");
    requireEntry(ops.hitTestBounds, type, "hitTestBounds");

    return ShapeBehavior(
        type,
        overrides.canTransform.value_or(true),
        overrides.canChangeAspectRatio.value_or(true),
        overrides.canStyleFill.value_or(true),
        ops,
        context);
}

ShapeBehavior buildShapeBehavior(ShapeType type, const ShapeBehaviorOverrides& overrides, const BehaviorContext& context) {
    return buildShapeBehavior(type, defaults::table(), overrides, context);
}

} // namespace shapekit
