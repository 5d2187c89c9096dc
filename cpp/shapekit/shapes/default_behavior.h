#ifndef SHAPEKIT_SHAPES_DEFAULT_BEHAVIOR_H
#define SHAPEKIT_SHAPES_DEFAULT_BEHAVIOR_H

#include "shapekit/shapes/shape_behavior.h"

// Base implementations every kind starts from. Kinds that only need to add a
// step call these directly (e.g. arrow create = defaults::create + handles).

namespace shapekit::defaults {

const ShapeBehaviorTable& table() noexcept;

Shape create(const ShapeBehavior& self, const ShapeInit& init);

void translateBy(const ShapeBehavior& self, Shape& shape, Point2 delta);
void translateTo(const ShapeBehavior& self, Shape& shape, Point2 point);

// Moves point to the top-left of bounds.
void transform(const ShapeBehavior& self, Shape& shape, const Bounds& bounds, const TransformInfo& info);

// Forwards to the kind's transform entry.
void transformSingle(const ShapeBehavior& self, Shape& shape, const Bounds& bounds, const TransformInfo& info);

void setProperty(const ShapeBehavior& self, Shape& shape, ShapeProp prop, const PropValue& value);
void applyStyles(const ShapeBehavior& self, Shape& shape, const ShapeStylePatch& style);

void onChildrenChange(const ShapeBehavior& self, Shape& shape, const std::vector<const Shape*>& children);
void onBindingChange(const ShapeBehavior& self, Shape& shape, const ShapeBindings& bindings);
void onHandleChange(const ShapeBehavior& self, Shape& shape, const HandlePatch& handles);

// Unit circle at point.
render::RenderNode render(const ShapeBehavior& self, const Shape& shape);

// 1x1 box at point.
Bounds getBounds(const ShapeBehavior& self, const Shape& shape);

// Box around the rotated corners of self.getBounds.
Bounds getRotatedBounds(const ShapeBehavior& self, const Shape& shape);
Point2 getCenter(const ShapeBehavior& self, const Shape& shape);
bool hitTest(const ShapeBehavior& self, const Shape& shape, Point2 point);

// Brush contains the rotated corners, or collides with their polygon.
bool hitTestBounds(const ShapeBehavior& self, const Shape& shape, const Bounds& bounds);

// Shared by kinds whose render output starts from the common node fields.
render::RenderNode makeRenderNode(const ShapeBehavior& self, const Shape& shape);

} // namespace shapekit::defaults

#endif // SHAPEKIT_SHAPES_DEFAULT_BEHAVIOR_H
