#include "shapekit/shapes/default_behavior.h"
#include "shapekit/shapes/shape_properties.h"
#include "shapekit/core/util.h"
#include "shapekit/geometry/bounds.h"
#include "shapekit/geometry/vec.h"

#include <string>

namespace shapekit::defaults {

const ShapeBehaviorTable& table() noexcept {
    static const ShapeBehaviorTable kTable = [] {
        ShapeBehaviorTable t;
        t.create = &create;
        t.translateBy = &translateBy;
        t.translateTo = &translateTo;
        t.transform = &transform;
        t.transformSingle = &transformSingle;
        t.setProperty = &setProperty;
        t.applyStyles = &applyStyles;
        t.onChildrenChange = &onChildrenChange;
        t.onBindingChange = &onBindingChange;
        t.onHandleChange = &onHandleChange;
        t.render = &render;
        t.getBounds = &getBounds;
        t.getRotatedBounds = &getRotatedBounds;
        t.getCenter = &getCenter;
        t.hitTest = &hitTest;
        t.hitTestBounds = &hitTestBounds;
        return t;
    }();
    return kTable;
}

Shape create(const ShapeBehavior& self, const ShapeInit& init) {
    Shape shape;
    shape.type = self.type();
    shape.data = defaultShapeData(self.type());

    shape.id = init.id ? *init.id : generateShapeId();
    if (init.name) shape.name = *init.name;
    if (init.parentId) shape.parentId = *init.parentId;
    if (init.childIndex) shape.childIndex = *init.childIndex;
    if (init.point) shape.point = *init.point;
    if (init.rotation) shape.rotation = *init.rotation;
    if (init.isLocked) shape.isLocked = *init.isLocked;
    if (init.isHidden) shape.isHidden = *init.isHidden;
    if (init.isAspectRatioLocked) shape.isAspectRatioLocked = *init.isAspectRatioLocked;
    if (init.isGenerated) shape.isGenerated = *init.isGenerated;
    if (init.style) shape.style = *init.style;

    if (init.data) {
        if (shapeTypeOf(*init.data) != self.type()) {
            throw ShapeException(
                ShapeError::ShapeTypeMismatch,
                std::string("cannot create a ") + shapeTypeName(self.type()) + " from "
                    + shapeTypeName(shapeTypeOf(*init.data)) + " data");
        }
        shape.data = *init.data;
    }
    return shape;
}

void translateBy(const ShapeBehavior&, Shape& shape, Point2 delta) {
    shape.point = vec::add(shape.point, delta);
}

void translateTo(const ShapeBehavior&, Shape& shape, Point2 point) {
    shape.point = point;
}

void transform(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo&) {
    shape.point = Point2{bounds.minX, bounds.minY};
}

void transformSingle(const ShapeBehavior& self, Shape& shape, const Bounds& bounds, const TransformInfo& info) {
    self.operations().transform(self, shape, bounds, info);
}

void setProperty(const ShapeBehavior&, Shape& shape, ShapeProp prop, const PropValue& value) {
    assignShapeProperty(shape, prop, value);
}

void applyStyles(const ShapeBehavior&, Shape& shape, const ShapeStylePatch& style) {
    if (style.strokeRGBA) shape.style.strokeRGBA = *style.strokeRGBA;
    if (style.fillRGBA) shape.style.fillRGBA = *style.fillRGBA;
    if (style.strokeWidth) shape.style.strokeWidth = *style.strokeWidth;
    if (style.dash) shape.style.dash = *style.dash;
    if (style.isFilled) shape.style.isFilled = *style.isFilled;
}

void onChildrenChange(const ShapeBehavior&, Shape&, const std::vector<const Shape*>&) {}

void onBindingChange(const ShapeBehavior&, Shape&, const ShapeBindings&) {}

void onHandleChange(const ShapeBehavior&, Shape&, const HandlePatch&) {}

render::RenderNode makeRenderNode(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node;
    node.shapeId = shape.id;
    node.type = shape.type;
    node.style = render::resolveStyle(shape.style, self.canStyleFill());
    if (shape.rotation != 0.0f) {
        node.transform = render::rotationAbout(self.getCenter(shape), shape.rotation);
        node.hasTransform = true;
    }
    return node;
}

render::RenderNode render(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = makeRenderNode(self, shape);
    node.paths.push_back(render::ellipsePath(shape.point, 1.0f, 1.0f));
    return node;
}

Bounds getBounds(const ShapeBehavior&, const Shape& shape) {
    return Bounds::fromMinMax(shape.point.x, shape.point.y, shape.point.x + 1.0f, shape.point.y + 1.0f);
}

Bounds getRotatedBounds(const ShapeBehavior& self, const Shape& shape) {
    return geometry::boundsFromPoints(geometry::rotateCorners(self.getBounds(shape), shape.rotation));
}

Point2 getCenter(const ShapeBehavior& self, const Shape& shape) {
    return geometry::boundsCenter(self.getBounds(shape));
}

bool hitTest(const ShapeBehavior& self, const Shape& shape, Point2 point) {
    return geometry::pointInBounds(point, self.getBounds(shape));
}

bool hitTestBounds(const ShapeBehavior& self, const Shape& shape, const Bounds& bounds) {
    const geometry::Corners corners = geometry::rotateCorners(self.getBounds(shape), shape.rotation);
    return geometry::boundsContainPolygon(bounds, corners) || geometry::boundsCollidePolygon(bounds, corners);
}

} // namespace shapekit::defaults
