#include "shapekit/shapes/shape_properties.h"
#include "shapekit/core/util.h"

#include <cstdint>
#include <string>

namespace shapekit {

namespace {

using PropMask = std::uint32_t;

constexpr PropMask bit(ShapeProp prop) noexcept {
    return PropMask{1} << static_cast<std::uint8_t>(prop);
}

static_assert(kShapePropCount <= 32, "PropMask is too narrow");

constexpr PropMask kCommonProps =
    bit(ShapeProp::Name) | bit(ShapeProp::ParentId) | bit(ShapeProp::ChildIndex) | bit(ShapeProp::Point)
    | bit(ShapeProp::Rotation) | bit(ShapeProp::IsLocked) | bit(ShapeProp::IsHidden)
    | bit(ShapeProp::IsAspectRatioLocked) | bit(ShapeProp::IsGenerated) | bit(ShapeProp::Style);

PropMask kindProps(ShapeType type) noexcept {
    switch (type) {
        case ShapeType::Dot: return 0;
        case ShapeType::Circle: return bit(ShapeProp::Radius);
        case ShapeType::Ellipse: return bit(ShapeProp::RadiusX) | bit(ShapeProp::RadiusY);
        case ShapeType::Line: return bit(ShapeProp::Direction);
        case ShapeType::Ray: return bit(ShapeProp::Direction);
        case ShapeType::Polyline: return bit(ShapeProp::Points);
        case ShapeType::Rectangle: return bit(ShapeProp::Size) | bit(ShapeProp::CornerRadius);
        case ShapeType::Draw: return bit(ShapeProp::Points);
        case ShapeType::Arrow: return bit(ShapeProp::Handles) | bit(ShapeProp::Bindings) | bit(ShapeProp::Bend);
        case ShapeType::Text: return bit(ShapeProp::Text) | bit(ShapeProp::FontSize) | bit(ShapeProp::Scale);
        case ShapeType::Group: return bit(ShapeProp::Children) | bit(ShapeProp::Size);
    }
    return 0;
}

[[noreturn]] void badValue(const Shape& shape, ShapeProp prop, const char* why) {
    throw ShapeException(
        ShapeError::InvalidPropertyValue,
        std::string(shapePropName(prop)) + " on " + shapeTypeName(shape.type) + " '" + shape.id + "': " + why);
}

template <typename T>
const T& expect(const Shape& shape, ShapeProp prop, const PropValue& value) {
    const T* v = std::get_if<T>(&value);
    if (!v) badValue(shape, prop, "wrong value type");
    return *v;
}

float expectFinite(const Shape& shape, ShapeProp prop, const PropValue& value) {
    const float v = expect<float>(shape, prop, value);
    if (!isFinite(v)) badValue(shape, prop, "not a finite number");
    return v;
}

float expectNonNegative(const Shape& shape, ShapeProp prop, const PropValue& value) {
    const float v = expectFinite(shape, prop, value);
    if (v < 0.0f) badValue(shape, prop, "must not be negative");
    return v;
}

Point2 expectPoint(const Shape& shape, ShapeProp prop, const PropValue& value) {
    const Point2 p = expect<Point2>(shape, prop, value);
    if (!isFinite(p)) badValue(shape, prop, "not a finite point");
    return p;
}

Point2 expectSize(const Shape& shape, ShapeProp prop, const PropValue& value) {
    const Point2 p = expectPoint(shape, prop, value);
    if (p.x < 0.0f || p.y < 0.0f) badValue(shape, prop, "size must not be negative");
    return p;
}

const std::vector<Point2>& expectPoints(const Shape& shape, ShapeProp prop, const PropValue& value) {
    const auto& points = expect<std::vector<Point2>>(shape, prop, value);
    for (const Point2& p : points) {
        if (!isFinite(p)) badValue(shape, prop, "contains a non-finite point");
    }
    return points;
}

} // namespace

bool isPropertyAllowed(ShapeType type, ShapeProp prop) noexcept {
    return ((kCommonProps | kindProps(type)) & bit(prop)) != 0;
}

void assignShapeProperty(Shape& shape, ShapeProp prop, const PropValue& value) {
    if (!isPropertyAllowed(shape.type, prop)) {
        throw ShapeException(
            ShapeError::InvalidProperty,
            std::string(shapeTypeName(shape.type)) + " has no property '" + shapePropName(prop) + "'");
    }

    // Every branch validates fully before writing.
    switch (prop) {
        case ShapeProp::Name:
            shape.name = expect<std::string>(shape, prop, value);
            return;
        case ShapeProp::ParentId:
            shape.parentId = expect<std::string>(shape, prop, value);
            return;
        case ShapeProp::ChildIndex:
            shape.childIndex = expectFinite(shape, prop, value);
            return;
        case ShapeProp::Point:
            shape.point = expectPoint(shape, prop, value);
            return;
        case ShapeProp::Rotation:
            shape.rotation = expectFinite(shape, prop, value);
            return;
        case ShapeProp::IsLocked:
            shape.isLocked = expect<bool>(shape, prop, value);
            return;
        case ShapeProp::IsHidden:
            shape.isHidden = expect<bool>(shape, prop, value);
            return;
        case ShapeProp::IsAspectRatioLocked:
            shape.isAspectRatioLocked = expect<bool>(shape, prop, value);
            return;
        case ShapeProp::IsGenerated:
            shape.isGenerated = expect<bool>(shape, prop, value);
            return;
        case ShapeProp::Style: {
            const ShapeStyle& style = expect<ShapeStyle>(shape, prop, value);
            if (!isFinite(style.strokeWidth) || style.strokeWidth < 0.0f) badValue(shape, prop, "bad stroke width");
            shape.style = style;
            return;
        }
        case ShapeProp::Radius:
            shape.as<CircleData>().radius = expectNonNegative(shape, prop, value);
            return;
        case ShapeProp::RadiusX:
            shape.as<EllipseData>().radiusX = expectNonNegative(shape, prop, value);
            return;
        case ShapeProp::RadiusY:
            shape.as<EllipseData>().radiusY = expectNonNegative(shape, prop, value);
            return;
        case ShapeProp::Direction: {
            const Point2 d = expectPoint(shape, prop, value);
            if (d.x == 0.0f && d.y == 0.0f) badValue(shape, prop, "direction must be non-zero");
            if (shape.type == ShapeType::Line) {
                shape.as<LineData>().direction = d;
            } else {
                shape.as<RayData>().direction = d;
            }
            return;
        }
        case ShapeProp::Points: {
            const auto& points = expectPoints(shape, prop, value);
            if (shape.type == ShapeType::Draw) {
                shape.as<DrawData>().points = points;
            } else {
                shape.as<PolylineData>().points = points;
            }
            return;
        }
        case ShapeProp::Size: {
            const Point2 size = expectSize(shape, prop, value);
            if (shape.type == ShapeType::Group) {
                shape.as<GroupData>().size = size;
            } else {
                shape.as<RectangleData>().size = size;
            }
            return;
        }
        case ShapeProp::CornerRadius:
            shape.as<RectangleData>().cornerRadius = expectNonNegative(shape, prop, value);
            return;
        case ShapeProp::Handles: {
            const ShapeHandles& handles = expect<ShapeHandles>(shape, prop, value);
            for (const auto& [id, handle] : handles) {
                if (!isFinite(handle.point)) badValue(shape, prop, "handle point is not finite");
                if (handle.id != id) badValue(shape, prop, "handle id does not match its key");
            }
            shape.as<ArrowData>().handles = handles;
            return;
        }
        case ShapeProp::Bindings: {
            const ShapeBindings& bindings = expect<ShapeBindings>(shape, prop, value);
            for (const auto& entry : bindings) {
                if (!isFinite(entry.second.point)) badValue(shape, prop, "binding point is not finite");
            }
            shape.as<ArrowData>().bindings = bindings;
            return;
        }
        case ShapeProp::Bend:
            shape.as<ArrowData>().bend = expectFinite(shape, prop, value);
            return;
        case ShapeProp::Text:
            shape.as<TextData>().text = expect<std::string>(shape, prop, value);
            return;
        case ShapeProp::FontSize: {
            const float size = expectNonNegative(shape, prop, value);
            if (size == 0.0f) badValue(shape, prop, "font size must be positive");
            shape.as<TextData>().fontSize = size;
            return;
        }
        case ShapeProp::Scale: {
            const float scale = expectFinite(shape, prop, value);
            if (scale <= 0.0f) badValue(shape, prop, "scale must be positive");
            shape.as<TextData>().scale = scale;
            return;
        }
        case ShapeProp::Children:
            shape.as<GroupData>().children = expect<std::vector<ShapeId>>(shape, prop, value);
            return;
    }
}

} // namespace shapekit
