#include "shapekit/core/types.h"

#include <atomic>

namespace shapekit {

std::uint64_t nextShapeRevision() noexcept {
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

const char* shapeTypeName(ShapeType type) noexcept {
    switch (type) {
        case ShapeType::Dot: return "dot";
        case ShapeType::Circle: return "circle";
        case ShapeType::Ellipse: return "ellipse";
        case ShapeType::Line: return "line";
        case ShapeType::Ray: return "ray";
        case ShapeType::Polyline: return "polyline";
        case ShapeType::Rectangle: return "rectangle";
        case ShapeType::Draw: return "draw";
        case ShapeType::Arrow: return "arrow";
        case ShapeType::Text: return "text";
        case ShapeType::Group: return "group";
    }
    return "unknown";
}

const char* shapePropName(ShapeProp prop) noexcept {
    switch (prop) {
        case ShapeProp::Name: return "name";
        case ShapeProp::ParentId: return "parentId";
        case ShapeProp::ChildIndex: return "childIndex";
        case ShapeProp::Point: return "point";
        case ShapeProp::Rotation: return "rotation";
        case ShapeProp::IsLocked: return "isLocked";
        case ShapeProp::IsHidden: return "isHidden";
        case ShapeProp::IsAspectRatioLocked: return "isAspectRatioLocked";
        case ShapeProp::IsGenerated: return "isGenerated";
        case ShapeProp::Style: return "style";
        case ShapeProp::Radius: return "radius";
        case ShapeProp::RadiusX: return "radiusX";
        case ShapeProp::RadiusY: return "radiusY";
        case ShapeProp::Direction: return "direction";
        case ShapeProp::Points: return "points";
        case ShapeProp::Size: return "size";
        case ShapeProp::CornerRadius: return "cornerRadius";
        case ShapeProp::Handles: return "handles";
        case ShapeProp::Bindings: return "bindings";
        case ShapeProp::Bend: return "bend";
        case ShapeProp::Text: return "text";
        case ShapeProp::FontSize: return "fontSize";
        case ShapeProp::Scale: return "scale";
        case ShapeProp::Children: return "children";
    }
    return "unknown";
}

ShapeData defaultShapeData(ShapeType type) {
    switch (type) {
        case ShapeType::Dot: return DotData{};
        case ShapeType::Circle: return CircleData{};
        case ShapeType::Ellipse: return EllipseData{};
        case ShapeType::Line: return LineData{};
        case ShapeType::Ray: return RayData{};
        case ShapeType::Polyline: return PolylineData{};
        case ShapeType::Rectangle: return RectangleData{};
        case ShapeType::Draw: return DrawData{};
        case ShapeType::Arrow: return ArrowData{};
        case ShapeType::Text: return TextData{};
        case ShapeType::Group: return GroupData{};
    }
    throw ShapeException(ShapeError::UnknownShapeType, "no default data for kind " + std::to_string(static_cast<unsigned>(type)));
}

} // namespace shapekit
