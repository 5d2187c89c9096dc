#ifndef SHAPEKIT_CORE_TYPES_H
#define SHAPEKIT_CORE_TYPES_H

#include "shapekit/core/constants.h"
#include "shapekit/core/errors.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Value types shared by the geometry kernel, the behaviors and the render tree.

namespace shapekit {

struct Point2 { float x; float y; };

inline bool operator==(const Point2& a, const Point2& b) noexcept { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) noexcept { return !(a == b); }

// Axis-aligned box. width/height are always maxX-minX / maxY-minY;
// construct through fromMinMax to keep that true.
struct Bounds {
    float minX;
    float minY;
    float maxX;
    float maxY;
    float width;
    float height;

    static Bounds fromMinMax(float minX, float minY, float maxX, float maxY) noexcept {
        return Bounds{minX, minY, maxX, maxY, maxX - minX, maxY - minY};
    }
};

inline bool operator==(const Bounds& a, const Bounds& b) noexcept {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY
        && a.width == b.width && a.height == b.height;
}

using ShapeId = std::string;

// Closed set of shape kinds. The order matches the ShapeData alternatives.
enum class ShapeType : std::uint8_t {
    Dot = 0,
    Circle = 1,
    Ellipse = 2,
    Line = 3,
    Ray = 4,
    Polyline = 5,
    Rectangle = 6,
    Draw = 7,
    Arrow = 8,
    Text = 9,
    Group = 10,
};

static constexpr std::size_t kShapeTypeCount = 11;

const char* shapeTypeName(ShapeType type) noexcept;

// Resize handles, clockwise from the top edge.
enum class TransformHandle : std::uint8_t {
    TopEdge = 0,
    RightEdge = 1,
    BottomEdge = 2,
    LeftEdge = 3,
    TopLeftCorner = 4,
    TopRightCorner = 5,
    BottomRightCorner = 6,
    BottomLeftCorner = 7,
};

// ============================================================================
// Style
// ============================================================================

enum class DashStyle : std::uint8_t {
    Solid = 0,
    Dashed = 1,
    Dotted = 2,
};

struct ShapeStyle {
    std::uint32_t strokeRGBA = constants::DEFAULT_STROKE_RGBA; // 0xRRGGBBAA
    std::uint32_t fillRGBA = constants::DEFAULT_FILL_RGBA;
    float strokeWidth = constants::DEFAULT_STROKE_WIDTH;
    DashStyle dash = DashStyle::Solid;
    bool isFilled = false;
};

inline bool operator==(const ShapeStyle& a, const ShapeStyle& b) noexcept {
    return a.strokeRGBA == b.strokeRGBA && a.fillRGBA == b.fillRGBA && a.strokeWidth == b.strokeWidth
        && a.dash == b.dash && a.isFilled == b.isFilled;
}

// Partial style; unset fields are left alone by applyStyles.
struct ShapeStylePatch {
    std::optional<std::uint32_t> strokeRGBA;
    std::optional<std::uint32_t> fillRGBA;
    std::optional<float> strokeWidth;
    std::optional<DashStyle> dash;
    std::optional<bool> isFilled;
};

// ============================================================================
// Handles and bindings
// ============================================================================

// A draggable control point. point is relative to the owning shape's point.
struct ShapeHandle {
    std::string id;
    std::uint32_t index = 0;
    Point2 point{0.0f, 0.0f};
};

using ShapeHandles = std::map<std::string, ShapeHandle>;

// Handle id -> new relative point, as produced by a handle drag.
using HandlePatch = std::map<std::string, Point2>;

enum class BindingType : std::uint8_t {
    Anchor = 0,
    Pin = 1,
};

// Ties one of a shape's handles to another shape. point is the world-space
// attachment point resolved by the document store.
struct ShapeBinding {
    ShapeId targetId;
    BindingType type = BindingType::Anchor;
    Point2 point{0.0f, 0.0f};
};

// Keyed by handle id.
using ShapeBindings = std::map<std::string, ShapeBinding>;

// ============================================================================
// Kind-specific data
// ============================================================================

struct DotData {};

// point is the top-left of the bounding square.
struct CircleData {
    float radius = 1.0f;
};

struct EllipseData {
    float radiusX = 1.0f;
    float radiusY = 1.0f;
};

// Unbounded line through point.
struct LineData {
    Point2 direction{0.0f, 1.0f};
};

// Half-line starting at point.
struct RayData {
    Point2 direction{0.0f, 1.0f};
};

// points are relative to the shape's point.
struct PolylineData {
    std::vector<Point2> points;
};

struct RectangleData {
    Point2 size{1.0f, 1.0f};
    float cornerRadius = 0.0f;
};

struct DrawData {
    std::vector<Point2> points;
};

// Handles "start", "end" and "bend". bend is the signed offset of the bend
// handle from the start-end midpoint, along the segment's left normal.
struct ArrowData {
    ShapeHandles handles;
    ShapeBindings bindings;
    float bend = 0.0f;
};

struct TextData {
    std::string text;
    float fontSize = constants::DEFAULT_FONT_SIZE;
    std::uint32_t fontId = 0;   // 0 = default font
    float scale = 1.0f;
};

struct GroupData {
    std::vector<ShapeId> children;
    Point2 size{1.0f, 1.0f};
};

using ShapeData = std::variant<
    DotData,
    CircleData,
    EllipseData,
    LineData,
    RayData,
    PolylineData,
    RectangleData,
    DrawData,
    ArrowData,
    TextData,
    GroupData>;

static_assert(std::variant_size_v<ShapeData> == kShapeTypeCount, "ShapeData must have one alternative per ShapeType");

ShapeData defaultShapeData(ShapeType type);

inline ShapeType shapeTypeOf(const ShapeData& data) noexcept {
    return static_cast<ShapeType>(data.index());
}

// ============================================================================
// Shape
// ============================================================================

// Monotonic across all shapes; never returns 0.
std::uint64_t nextShapeRevision() noexcept;

struct Shape {
    ShapeId id;
    ShapeType type = ShapeType::Dot;
    std::string name = constants::DEFAULT_SHAPE_NAME;
    ShapeId parentId = constants::DEFAULT_PARENT_ID;
    float childIndex = 0.0f;
    Point2 point{0.0f, 0.0f};
    float rotation = 0.0f;   // radians, about the bounds center
    bool isLocked = false;
    bool isHidden = false;
    bool isAspectRatioLocked = false;
    bool isGenerated = false;
    ShapeStyle style{};
    ShapeData data{};

    // Stamped from a process-wide counter on creation and on every geometry
    // mutation, so no two copies of a shape ever share a revision once either
    // changes. The bounds cache is validated against it; callers editing
    // fields directly (or restoring a copy) must call touch().
    std::uint64_t revision = 0;

    void touch() noexcept { revision = nextShapeRevision(); }

    template <typename T>
    T& as() {
        T* p = std::get_if<T>(&data);
        if (!p) throw ShapeException(ShapeError::ShapeTypeMismatch, "shape '" + id + "' holds " + shapeTypeName(shapeTypeOf(data)) + " data");
        return *p;
    }

    template <typename T>
    const T& as() const {
        const T* p = std::get_if<T>(&data);
        if (!p) throw ShapeException(ShapeError::ShapeTypeMismatch, "shape '" + id + "' holds " + shapeTypeName(shapeTypeOf(data)) + " data");
        return *p;
    }
};

// Caller-supplied fields for create(); unset fields take the defaults.
struct ShapeInit {
    std::optional<ShapeId> id;
    std::optional<std::string> name;
    std::optional<ShapeId> parentId;
    std::optional<float> childIndex;
    std::optional<Point2> point;
    std::optional<float> rotation;
    std::optional<bool> isLocked;
    std::optional<bool> isHidden;
    std::optional<bool> isAspectRatioLocked;
    std::optional<bool> isGenerated;
    std::optional<ShapeStyle> style;
    std::optional<ShapeData> data;
};

// ============================================================================
// Property edits
// ============================================================================

enum class ShapeProp : std::uint8_t {
    // Common to every kind
    Name = 0,
    ParentId,
    ChildIndex,
    Point,
    Rotation,
    IsLocked,
    IsHidden,
    IsAspectRatioLocked,
    IsGenerated,
    Style,
    // Kind-specific
    Radius,
    RadiusX,
    RadiusY,
    Direction,
    Points,
    Size,
    CornerRadius,
    Handles,
    Bindings,
    Bend,
    Text,
    FontSize,
    Scale,
    Children,
};

static constexpr std::size_t kShapePropCount = 24;

const char* shapePropName(ShapeProp prop) noexcept;

using PropValue = std::variant<
    bool,
    float,
    std::string,
    Point2,
    std::vector<Point2>,
    ShapeStyle,
    ShapeHandles,
    ShapeBindings,
    std::vector<ShapeId>>;

// Everything a resize gesture knows about one shape.
struct TransformInfo {
    TransformHandle handle;
    const Shape& initialShape;   // pre-drag snapshot
    float scaleX;
    float scaleY;
    Point2 transformOrigin;      // normalized position inside the selection bounds
};

} // namespace shapekit

#endif // SHAPEKIT_CORE_TYPES_H
