#ifndef SHAPEKIT_RENDER_RENDER_NODE_H
#define SHAPEKIT_RENDER_RENDER_NODE_H

#include "shapekit/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace shapekit::render {

// Renderable output of ShapeBehavior::render. The rendering layer consumes it;
// the core never inspects it after construction.

struct Transform2D {
    // SVG/canvas-style affine matrix:
    // [ a c e ]
    // [ b d f ]
    // [ 0 0 1 ]
    float a{1.0f};
    float b{0.0f};
    float c{0.0f};
    float d{1.0f};
    float e{0.0f};
    float f{0.0f};
};

inline Point2 applyTransform(const Transform2D& t, const Point2& p) noexcept {
    return Point2{
        t.a * p.x + t.c * p.y + t.e,
        t.b * p.x + t.d * p.y + t.f,
    };
}

// Rotation by angle radians about pivot.
Transform2D rotationAbout(Point2 pivot, float angle) noexcept;

enum class SegmentKind : std::uint8_t { Move = 0, Line = 1, Quad = 2, Arc = 3, Close = 4 };

struct Segment {
    SegmentKind kind{SegmentKind::Move};
    // For Move/Line: to
    // For Quad: c, to
    // For Arc: center, radius (rx,ry), rotation, startAngle, endAngle
    Point2 to{};
    Point2 c{};
    Point2 center{};
    Point2 radius{};
    float rotation{0.0f};
    float startAngle{0.0f};
    float endAngle{0.0f};

    static Segment moveTo(Point2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Move;
        s.to = p;
        return s;
    }
    static Segment lineTo(Point2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Line;
        s.to = p;
        return s;
    }
    static Segment quadTo(Point2 control, Point2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Quad;
        s.c = control;
        s.to = p;
        return s;
    }
    static Segment arc(Point2 arcCenter, Point2 arcRadius, float arcStartAngle, float arcEndAngle) noexcept {
        Segment s;
        s.kind = SegmentKind::Arc;
        s.center = arcCenter;
        s.radius = arcRadius;
        s.startAngle = arcStartAngle;
        s.endAngle = arcEndAngle;
        return s;
    }
    static Segment close() noexcept {
        Segment s;
        s.kind = SegmentKind::Close;
        return s;
    }
};

struct Path {
    std::vector<Segment> segments;
    bool closed{false};
};

struct StrokeStyle {
    std::uint32_t rgba{0x000000FFu};
    float width{1.0f};
    std::vector<float> dash; // alternating on/off lengths
};

struct Style {
    bool fillEnabled{false};
    std::uint32_t fillRGBA{0xFFFFFFFFu};
    bool strokeEnabled{true};
    StrokeStyle stroke{};
};

// Maps a shape style to a render style; fill is dropped when the kind
// cannot be filled.
Style resolveStyle(const ShapeStyle& style, bool canFill);

struct RenderNode {
    ShapeId shapeId;
    ShapeType type{ShapeType::Dot};
    Style style{};
    Transform2D transform{};
    bool hasTransform{false};
    std::vector<Path> paths;

    // Text runs (text shapes only)
    std::string text;
    float fontSize{0.0f};
    Point2 textOrigin{};

    std::vector<RenderNode> children;
};

// Closed circle/ellipse outline as a single arc segment.
Path ellipsePath(Point2 center, float radiusX, float radiusY);
Path rectPath(const Bounds& bounds, float cornerRadius);
Path polylinePath(const std::vector<Point2>& points, Point2 offset);

} // namespace shapekit::render

#endif // SHAPEKIT_RENDER_RENDER_NODE_H
