#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/variants/point_list_geometry.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/core/logging.h"
#include "shapekit/geometry/bounds.h"
#include "shapekit/geometry/vec.h"

#include <vector>

namespace shapekit::variants {

namespace {

constexpr float kPi = 3.14159265358979323846f;

Point2 handlePoint(const ArrowData& arrow, const char* id) {
    auto it = arrow.handles.find(id);
    return it != arrow.handles.end() ? it->second.point : Point2{0.0f, 0.0f};
}

// Left normal of start->end; zero when the endpoints coincide.
Point2 bendNormal(Point2 start, Point2 end) {
    return vec::uni(vec::per(vec::sub(end, start)));
}

Point2 bendPointFor(Point2 start, Point2 end, float bend) {
    return vec::add(vec::med(start, end), vec::mul(bendNormal(start, end), bend));
}

float bendFor(Point2 start, Point2 end, Point2 bendPoint) {
    return vec::dot(vec::sub(bendPoint, vec::med(start, end)), bendNormal(start, end));
}

// The quadratic passes through the bend handle at t = 0.5.
Point2 curveControl(Point2 start, Point2 end, Point2 bendPoint) {
    return vec::sub(vec::mul(bendPoint, 2.0f), vec::med(start, end));
}

// Curve samples relative to the shape's point.
std::vector<Point2> sampleCurve(const ArrowData& arrow) {
    const Point2 start = handlePoint(arrow, kArrowStart);
    const Point2 end = handlePoint(arrow, kArrowEnd);
    const Point2 control = curveControl(start, end, handlePoint(arrow, kArrowBend));

    std::vector<Point2> samples;
    samples.reserve(constants::ARROW_CURVE_SAMPLES + 1);
    for (std::size_t i = 0; i <= constants::ARROW_CURVE_SAMPLES; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(constants::ARROW_CURVE_SAMPLES);
        const float u = 1.0f - t;
        samples.push_back(Point2{
            u * u * start.x + 2.0f * u * t * control.x + t * t * end.x,
            u * u * start.y + 2.0f * u * t * control.y + t * t * end.y,
        });
    }
    return samples;
}

void setHandle(ArrowData& arrow, const char* id, std::uint32_t index, Point2 point) {
    ShapeHandle& handle = arrow.handles[id];
    handle.id = id;
    handle.index = index;
    handle.point = point;
}

void rederiveBendHandle(ArrowData& arrow) {
    const Point2 start = handlePoint(arrow, kArrowStart);
    const Point2 end = handlePoint(arrow, kArrowEnd);
    setHandle(arrow, kArrowBend, 2, bendPointFor(start, end, arrow.bend));
}

// Shift handles so the curve's local minimum is (0,0), moving point to match.
void normalize(Shape& shape) {
    ArrowData& arrow = shape.as<ArrowData>();
    const std::vector<Point2> samples = sampleCurve(arrow);
    const Bounds local = geometry::boundsFromPoints(samples);
    const Point2 offset{local.minX, local.minY};
    if (offset.x == 0.0f && offset.y == 0.0f) return;

    for (auto& entry : arrow.handles) {
        entry.second.point = vec::sub(entry.second.point, offset);
    }
    shape.point = vec::add(shape.point, offset);
}

Shape arrowCreate(const ShapeBehavior& self, const ShapeInit& init) {
    Shape shape = defaults::create(self, init);
    ArrowData& arrow = shape.as<ArrowData>();
    if (arrow.handles.find(kArrowStart) == arrow.handles.end()) {
        setHandle(arrow, kArrowStart, 0, Point2{0.0f, 0.0f});
    }
    if (arrow.handles.find(kArrowEnd) == arrow.handles.end()) {
        setHandle(arrow, kArrowEnd, 1, Point2{1.0f, 1.0f});
    }
    if (arrow.handles.find(kArrowBend) == arrow.handles.end()) {
        rederiveBendHandle(arrow);
    }
    return shape;
}

Bounds arrowBounds(const ShapeBehavior&, const Shape& shape) {
    const std::vector<Point2> samples = sampleCurve(shape.as<ArrowData>());
    return geometry::translateBounds(geometry::boundsFromPoints(samples), shape.point);
}

bool arrowHitTest(const ShapeBehavior& self, const Shape& shape, Point2 point) {
    const std::vector<Point2> samples = sampleCurve(shape.as<ArrowData>());
    const Point2 local = vec::sub(vec::rotWith(point, self.getCenter(shape), -shape.rotation), shape.point);
    const float reach = shape.style.strokeWidth * 0.5f + constants::HIT_TOLERANCE;
    for (std::size_t i = 0; i + 1 < samples.size(); ++i) {
        if (vec::distToSegment(local, samples[i], samples[i + 1]) <= reach) return true;
    }
    return false;
}

bool arrowHitTestBounds(const ShapeBehavior& self, const Shape& shape, const Bounds& bounds) {
    std::vector<Point2> samples = sampleCurve(shape.as<ArrowData>());
    const Point2 center = self.getCenter(shape);
    for (Point2& p : samples) {
        p = vec::rotWith(vec::add(p, shape.point), center, shape.rotation);
    }
    return geometry::boundsContainPolygon(bounds, samples.data(), samples.size())
        || geometry::boundsCollidePolyline(bounds, samples.data(), samples.size());
}

void arrowTransform(const ShapeBehavior&, Shape& shape, const Bounds& bounds, const TransformInfo& info) {
    const ArrowData& initial = info.initialShape.as<ArrowData>();
    const Bounds from = geometry::boundsFromPoints(sampleCurve(initial));
    if (from.width == 0.0f && from.height == 0.0f) {
        SHAPEKIT_LOG_WARN("degenerate arrow %s", shape.id.c_str());
    }

    ArrowData& arrow = shape.as<ArrowData>();
    for (const auto& [id, handle] : initial.handles) {
        ShapeHandle& target = arrow.handles[id];
        target = handle;
        target.point = Point2{
            rescaleAxis(handle.point.x, from.minX, from.width, bounds.width, info.scaleX < 0.0f),
            rescaleAxis(handle.point.y, from.minY, from.height, bounds.height, info.scaleY < 0.0f),
        };
    }
    // Non-uniform scales move the bend handle off the start-end normal
    arrow.bend = bendFor(handlePoint(arrow, kArrowStart), handlePoint(arrow, kArrowEnd), handlePoint(arrow, kArrowBend));
    rederiveBendHandle(arrow);
    shape.point = Point2{bounds.minX, bounds.minY};
    normalize(shape);
}

void arrowHandleChange(const ShapeBehavior&, Shape& shape, const HandlePatch& patch) {
    ArrowData& arrow = shape.as<ArrowData>();
    bool bendMoved = false;
    bool endpointMoved = false;

    for (const auto& [id, point] : patch) {
        auto it = arrow.handles.find(id);
        if (it == arrow.handles.end()) {
            SHAPEKIT_LOG_WARN("arrow %s has no handle '%s'", shape.id.c_str(), id.c_str());
            continue;
        }
        it->second.point = point;
        if (id == kArrowBend) {
            bendMoved = true;
        } else {
            endpointMoved = true;
        }
    }

    const Point2 start = handlePoint(arrow, kArrowStart);
    const Point2 end = handlePoint(arrow, kArrowEnd);
    if (bendMoved) {
        // Keep only the component along the normal; the handle snaps onto it
        arrow.bend = bendFor(start, end, handlePoint(arrow, kArrowBend));
        rederiveBendHandle(arrow);
    } else if (endpointMoved) {
        rederiveBendHandle(arrow);
    }

    if (bendMoved || endpointMoved) {
        normalize(shape);
    }
}

void arrowBindingChange(const ShapeBehavior&, Shape& shape, const ShapeBindings& bindings) {
    ArrowData& arrow = shape.as<ArrowData>();
    for (const auto& [handleId, binding] : bindings) {
        auto it = arrow.handles.find(handleId);
        if (it == arrow.handles.end() || handleId == kArrowBend) {
            SHAPEKIT_LOG_WARN("arrow %s cannot bind handle '%s'", shape.id.c_str(), handleId.c_str());
            continue;
        }
        arrow.bindings[handleId] = binding;
        it->second.point = vec::sub(binding.point, shape.point);
    }
    rederiveBendHandle(arrow);
    normalize(shape);
}

render::RenderNode renderArrow(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    const ArrowData& arrow = shape.as<ArrowData>();
    const Point2 start = vec::add(handlePoint(arrow, kArrowStart), shape.point);
    const Point2 end = vec::add(handlePoint(arrow, kArrowEnd), shape.point);
    const Point2 control = curveControl(start, end, vec::add(handlePoint(arrow, kArrowBend), shape.point));

    render::Path shaft;
    shaft.segments.push_back(render::Segment::moveTo(start));
    shaft.segments.push_back(render::Segment::quadTo(control, end));
    node.paths.push_back(shaft);

    Point2 tangent = vec::uni(vec::sub(end, control));
    if (tangent.x == 0.0f && tangent.y == 0.0f) tangent = vec::uni(vec::sub(end, start));
    if (tangent.x == 0.0f && tangent.y == 0.0f) return node;

    const float length = constants::ARROWHEAD_LENGTH_FACTOR * shape.style.strokeWidth;
    const Point2 back = vec::add(end, vec::mul(tangent, -length));
    render::Path head;
    head.segments.push_back(render::Segment::moveTo(vec::rotWith(back, end, kPi / 6.0f)));
    head.segments.push_back(render::Segment::lineTo(end));
    head.segments.push_back(render::Segment::lineTo(vec::rotWith(back, end, -kPi / 6.0f)));
    node.paths.push_back(head);
    return node;
}

} // namespace

ShapeBehaviorOverrides arrowOverrides() {
    ShapeBehaviorOverrides o;
    o.canStyleFill = false;
    o.ops.create = &arrowCreate;
    o.ops.getBounds = &arrowBounds;
    o.ops.hitTest = &arrowHitTest;
    o.ops.hitTestBounds = &arrowHitTestBounds;
    o.ops.transform = &arrowTransform;
    o.ops.onHandleChange = &arrowHandleChange;
    o.ops.onBindingChange = &arrowBindingChange;
    o.ops.render = &renderArrow;
    return o;
}

} // namespace shapekit::variants
