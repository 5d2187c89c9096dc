#include <gtest/gtest.h>

#include "shapekit/geometry/bounds.h"
#include "shapekit/shapes/shape_registry.h"

#include <string>
#include <utility>
#include <vector>

using namespace shapekit;

namespace {

constexpr float kHalfPi = 1.57079632679f;

const ShapeBehavior& utils(ShapeType type) {
    return ShapeRegistry::builtin().lookup(type);
}

Shape make(ShapeType type, Point2 point, ShapeData data) {
    ShapeInit init;
    init.point = point;
    init.data = std::move(data);
    return createShape(type, init);
}

void expectNear(Point2 actual, Point2 expected) {
    EXPECT_NEAR(actual.x, expected.x, 1e-3f);
    EXPECT_NEAR(actual.y, expected.y, 1e-3f);
}

void expectBoundsNear(const Bounds& actual, const Bounds& expected) {
    EXPECT_NEAR(actual.minX, expected.minX, 1e-3f);
    EXPECT_NEAR(actual.minY, expected.minY, 1e-3f);
    EXPECT_NEAR(actual.maxX, expected.maxX, 1e-3f);
    EXPECT_NEAR(actual.maxY, expected.maxY, 1e-3f);
}

Point2 handleAt(const Shape& arrow, const std::string& id) {
    return arrow.as<ArrowData>().handles.at(id).point;
}

} // namespace

// =============================================================================
// Rectangle
// =============================================================================

TEST(RectangleShapeTest, BoundsAndTranslation) {
    const ShapeBehavior& rects = utils(ShapeType::Rectangle);
    Shape rect = make(ShapeType::Rectangle, Point2{0.0f, 0.0f}, RectangleData{Point2{10.0f, 20.0f}, 0.0f});
    EXPECT_EQ(rects.getBounds(rect), Bounds::fromMinMax(0.0f, 0.0f, 10.0f, 20.0f));

    rects.translateBy(rect, Point2{5.0f, 5.0f});
    EXPECT_EQ(rects.getBounds(rect), Bounds::fromMinMax(5.0f, 5.0f, 15.0f, 25.0f));
}

TEST(RectangleShapeTest, QuarterTurnSwapsRotatedExtent) {
    const ShapeBehavior& rects = utils(ShapeType::Rectangle);
    Shape rect = make(ShapeType::Rectangle, Point2{0.0f, 0.0f}, RectangleData{Point2{10.0f, 20.0f}, 0.0f});
    rects.setProperty(rect, ShapeProp::Rotation, kHalfPi);

    const Bounds rotated = rects.getRotatedBounds(rect);
    EXPECT_NEAR(rotated.width, 20.0f, 1e-3f);
    EXPECT_NEAR(rotated.height, 10.0f, 1e-3f);
    expectNear(rects.getCenter(rect), Point2{5.0f, 10.0f});
    expectNear(geometry::boundsCenter(rotated), Point2{5.0f, 10.0f});
}

TEST(RectangleShapeTest, RotatedHitTest) {
    const ShapeBehavior& rects = utils(ShapeType::Rectangle);
    Shape rect = make(ShapeType::Rectangle, Point2{0.0f, 0.0f}, RectangleData{Point2{10.0f, 20.0f}, 0.0f});
    EXPECT_TRUE(rects.hitTest(rect, Point2{5.0f, 1.0f}));
    EXPECT_FALSE(rects.hitTest(rect, Point2{14.0f, 10.0f}));

    rects.setProperty(rect, ShapeProp::Rotation, kHalfPi);
    EXPECT_FALSE(rects.hitTest(rect, Point2{5.0f, 1.0f}));
    EXPECT_TRUE(rects.hitTest(rect, Point2{14.0f, 10.0f}));
}

TEST(RectangleShapeTest, RenderCarriesRotationAndFill) {
    const ShapeBehavior& rects = utils(ShapeType::Rectangle);
    Shape rect = make(ShapeType::Rectangle, Point2{0.0f, 0.0f}, RectangleData{Point2{10.0f, 10.0f}, 2.0f});
    ShapeStylePatch patch;
    patch.isFilled = true;
    rects.applyStyles(rect, patch);

    render::RenderNode node = rects.render(rect);
    EXPECT_FALSE(node.hasTransform);
    EXPECT_TRUE(node.style.fillEnabled);
    ASSERT_EQ(node.paths.size(), 1u);
    EXPECT_TRUE(node.paths[0].closed);

    rects.setProperty(rect, ShapeProp::Rotation, 0.5f);
    node = rects.render(rect);
    EXPECT_TRUE(node.hasTransform);
    // The pivot is a fixed point of the transform
    expectNear(render::applyTransform(node.transform, Point2{5.0f, 5.0f}), Point2{5.0f, 5.0f});
}

// =============================================================================
// Circle / Ellipse
// =============================================================================

TEST(CircleShapeTest, BoundsAndHitTest) {
    const ShapeBehavior& circles = utils(ShapeType::Circle);
    const Shape circle = make(ShapeType::Circle, Point2{0.0f, 0.0f}, CircleData{5.0f});
    EXPECT_EQ(circles.getBounds(circle), Bounds::fromMinMax(0.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_TRUE(circles.hitTest(circle, Point2{5.0f, 5.0f}));
    EXPECT_TRUE(circles.hitTest(circle, Point2{5.0f, 10.5f}));
    EXPECT_FALSE(circles.hitTest(circle, Point2{5.0f, 12.5f}));
}

TEST(CircleShapeTest, HitTestBounds) {
    const ShapeBehavior& circles = utils(ShapeType::Circle);
    const Shape circle = make(ShapeType::Circle, Point2{0.0f, 0.0f}, CircleData{5.0f});
    EXPECT_TRUE(circles.hitTestBounds(circle, Bounds::fromMinMax(-1.0f, -1.0f, 11.0f, 11.0f)));
    EXPECT_TRUE(circles.hitTestBounds(circle, Bounds::fromMinMax(8.0f, 8.0f, 20.0f, 20.0f)));
    // Inside the bounding square but outside the circle
    EXPECT_FALSE(circles.hitTestBounds(circle, Bounds::fromMinMax(9.0f, 9.0f, 20.0f, 20.0f)));
}

TEST(CircleShapeTest, TransformKeepsItRound) {
    const ShapeBehavior& circles = utils(ShapeType::Circle);
    Shape circle = make(ShapeType::Circle, Point2{0.0f, 0.0f}, CircleData{5.0f});
    const Shape initial = circle;

    const TransformInfo single{TransformHandle::BottomRightCorner, initial, 2.0f, 1.0f, Point2{0.0f, 0.0f}};
    circles.transformSingle(circle, Bounds::fromMinMax(0.0f, 0.0f, 20.0f, 10.0f), single);
    EXPECT_FLOAT_EQ(circle.as<CircleData>().radius, 5.0f);

    const TransformInfo multi{TransformHandle::BottomRightCorner, initial, 2.0f, 3.0f, Point2{0.0f, 0.0f}};
    circles.transform(circle, Bounds::fromMinMax(0.0f, 0.0f, 30.0f, 30.0f), multi);
    EXPECT_FLOAT_EQ(circle.as<CircleData>().radius, 10.0f);
    EXPECT_EQ(circle.point, (Point2{0.0f, 0.0f}));
}

TEST(EllipseShapeTest, BoundsHitAndRotation) {
    const ShapeBehavior& ellipses = utils(ShapeType::Ellipse);
    Shape ellipse = make(ShapeType::Ellipse, Point2{0.0f, 0.0f}, EllipseData{10.0f, 5.0f});
    EXPECT_EQ(ellipses.getBounds(ellipse), Bounds::fromMinMax(0.0f, 0.0f, 20.0f, 10.0f));
    EXPECT_TRUE(ellipses.hitTest(ellipse, Point2{10.0f, 5.0f}));
    EXPECT_FALSE(ellipses.hitTest(ellipse, Point2{1.0f, 1.0f}));

    ellipses.setProperty(ellipse, ShapeProp::Rotation, kHalfPi);
    expectBoundsNear(ellipses.getRotatedBounds(ellipse), Bounds::fromMinMax(5.0f, -5.0f, 15.0f, 15.0f));
}

TEST(EllipseShapeTest, TransformFitsAndMirrorsRotation) {
    const ShapeBehavior& ellipses = utils(ShapeType::Ellipse);
    Shape ellipse = make(ShapeType::Ellipse, Point2{0.0f, 0.0f}, EllipseData{10.0f, 5.0f});
    ellipses.setProperty(ellipse, ShapeProp::Rotation, 0.25f);
    const Shape initial = ellipse;

    const TransformInfo info{TransformHandle::LeftEdge, initial, -1.0f, 1.0f, Point2{0.0f, 0.0f}};
    ellipses.transform(ellipse, Bounds::fromMinMax(-20.0f, 0.0f, 0.0f, 10.0f), info);
    EXPECT_FLOAT_EQ(ellipse.as<EllipseData>().radiusX, 10.0f);
    EXPECT_FLOAT_EQ(ellipse.as<EllipseData>().radiusY, 5.0f);
    EXPECT_EQ(ellipse.point, (Point2{-20.0f, 0.0f}));
    EXPECT_FLOAT_EQ(ellipse.rotation, -0.25f);
}

// =============================================================================
// Line / Ray
// =============================================================================

TEST(LineShapeTest, HitsAlongWholeLine) {
    const ShapeBehavior& lines = utils(ShapeType::Line);
    const Shape line = make(ShapeType::Line, Point2{0.0f, 0.0f}, LineData{Point2{1.0f, 0.0f}});
    EXPECT_TRUE(lines.hitTest(line, Point2{500.0f, 2.0f}));
    EXPECT_TRUE(lines.hitTest(line, Point2{-500.0f, -2.0f}));
    EXPECT_FALSE(lines.hitTest(line, Point2{500.0f, 4.0f}));

    EXPECT_TRUE(lines.hitTestBounds(line, Bounds::fromMinMax(-10.0f, -10.0f, 10.0f, 10.0f)));
    EXPECT_FALSE(lines.hitTestBounds(line, Bounds::fromMinMax(0.0f, 5.0f, 10.0f, 10.0f)));
}

TEST(LineShapeTest, RenderIsUntransformed) {
    const ShapeBehavior& lines = utils(ShapeType::Line);
    Shape line = make(ShapeType::Line, Point2{0.0f, 0.0f}, LineData{Point2{1.0f, 0.0f}});
    lines.setProperty(line, ShapeProp::Rotation, 1.0f);
    const render::RenderNode node = lines.render(line);
    EXPECT_FALSE(node.hasTransform);
    ASSERT_EQ(node.paths.size(), 1u);
    EXPECT_EQ(node.paths[0].segments.size(), 2u);
    EXPECT_FALSE(node.style.fillEnabled);
}

TEST(RayShapeTest, HitsOnlyForward) {
    const ShapeBehavior& rays = utils(ShapeType::Ray);
    const Shape ray = make(ShapeType::Ray, Point2{0.0f, 0.0f}, RayData{Point2{1.0f, 0.0f}});
    EXPECT_TRUE(rays.hitTest(ray, Point2{50.0f, 1.0f}));
    EXPECT_FALSE(rays.hitTest(ray, Point2{-5.0f, 0.0f}));

    EXPECT_TRUE(rays.hitTestBounds(ray, Bounds::fromMinMax(90.0f, -1.0f, 100.0f, 1.0f)));
    EXPECT_FALSE(rays.hitTestBounds(ray, Bounds::fromMinMax(-20.0f, -1.0f, -10.0f, 1.0f)));
}

// =============================================================================
// Polyline / Draw
// =============================================================================

class PolylineShapeTest : public ::testing::Test {
protected:
    const ShapeBehavior& polylines = utils(ShapeType::Polyline);
    Shape polyline = make(ShapeType::Polyline, Point2{10.0f, 10.0f},
                          PolylineData{{Point2{0.0f, 0.0f}, Point2{10.0f, 5.0f}, Point2{20.0f, 0.0f}}});
};

TEST_F(PolylineShapeTest, BoundsFollowPoints) {
    EXPECT_EQ(polylines.getBounds(polyline), Bounds::fromMinMax(10.0f, 10.0f, 30.0f, 15.0f));
}

TEST_F(PolylineShapeTest, HitTestNearSegments) {
    EXPECT_TRUE(polylines.hitTest(polyline, Point2{20.0f, 15.0f}));
    EXPECT_TRUE(polylines.hitTest(polyline, Point2{10.0f, 12.0f}));
    EXPECT_FALSE(polylines.hitTest(polyline, Point2{20.0f, 5.0f}));

    EXPECT_TRUE(polylines.hitTestBounds(polyline, Bounds::fromMinMax(18.0f, 12.0f, 22.0f, 20.0f)));
    EXPECT_FALSE(polylines.hitTestBounds(polyline, Bounds::fromMinMax(18.0f, 0.0f, 22.0f, 5.0f)));
}

TEST_F(PolylineShapeTest, TransformRescalesPoints) {
    const Shape initial = polyline;
    const TransformInfo info{TransformHandle::BottomRightCorner, initial, 2.0f, 2.0f, Point2{0.0f, 0.0f}};
    polylines.transform(polyline, Bounds::fromMinMax(0.0f, 0.0f, 40.0f, 10.0f), info);

    const std::vector<Point2>& points = polyline.as<PolylineData>().points;
    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0], (Point2{0.0f, 0.0f}));
    EXPECT_EQ(points[1], (Point2{20.0f, 10.0f}));
    EXPECT_EQ(points[2], (Point2{40.0f, 0.0f}));
    EXPECT_EQ(polyline.point, (Point2{0.0f, 0.0f}));
    EXPECT_EQ(polylines.getBounds(polyline), Bounds::fromMinMax(0.0f, 0.0f, 40.0f, 10.0f));
}

TEST_F(PolylineShapeTest, NegativeScaleMirrorsPoints) {
    const Shape initial = polyline;
    const TransformInfo info{TransformHandle::LeftEdge, initial, -1.0f, 1.0f, Point2{0.0f, 0.0f}};
    polylines.transform(polyline, Bounds::fromMinMax(0.0f, 0.0f, 20.0f, 5.0f), info);

    const std::vector<Point2>& points = polyline.as<PolylineData>().points;
    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0], (Point2{20.0f, 0.0f}));
    EXPECT_EQ(points[1], (Point2{10.0f, 5.0f}));
    EXPECT_EQ(points[2], (Point2{0.0f, 0.0f}));
}

TEST_F(PolylineShapeTest, FillIsNeverRendered) {
    ShapeStylePatch patch;
    patch.isFilled = true;
    polylines.applyStyles(polyline, patch);
    EXPECT_FALSE(polylines.render(polyline).style.fillEnabled);
}

TEST(PolylineEmptyTest, EmptyPointListNeverHits) {
    const ShapeBehavior& polylines = utils(ShapeType::Polyline);
    const Shape empty = createShape(ShapeType::Polyline);
    EXPECT_FALSE(polylines.hitTest(empty, Point2{0.0f, 0.0f}));
    EXPECT_FALSE(polylines.hitTestBounds(empty, Bounds::fromMinMax(-1.0f, -1.0f, 1.0f, 1.0f)));
}

TEST(DrawShapeTest, RenderSmoothsThroughMidpoints) {
    const ShapeBehavior& draws = utils(ShapeType::Draw);
    const Shape stroke = make(ShapeType::Draw, Point2{0.0f, 0.0f},
                              DrawData{{Point2{0.0f, 0.0f}, Point2{10.0f, 0.0f}, Point2{10.0f, 10.0f}, Point2{20.0f, 10.0f}}});
    const render::RenderNode node = draws.render(stroke);
    ASSERT_EQ(node.paths.size(), 1u);
    const std::vector<render::Segment>& segments = node.paths[0].segments;
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0].kind, render::SegmentKind::Move);
    EXPECT_EQ(segments[1].kind, render::SegmentKind::Quad);
    EXPECT_EQ(segments[1].to, (Point2{10.0f, 5.0f}));
    EXPECT_EQ(segments[2].kind, render::SegmentKind::Quad);
    EXPECT_EQ(segments[3].kind, render::SegmentKind::Line);
    EXPECT_EQ(segments[3].to, (Point2{20.0f, 10.0f}));

    EXPECT_EQ(draws.getBounds(stroke), Bounds::fromMinMax(0.0f, 0.0f, 20.0f, 10.0f));
}

// =============================================================================
// Arrow
// =============================================================================

TEST(ArrowShapeTest, CreateAddsDefaultHandles) {
    const Shape arrow = createShape(ShapeType::Arrow);
    const ShapeHandles& handles = arrow.as<ArrowData>().handles;
    ASSERT_EQ(handles.size(), 3u);
    EXPECT_EQ(handles.at("start").index, 0u);
    EXPECT_EQ(handles.at("end").index, 1u);
    EXPECT_EQ(handles.at("bend").index, 2u);
    EXPECT_EQ(handleAt(arrow, "start"), (Point2{0.0f, 0.0f}));
    EXPECT_EQ(handleAt(arrow, "end"), (Point2{1.0f, 1.0f}));
    EXPECT_EQ(handleAt(arrow, "bend"), (Point2{0.5f, 0.5f}));
}

TEST(ArrowShapeTest, MovingStartNormalizesHandles) {
    const ShapeBehavior& arrows = utils(ShapeType::Arrow);
    ShapeInit init;
    init.point = Point2{100.0f, 100.0f};
    Shape arrow = createShape(ShapeType::Arrow, init);

    arrows.onHandleChange(arrow, HandlePatch{{"start", Point2{-10.0f, -20.0f}}});
    EXPECT_EQ(arrow.point, (Point2{90.0f, 80.0f}));
    EXPECT_EQ(handleAt(arrow, "start"), (Point2{0.0f, 0.0f}));
    EXPECT_EQ(handleAt(arrow, "end"), (Point2{11.0f, 21.0f}));
    EXPECT_EQ(arrows.getBounds(arrow), Bounds::fromMinMax(90.0f, 80.0f, 101.0f, 101.0f));
}

TEST(ArrowShapeTest, BendHandleSetsBend) {
    const ShapeBehavior& arrows = utils(ShapeType::Arrow);
    Shape arrow = createShape(ShapeType::Arrow);
    arrows.onHandleChange(arrow, HandlePatch{{"end", Point2{10.0f, 0.0f}}});
    EXPECT_EQ(handleAt(arrow, "bend"), (Point2{5.0f, 0.0f}));

    arrows.onHandleChange(arrow, HandlePatch{{"bend", Point2{5.0f, -4.0f}}});
    EXPECT_FLOAT_EQ(arrow.as<ArrowData>().bend, 4.0f);
    EXPECT_EQ(handleAt(arrow, "start"), (Point2{0.0f, 4.0f}));
    EXPECT_EQ(handleAt(arrow, "bend"), (Point2{5.0f, 0.0f}));
    EXPECT_EQ(handleAt(arrow, "end"), (Point2{10.0f, 4.0f}));
    EXPECT_FLOAT_EQ(arrow.point.y, -4.0f);

    // The curve passes through the bend handle
    EXPECT_TRUE(arrows.hitTest(arrow, Point2{5.0f, -4.0f}));
    EXPECT_FALSE(arrows.hitTest(arrow, Point2{5.0f, 6.0f}));
}

TEST(ArrowShapeTest, UnknownHandleIsIgnored) {
    const ShapeBehavior& arrows = utils(ShapeType::Arrow);
    Shape arrow = createShape(ShapeType::Arrow);
    const ShapeHandles before = arrow.as<ArrowData>().handles;

    arrows.onHandleChange(arrow, HandlePatch{{"middle", Point2{5.0f, 5.0f}}});
    EXPECT_EQ(arrow.as<ArrowData>().handles.size(), before.size());
    EXPECT_EQ(arrow.as<ArrowData>().handles.count("middle"), 0u);
    EXPECT_EQ(handleAt(arrow, "end"), before.at("end").point);
    EXPECT_EQ(arrow.point, (Point2{0.0f, 0.0f}));
}

TEST(ArrowShapeTest, BindingMovesHandleToTarget) {
    const ShapeBehavior& arrows = utils(ShapeType::Arrow);
    Shape arrow = createShape(ShapeType::Arrow);

    ShapeBindings bindings;
    bindings["end"] = ShapeBinding{"target", BindingType::Anchor, Point2{20.0f, 10.0f}};
    bindings["bend"] = ShapeBinding{"target", BindingType::Anchor, Point2{0.0f, 0.0f}};
    arrows.onBindingChange(arrow, bindings);

    const ArrowData& data = arrow.as<ArrowData>();
    ASSERT_EQ(data.bindings.count("end"), 1u);
    EXPECT_EQ(data.bindings.at("end").targetId, "target");
    EXPECT_EQ(data.bindings.count("bend"), 0u);
    EXPECT_EQ(handleAt(arrow, "end"), (Point2{20.0f, 10.0f}));
    EXPECT_EQ(handleAt(arrow, "bend"), (Point2{10.0f, 5.0f}));
}

TEST(ArrowShapeTest, TransformRescalesHandles) {
    const ShapeBehavior& arrows = utils(ShapeType::Arrow);
    Shape arrow = createShape(ShapeType::Arrow);
    arrows.onHandleChange(arrow, HandlePatch{{"end", Point2{10.0f, 10.0f}}});
    const Shape initial = arrow;

    const TransformInfo info{TransformHandle::BottomRightCorner, initial, 2.0f, 2.0f, Point2{0.0f, 0.0f}};
    arrows.transform(arrow, Bounds::fromMinMax(0.0f, 0.0f, 20.0f, 20.0f), info);
    EXPECT_EQ(handleAt(arrow, "end"), (Point2{20.0f, 20.0f}));
    EXPECT_EQ(handleAt(arrow, "bend"), (Point2{10.0f, 10.0f}));
    EXPECT_NEAR(arrow.as<ArrowData>().bend, 0.0f, 1e-4f);
}

TEST(ArrowShapeTest, NonUniformTransformKeepsBendOnNormal) {
    const ShapeBehavior& arrows = utils(ShapeType::Arrow);
    Shape arrow = createShape(ShapeType::Arrow);
    arrows.onHandleChange(arrow, HandlePatch{{"end", Point2{10.0f, 10.0f}}});
    arrows.onHandleChange(arrow, HandlePatch{{"bend", Point2{3.0f, 7.0f}}});
    EXPECT_EQ(arrows.getBounds(arrow), Bounds::fromMinMax(0.0f, 0.0f, 10.0f, 10.0f));
    const Shape initial = arrow;

    const TransformInfo info{TransformHandle::RightEdge, initial, 2.0f, 1.0f, Point2{0.0f, 0.0f}};
    arrows.transform(arrow, Bounds::fromMinMax(0.0f, 0.0f, 20.0f, 10.0f), info);

    const Point2 start = handleAt(arrow, "start");
    const Point2 end = handleAt(arrow, "end");
    const Point2 bend = handleAt(arrow, "bend");
    const Point2 chord{end.x - start.x, end.y - start.y};
    const Point2 offset{bend.x - (start.x + end.x) * 0.5f, bend.y - (start.y + end.y) * 0.5f};
    EXPECT_NEAR(chord.x * offset.x + chord.y * offset.y, 0.0f, 1e-3f);

    // Dragging an endpoint onto itself leaves the curve where it is
    const Bounds before = arrows.getBounds(arrow);
    arrows.onHandleChange(arrow, HandlePatch{{"end", end}});
    expectBoundsNear(arrows.getBounds(arrow), before);
}

TEST(ArrowShapeTest, RenderHasShaftAndHead) {
    const Shape arrow = createShape(ShapeType::Arrow);
    const render::RenderNode node = utils(ShapeType::Arrow).render(arrow);
    ASSERT_EQ(node.paths.size(), 2u);
    EXPECT_EQ(node.paths[0].segments[1].kind, render::SegmentKind::Quad);
    EXPECT_EQ(node.paths[1].segments.size(), 3u);
    EXPECT_EQ(node.paths[1].segments[1].to, (Point2{1.0f, 1.0f}));
}

// =============================================================================
// Group
// =============================================================================

TEST(GroupShapeTest, FitsChildren) {
    const ShapeBehavior& groups = utils(ShapeType::Group);
    Shape group = createShape(ShapeType::Group);
    const Shape a = make(ShapeType::Rectangle, Point2{0.0f, 0.0f}, RectangleData{Point2{10.0f, 10.0f}, 0.0f});
    const Shape b = make(ShapeType::Rectangle, Point2{20.0f, 20.0f}, RectangleData{Point2{10.0f, 10.0f}, 0.0f});

    groups.onChildrenChange(group, {&a, &b, nullptr});
    EXPECT_EQ(groups.getBounds(group), Bounds::fromMinMax(0.0f, 0.0f, 30.0f, 30.0f));
}

TEST(GroupShapeTest, EmptyChildrenLeaveGroupAlone) {
    const ShapeBehavior& groups = utils(ShapeType::Group);
    ShapeInit init;
    init.point = Point2{4.0f, 4.0f};
    Shape group = createShape(ShapeType::Group, init);

    groups.onChildrenChange(group, {});
    EXPECT_EQ(groups.getBounds(group), Bounds::fromMinMax(4.0f, 4.0f, 5.0f, 5.0f));
}

TEST(GroupShapeTest, TransformFitsBounds) {
    const ShapeBehavior& groups = utils(ShapeType::Group);
    Shape group = createShape(ShapeType::Group);
    const Shape initial = group;
    const TransformInfo info{TransformHandle::BottomRightCorner, initial, 4.0f, 2.0f, Point2{0.0f, 0.0f}};
    groups.transform(group, Bounds::fromMinMax(2.0f, 2.0f, 6.0f, 4.0f), info);
    EXPECT_EQ(groups.getBounds(group), Bounds::fromMinMax(2.0f, 2.0f, 6.0f, 4.0f));
}

// =============================================================================
// Dot
// =============================================================================

TEST(DotShapeTest, FixedSizeAndSolidFill) {
    const ShapeBehavior& dots = utils(ShapeType::Dot);
    EXPECT_FALSE(dots.canTransform());

    ShapeInit init;
    init.point = Point2{3.0f, 3.0f};
    ShapeStyle style;
    style.strokeRGBA = 0xFF0000FFu;
    init.style = style;
    const Shape dot = createShape(ShapeType::Dot, init);

    const render::RenderNode node = dots.render(dot);
    EXPECT_TRUE(node.style.fillEnabled);
    EXPECT_EQ(node.style.fillRGBA, 0xFF0000FFu);
    ASSERT_EQ(node.paths.size(), 1u);
    EXPECT_EQ(node.paths[0].segments[1].radius, (Point2{constants::DOT_RADIUS, constants::DOT_RADIUS}));
}
