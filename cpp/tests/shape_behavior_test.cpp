#include <gtest/gtest.h>

#include "shapekit/shapes/default_behavior.h"
#include "shapekit/shapes/shape_behavior.h"

#include <set>
#include <string>

using namespace shapekit;

namespace {

void moveToAnswer(const ShapeBehavior&, Shape& shape, const Bounds&, const TransformInfo&) {
    shape.point = Point2{42.0f, 42.0f};
}

Bounds twoByTwo(const ShapeBehavior&, const Shape& shape) {
    return Bounds::fromMinMax(shape.point.x, shape.point.y, shape.point.x + 2.0f, shape.point.y + 2.0f);
}

void expectDefaultTable(const ShapeBehaviorTable& ops) {
    const ShapeBehaviorTable& d = defaults::table();
    EXPECT_EQ(ops.create, d.create);
    EXPECT_EQ(ops.translateBy, d.translateBy);
    EXPECT_EQ(ops.translateTo, d.translateTo);
    EXPECT_EQ(ops.transform, d.transform);
    EXPECT_EQ(ops.transformSingle, d.transformSingle);
    EXPECT_EQ(ops.setProperty, d.setProperty);
    EXPECT_EQ(ops.applyStyles, d.applyStyles);
    EXPECT_EQ(ops.onChildrenChange, d.onChildrenChange);
    EXPECT_EQ(ops.onBindingChange, d.onBindingChange);
    EXPECT_EQ(ops.onHandleChange, d.onHandleChange);
    EXPECT_EQ(ops.render, d.render);
    EXPECT_EQ(ops.getBounds, d.getBounds);
    EXPECT_EQ(ops.getRotatedBounds, d.getRotatedBounds);
    EXPECT_EQ(ops.getCenter, d.getCenter);
    EXPECT_EQ(ops.hitTest, d.hitTest);
    EXPECT_EQ(ops.hitTestBounds, d.hitTestBounds);
}

} // namespace

// =============================================================================
// Builder
// =============================================================================

TEST(ShapeBehaviorBuilderTest, FlagOverrideKeepsEveryDefaultOperation) {
    ShapeBehaviorOverrides overrides;
    overrides.canTransform = false;
    const ShapeBehavior behavior = buildShapeBehavior(ShapeType::Dot, overrides);

    EXPECT_FALSE(behavior.canTransform());
    EXPECT_TRUE(behavior.canChangeAspectRatio());
    EXPECT_TRUE(behavior.canStyleFill());
    expectDefaultTable(behavior.operations());
}

TEST(ShapeBehaviorBuilderTest, EmptyOverridesYieldDefaults) {
    const ShapeBehavior behavior = buildShapeBehavior(ShapeType::Rectangle, ShapeBehaviorOverrides{});
    EXPECT_EQ(behavior.type(), ShapeType::Rectangle);
    EXPECT_TRUE(behavior.canTransform());
    EXPECT_TRUE(behavior.canChangeAspectRatio());
    EXPECT_TRUE(behavior.canStyleFill());
    expectDefaultTable(behavior.operations());
}

TEST(ShapeBehaviorBuilderTest, OverrideReplacesOnlyItsEntry) {
    ShapeBehaviorOverrides overrides;
    overrides.ops.getBounds = &twoByTwo;
    const ShapeBehavior behavior = buildShapeBehavior(ShapeType::Dot, overrides);

    EXPECT_EQ(behavior.operations().getBounds, &twoByTwo);
    EXPECT_EQ(behavior.operations().getRotatedBounds, defaults::table().getRotatedBounds);

    // Defaults dispatch through the overridden entry
    const Shape shape = behavior.create();
    EXPECT_EQ(behavior.getRotatedBounds(shape), Bounds::fromMinMax(0.0f, 0.0f, 2.0f, 2.0f));
    EXPECT_EQ(behavior.getCenter(shape), (Point2{1.0f, 1.0f}));
}

TEST(ShapeBehaviorBuilderTest, IncompleteBaseTableThrows) {
    ShapeBehaviorTable base = defaults::table();
    base.hitTest = nullptr;
    try {
        (void)buildShapeBehavior(ShapeType::Dot, base, ShapeBehaviorOverrides{});
        FAIL() << "expected IncompleteBehavior";
    } catch (const ShapeException& e) {
        EXPECT_EQ(e.code(), ShapeError::IncompleteBehavior);
    }
}

TEST(ShapeBehaviorBuilderTest, OverrideCanFillIncompleteBase) {
    ShapeBehaviorTable base = defaults::table();
    base.getBounds = nullptr;
    ShapeBehaviorOverrides overrides;
    overrides.ops.getBounds = &twoByTwo;
    const ShapeBehavior behavior = buildShapeBehavior(ShapeType::Dot, base, overrides);
    EXPECT_EQ(behavior.operations().getBounds, &twoByTwo);
}

// =============================================================================
// Default operations
// =============================================================================

class DefaultBehaviorTest : public ::testing::Test {
protected:
    ShapeBehavior behavior = buildShapeBehavior(ShapeType::Dot, ShapeBehaviorOverrides{});
};

TEST_F(DefaultBehaviorTest, CreateFillsDefaults) {
    const Shape shape = behavior.create();
    EXPECT_EQ(shape.type, ShapeType::Dot);
    EXPECT_EQ(shape.id.size(), 36u);
    EXPECT_EQ(shape.name, "Shape");
    EXPECT_EQ(shape.parentId, "page0");
    EXPECT_FLOAT_EQ(shape.childIndex, 0.0f);
    EXPECT_EQ(shape.point, (Point2{0.0f, 0.0f}));
    EXPECT_FLOAT_EQ(shape.rotation, 0.0f);
    EXPECT_FALSE(shape.isLocked);
    EXPECT_FALSE(shape.isHidden);
    EXPECT_FALSE(shape.isAspectRatioLocked);
    EXPECT_FALSE(shape.isGenerated);
    EXPECT_EQ(shape.style, ShapeStyle{});
    EXPECT_EQ(shape.data.index(), static_cast<std::size_t>(ShapeType::Dot));
}

TEST_F(DefaultBehaviorTest, CreateAssignsFreshIds) {
    std::set<ShapeId> ids;
    for (int i = 0; i < 32; ++i) {
        ids.insert(behavior.create().id);
    }
    EXPECT_EQ(ids.size(), 32u);
}

TEST_F(DefaultBehaviorTest, CreateOverlaysInit) {
    ShapeInit init;
    init.id = std::string("fixed");
    init.name = std::string("Marker");
    init.point = Point2{3.0f, 4.0f};
    init.isLocked = true;
    const Shape shape = behavior.create(init);
    EXPECT_EQ(shape.id, "fixed");
    EXPECT_EQ(shape.name, "Marker");
    EXPECT_EQ(shape.point, (Point2{3.0f, 4.0f}));
    EXPECT_TRUE(shape.isLocked);
    EXPECT_EQ(shape.parentId, "page0");
}

TEST_F(DefaultBehaviorTest, CreateRejectsDataOfAnotherKind) {
    ShapeInit init;
    init.data = CircleData{5.0f};
    try {
        (void)behavior.create(init);
        FAIL() << "expected ShapeTypeMismatch";
    } catch (const ShapeException& e) {
        EXPECT_EQ(e.code(), ShapeError::ShapeTypeMismatch);
    }
}

TEST_F(DefaultBehaviorTest, UnitBoundsAtPoint) {
    ShapeInit init;
    init.point = Point2{2.0f, 3.0f};
    const Shape shape = behavior.create(init);
    const Bounds b = behavior.getBounds(shape);
    EXPECT_EQ(b, Bounds::fromMinMax(2.0f, 3.0f, 3.0f, 4.0f));
    EXPECT_FLOAT_EQ(b.width, b.maxX - b.minX);
    EXPECT_FLOAT_EQ(b.height, b.maxY - b.minY);
    EXPECT_EQ(behavior.getRotatedBounds(shape), b);
}

TEST_F(DefaultBehaviorTest, TranslateByIsAdditive) {
    Shape shape = behavior.create();
    behavior.translateBy(shape, Point2{5.0f, 5.0f});
    EXPECT_EQ(shape.point, (Point2{5.0f, 5.0f}));
    behavior.translateBy(shape, Point2{-2.0f, 1.0f});
    EXPECT_EQ(shape.point, (Point2{3.0f, 6.0f}));
}

TEST_F(DefaultBehaviorTest, TranslateToIsIdempotent) {
    Shape shape = behavior.create();
    behavior.translateTo(shape, Point2{7.0f, 8.0f});
    const Bounds first = behavior.getBounds(shape);
    behavior.translateTo(shape, Point2{7.0f, 8.0f});
    EXPECT_EQ(shape.point, (Point2{7.0f, 8.0f}));
    EXPECT_EQ(behavior.getBounds(shape), first);
}

TEST_F(DefaultBehaviorTest, CenterHits) {
    const Shape shape = behavior.create();
    EXPECT_TRUE(behavior.hitTest(shape, behavior.getCenter(shape)));
    EXPECT_FALSE(behavior.hitTest(shape, Point2{5.0f, 5.0f}));
}

TEST_F(DefaultBehaviorTest, HitTestBoundsContainOverlapDisjoint) {
    const Shape shape = behavior.create();
    EXPECT_TRUE(behavior.hitTestBounds(shape, Bounds::fromMinMax(-1.0f, -1.0f, 2.0f, 2.0f)));
    EXPECT_TRUE(behavior.hitTestBounds(shape, Bounds::fromMinMax(0.5f, 0.5f, 3.0f, 3.0f)));
    EXPECT_FALSE(behavior.hitTestBounds(shape, Bounds::fromMinMax(5.0f, 5.0f, 6.0f, 6.0f)));
}

TEST_F(DefaultBehaviorTest, TransformMovesPointToBoundsOrigin) {
    Shape shape = behavior.create();
    const Shape initial = shape;
    const TransformInfo info{TransformHandle::BottomRightCorner, initial, 2.0f, 2.0f, Point2{0.0f, 0.0f}};
    behavior.transform(shape, Bounds::fromMinMax(10.0f, 20.0f, 30.0f, 40.0f), info);
    EXPECT_EQ(shape.point, (Point2{10.0f, 20.0f}));
}

TEST_F(DefaultBehaviorTest, TransformSingleForwardsToKindTransform) {
    ShapeBehaviorOverrides overrides;
    overrides.ops.transform = &moveToAnswer;
    const ShapeBehavior custom = buildShapeBehavior(ShapeType::Dot, overrides);

    Shape shape = custom.create();
    const Shape initial = shape;
    const TransformInfo info{TransformHandle::TopEdge, initial, 1.0f, 1.0f, Point2{0.0f, 0.0f}};
    custom.transformSingle(shape, Bounds::fromMinMax(0.0f, 0.0f, 1.0f, 1.0f), info);
    EXPECT_EQ(shape.point, (Point2{42.0f, 42.0f}));
}

TEST_F(DefaultBehaviorTest, ApplyStylesMergesSetFields) {
    Shape shape = behavior.create();
    ShapeStylePatch patch;
    patch.strokeWidth = 5.0f;
    patch.dash = DashStyle::Dotted;
    behavior.applyStyles(shape, patch);
    EXPECT_FLOAT_EQ(shape.style.strokeWidth, 5.0f);
    EXPECT_EQ(shape.style.dash, DashStyle::Dotted);
    EXPECT_EQ(shape.style.strokeRGBA, constants::DEFAULT_STROKE_RGBA);
    EXPECT_FALSE(shape.style.isFilled);
}

TEST_F(DefaultBehaviorTest, HooksAreNoOps) {
    Shape shape = behavior.create();
    const Point2 before = shape.point;
    behavior.onChildrenChange(shape, {});
    behavior.onBindingChange(shape, ShapeBindings{});
    behavior.onHandleChange(shape, HandlePatch{{"start", Point2{1.0f, 1.0f}}});
    EXPECT_EQ(shape.point, before);
}

TEST_F(DefaultBehaviorTest, RenderProducesOnePath) {
    const Shape shape = behavior.create();
    const render::RenderNode node = behavior.render(shape);
    EXPECT_EQ(node.shapeId, shape.id);
    ASSERT_EQ(node.paths.size(), 1u);
    EXPECT_TRUE(node.paths[0].closed);
    EXPECT_FALSE(node.hasTransform);
}

TEST_F(DefaultBehaviorTest, RejectsShapeOfAnotherKind) {
    const ShapeBehavior rectangles = buildShapeBehavior(ShapeType::Rectangle, ShapeBehaviorOverrides{});
    Shape rect = rectangles.create();
    try {
        behavior.translateBy(rect, Point2{1.0f, 1.0f});
        FAIL() << "expected ShapeTypeMismatch";
    } catch (const ShapeException& e) {
        EXPECT_EQ(e.code(), ShapeError::ShapeTypeMismatch);
    }
    EXPECT_EQ(rect.point, (Point2{0.0f, 0.0f}));
    EXPECT_THROW((void)behavior.getBounds(rect), ShapeException);
}

TEST_F(DefaultBehaviorTest, MutationsBumpRevision) {
    Shape shape = behavior.create();
    const std::uint64_t r0 = shape.revision;
    behavior.translateBy(shape, Point2{1.0f, 0.0f});
    EXPECT_GT(shape.revision, r0);
    const std::uint64_t r1 = shape.revision;
    (void)behavior.getBounds(shape);
    EXPECT_EQ(shape.revision, r1);
}
