#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/default_behavior.h"
#include "shapekit/core/logging.h"
#include "shapekit/geometry/bounds.h"
#include "shapekit/text/text_measure.h"

#include <algorithm>
#include <cmath>

namespace shapekit::variants {

namespace {

// Extent at scale 1.
text::TextExtent unscaledExtent(const ShapeBehavior& self, const Shape& shape) {
    const TextData& t = shape.as<TextData>();
    if (const text::TextMeasurer* measurer = self.context().textMeasurer) {
        return measurer->measure(t.text, t.fontId, t.fontSize);
    }
    return text::estimateTextExtent(t.text, t.fontSize);
}

Bounds textBounds(const ShapeBehavior& self, const Shape& shape) {
    const text::TextExtent extent = unscaledExtent(self, shape);
    const float scale = shape.as<TextData>().scale;
    return Bounds::fromMinMax(
        shape.point.x, shape.point.y,
        shape.point.x + extent.width * scale, shape.point.y + extent.height * scale);
}

bool textHitTest(const ShapeBehavior& self, const Shape& shape, Point2 point) {
    return geometry::pointInRotatedBounds(point, self.getBounds(shape), shape.rotation);
}

void textTransform(const ShapeBehavior& self, Shape& shape, const Bounds& bounds, const TransformInfo& info) {
    const float initialScale = info.initialShape.as<TextData>().scale;
    const float scale = initialScale * std::min(std::abs(info.scaleX), std::abs(info.scaleY));
    if (scale <= 0.0f) {
        SHAPEKIT_LOG_WARN("degenerate text transform on %s", shape.id.c_str());
        shape.point = Point2{bounds.minX, bounds.minY};
        return;
    }

    // Measured from the snapshot; the live shape is mid-mutation here
    const text::TextExtent extent = unscaledExtent(self, info.initialShape);
    const float width = extent.width * scale;
    const float height = extent.height * scale;
    const float ox = info.scaleX < 0.0f ? 1.0f - info.transformOrigin.x : info.transformOrigin.x;
    const float oy = info.scaleY < 0.0f ? 1.0f - info.transformOrigin.y : info.transformOrigin.y;

    shape.as<TextData>().scale = scale;
    shape.point = Point2{
        bounds.minX + (bounds.width - width) * ox,
        bounds.minY + (bounds.height - height) * oy,
    };
}

// A single text box follows the dragged height; width reflows from the glyphs.
void textTransformSingle(const ShapeBehavior& self, Shape& shape, const Bounds& bounds, const TransformInfo& info) {
    const Bounds initial = self.getBounds(info.initialShape);
    shape.point = Point2{bounds.minX, bounds.minY};
    if (initial.height <= 0.0f || bounds.height <= 0.0f) {
        SHAPEKIT_LOG_WARN("degenerate text transform on %s", shape.id.c_str());
        return;
    }
    shape.as<TextData>().scale = info.initialShape.as<TextData>().scale * (bounds.height / initial.height);
}

render::RenderNode renderText(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    const TextData& t = shape.as<TextData>();
    node.text = t.text;
    node.fontSize = t.fontSize * t.scale;
    node.textOrigin = shape.point;
    // Text is painted in the stroke color
    node.style.fillEnabled = true;
    node.style.fillRGBA = shape.style.strokeRGBA;
    node.style.strokeEnabled = false;
    return node;
}

} // namespace

ShapeBehaviorOverrides textOverrides() {
    ShapeBehaviorOverrides o;
    o.canChangeAspectRatio = false;
    o.canStyleFill = false;
    o.ops.getBounds = &textBounds;
    o.ops.hitTest = &textHitTest;
    o.ops.transform = &textTransform;
    o.ops.transformSingle = &textTransformSingle;
    o.ops.render = &renderText;
    return o;
}

} // namespace shapekit::variants
