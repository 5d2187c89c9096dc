#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/default_behavior.h"

namespace shapekit::variants {

namespace {

render::RenderNode renderDot(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    node.paths.push_back(render::ellipsePath(shape.point, constants::DOT_RADIUS, constants::DOT_RADIUS));
    // Dots are always drawn solid in the stroke color
    node.style.fillEnabled = true;
    node.style.fillRGBA = shape.style.strokeRGBA;
    return node;
}

} // namespace

ShapeBehaviorOverrides dotOverrides() {
    ShapeBehaviorOverrides o;
    o.canTransform = false;
    o.canChangeAspectRatio = false;
    o.canStyleFill = false;
    o.ops.render = &renderDot;
    return o;
}

} // namespace shapekit::variants
