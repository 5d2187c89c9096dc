#include "shapekit/shapes/variants/variants.h"
#include "shapekit/shapes/variants/point_list_geometry.h"
#include "shapekit/shapes/default_behavior.h"

namespace shapekit::variants {

namespace {

render::RenderNode renderPolyline(const ShapeBehavior& self, const Shape& shape) {
    render::RenderNode node = defaults::makeRenderNode(self, shape);
    node.paths.push_back(render::polylinePath(shape.as<PolylineData>().points, shape.point));
    return node;
}

} // namespace

ShapeBehaviorOverrides polylineOverrides() {
    ShapeBehaviorOverrides o;
    o.canStyleFill = false;
    o.ops.getBounds = &pointListBounds;
    o.ops.hitTest = &pointListHitTest;
    o.ops.hitTestBounds = &pointListHitTestBounds;
    o.ops.transform = &pointListTransform;
    o.ops.render = &renderPolyline;
    return o;
}

} // namespace shapekit::variants
