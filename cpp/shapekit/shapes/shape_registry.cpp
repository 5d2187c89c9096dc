#include "shapekit/shapes/shape_registry.h"
#include "shapekit/shapes/variants/variants.h"
#include "shapekit/core/logging.h"

#include <string>

namespace shapekit {

namespace {

// Exhaustive over ShapeType; a new kind without overrides fails to build.
ShapeBehaviorOverrides overridesFor(ShapeType type) {
    switch (type) {
        case ShapeType::Dot: return variants::dotOverrides();
        case ShapeType::Circle: return variants::circleOverrides();
        case ShapeType::Ellipse: return variants::ellipseOverrides();
        case ShapeType::Line: return variants::lineOverrides();
        case ShapeType::Ray: return variants::rayOverrides();
        case ShapeType::Polyline: return variants::polylineOverrides();
        case ShapeType::Rectangle: return variants::rectangleOverrides();
        case ShapeType::Draw: return variants::drawOverrides();
        case ShapeType::Arrow: return variants::arrowOverrides();
        case ShapeType::Text: return variants::textOverrides();
        case ShapeType::Group: return variants::groupOverrides();
    }
    throw ShapeException(ShapeError::UnknownShapeType, "kind " + std::to_string(static_cast<unsigned>(type)));
}

} // namespace

ShapeRegistry::ShapeRegistry(const text::TextMeasurer* textMeasurer)
    : textMeasurer_(textMeasurer) {
    const BehaviorContext context{this, textMeasurer_};
    behaviors_.reserve(kShapeTypeCount);
    for (std::size_t i = 0; i < kShapeTypeCount; ++i) {
        const ShapeType type = static_cast<ShapeType>(i);
        behaviors_.push_back(std::make_unique<ShapeBehavior>(buildShapeBehavior(type, overridesFor(type), context)));
    }
    SHAPEKIT_LOG_DEBUG("registry built with %zu behaviors (text measurer: %s)",
                       behaviors_.size(), textMeasurer_ ? "yes" : "no");
}

const ShapeRegistry& ShapeRegistry::builtin() {
    static const ShapeRegistry registry;
    return registry;
}

const ShapeBehavior& ShapeRegistry::lookup(ShapeType type) const {
    const std::size_t index = static_cast<std::size_t>(type);
    if (index >= behaviors_.size() || !behaviors_[index]) {
        throw ShapeException(ShapeError::UnknownShapeType, "kind " + std::to_string(index) + " is not registered");
    }
    return *behaviors_[index];
}

Shape ShapeRegistry::create(ShapeType type, const ShapeInit& init) const {
    return lookup(type).create(init);
}

void ShapeRegistry::forgetShape(const ShapeId& id) const {
    for (const auto& behavior : behaviors_) {
        behavior->invalidateBounds(id);
    }
}

std::size_t ShapeRegistry::boundsCacheSize() const noexcept {
    std::size_t total = 0;
    for (const auto& behavior : behaviors_) {
        total += behavior->boundsCacheSize();
    }
    return total;
}

void ShapeRegistry::clearBoundsCaches() const {
    for (const auto& behavior : behaviors_) {
        behavior->clearBoundsCache();
    }
}

const ShapeBehavior& getShapeUtils(const Shape& shape) {
    return ShapeRegistry::builtin().getShapeUtils(shape);
}

Shape createShape(ShapeType type, const ShapeInit& init) {
    return ShapeRegistry::builtin().create(type, init);
}

} // namespace shapekit
