#ifndef SHAPEKIT_SHAPES_SHAPE_PROPERTIES_H
#define SHAPEKIT_SHAPES_SHAPE_PROPERTIES_H

#include "shapekit/core/types.h"

namespace shapekit {

// True if prop exists on shapes of the given kind. Common props exist on all
// kinds; id and type are never settable.
bool isPropertyAllowed(ShapeType type, ShapeProp prop) noexcept;

// Checked assignment of one property. Throws InvalidProperty for a prop the
// kind does not have, InvalidPropertyValue for a wrongly typed, non-finite or
// out-of-range value. The shape is left untouched when it throws.
void assignShapeProperty(Shape& shape, ShapeProp prop, const PropValue& value);

} // namespace shapekit

#endif // SHAPEKIT_SHAPES_SHAPE_PROPERTIES_H
