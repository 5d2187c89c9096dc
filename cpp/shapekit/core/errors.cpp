#include "shapekit/core/errors.h"

namespace shapekit {

const char* describeShapeError(ShapeError error) noexcept {
    switch (error) {
        case ShapeError::Ok: return "ok";
        case ShapeError::UnknownShapeType: return "unknown shape type";
        case ShapeError::ShapeTypeMismatch: return "shape type mismatch";
        case ShapeError::InvalidProperty: return "invalid property";
        case ShapeError::InvalidPropertyValue: return "invalid property value";
        case ShapeError::IncompleteBehavior: return "incomplete behavior";
    }
    return "unknown error";
}

ShapeException::ShapeException(ShapeError code, const std::string& detail)
    : std::runtime_error(std::string(describeShapeError(code)) + ": " + detail),
      code_(code) {}

} // namespace shapekit
