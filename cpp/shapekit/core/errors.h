#ifndef SHAPEKIT_CORE_ERRORS_H
#define SHAPEKIT_CORE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace shapekit {

enum class ShapeError : std::uint32_t {
    Ok = 0,
    UnknownShapeType = 1,
    ShapeTypeMismatch = 2,
    InvalidProperty = 3,
    InvalidPropertyValue = 4,
    IncompleteBehavior = 5,
};

const char* describeShapeError(ShapeError error) noexcept;

// Thrown on contract violations (unregistered kinds, bad property edits).
// Geometry queries never throw for well-typed input.
class ShapeException : public std::runtime_error {
public:
    ShapeException(ShapeError code, const std::string& detail);

    ShapeError code() const noexcept { return code_; }

private:
    ShapeError code_;
};

} // namespace shapekit

#endif // SHAPEKIT_CORE_ERRORS_H
