#include "shapekit/core/util.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace shapekit {

ShapeId generateShapeId() {
    // Single interaction thread; one generator seeded once per process.
    static boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace shapekit
