#ifndef POLYFLAT_GEOM_POLYGON_H
#define POLYFLAT_GEOM_POLYGON_H

#include "polyflat/core/types.h"

#include <cstdint>
#include <vector>

namespace polyflat::geom {

struct Polygon {
    std::vector<Point2> points;
    std::int32_t layer{0};
    std::uint32_t pathId{0};   // id of the Path it was flattened from
    bool closed{false};        // copied from the source Path; no closing vertex is added
};

} // namespace polyflat::geom

#endif // POLYFLAT_GEOM_POLYGON_H
