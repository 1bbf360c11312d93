#ifndef POLYFLAT_XFORM_BOUNDS_H
#define POLYFLAT_XFORM_BOUNDS_H

#include "polyflat/geom/polygon.h"

#include <vector>

namespace polyflat::xform {

struct BoundingBox {
    double minX{0.0};
    double maxX{0.0};
    double minY{0.0};
    double maxY{0.0};

    double width() const noexcept { return maxX - minX; }
    double height() const noexcept { return maxY - minY; }
    double centerX() const noexcept { return 0.5 * (minX + maxX); }
    double centerY() const noexcept { return 0.5 * (minY + maxY); }
};

// Extent over every point of every polygon. Returns false (leaving `out`
// untouched) when there are no points at all.
bool computeBounds(const std::vector<geom::Polygon>& polygons, BoundingBox& out) noexcept;

} // namespace polyflat::xform

#endif // POLYFLAT_XFORM_BOUNDS_H
