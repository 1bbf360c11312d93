#include "polyflat/xform/bounds.h"

#include <algorithm>
#include <limits>

namespace polyflat::xform {

bool computeBounds(const std::vector<geom::Polygon>& polygons, BoundingBox& out) noexcept {
    constexpr double inf = std::numeric_limits<double>::infinity();
    BoundingBox box{inf, -inf, inf, -inf};
    bool any = false;

    for (const geom::Polygon& poly : polygons) {
        for (const Point2& p : poly.points) {
            box.minX = std::min(box.minX, p.x);
            box.maxX = std::max(box.maxX, p.x);
            box.minY = std::min(box.minY, p.y);
            box.maxY = std::max(box.maxY, p.y);
            any = true;
        }
    }
    if (!any) return false;

    out = box;
    return true;
}

} // namespace polyflat::xform
