#include "polyflat/xform/transform.h"

namespace polyflat::xform {

TransformParams deriveTransform(const BoundingBox& bounds, std::optional<double> targetWidth, bool flipY) noexcept {
    TransformParams t;
    t.centerX = bounds.centerX();
    t.centerY = bounds.centerY();
    t.flipY = flipY;

    const double width = bounds.width();
    if (targetWidth && width > 0.0) {
        t.scale = *targetWidth / width;
    }
    return t;
}

void applyTransform(const TransformParams& t, std::vector<geom::Polygon>& polygons) noexcept {
    for (geom::Polygon& poly : polygons) {
        for (Point2& p : poly.points) {
            p = applyTransform(t, p);
        }
    }
}

} // namespace polyflat::xform
