#ifndef POLYFLAT_XFORM_TRANSFORM_H
#define POLYFLAT_XFORM_TRANSFORM_H

#include "polyflat/core/types.h"
#include "polyflat/geom/polygon.h"
#include "polyflat/xform/bounds.h"

#include <optional>
#include <vector>

namespace polyflat::xform {

// Uniform similarity map: translate the box center to the origin, scale both
// axes by the same factor, then optionally mirror Y.
struct TransformParams {
    double scale{1.0};
    double centerX{0.0};
    double centerY{0.0};
    bool flipY{false};
};

// Scale is targetWidth / box width when a target is given and the box has a
// positive width, 1.0 otherwise.
TransformParams deriveTransform(const BoundingBox& bounds, std::optional<double> targetWidth, bool flipY) noexcept;

inline Point2 applyTransform(const TransformParams& t, const Point2& p) noexcept {
    const double x = (p.x - t.centerX) * t.scale;
    double y = (p.y - t.centerY) * t.scale;
    if (t.flipY) y = -y;
    return Point2{x, y};
}

void applyTransform(const TransformParams& t, std::vector<geom::Polygon>& polygons) noexcept;

} // namespace polyflat::xform

#endif // POLYFLAT_XFORM_TRANSFORM_H
