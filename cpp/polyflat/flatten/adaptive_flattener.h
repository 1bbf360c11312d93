#ifndef POLYFLAT_FLATTEN_ADAPTIVE_FLATTENER_H
#define POLYFLAT_FLATTEN_ADAPTIVE_FLATTENER_H

#include "polyflat/core/types.h"
#include "polyflat/geom/curve_segment.h"
#include "polyflat/geom/path.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace polyflat::flatten {

struct AdaptiveLimits {
    std::uint32_t maxDepth{32};          // bisection levels below [0,1]
    std::size_t maxPoints{1u << 20};     // points emitted for a single segment
};

// Perpendicular distance of p1 from the chord p0-p2. Zero-length chords give 0.
double chordError(const Point2& p0, const Point2& p1, const Point2& p2) noexcept;

// Bisects [0,1] until the curve's parametric midpoint of every interval lies
// within maxError of that interval's chord. The deviation is sampled at the
// midpoint only, so error concentrated elsewhere in an interval can go unseen.
//
// Appends the polyline to `out` (first point included). When `outParams` is
// non-null, the parameter of every appended point is appended to it.
// Returns SubdivisionLimitExceeded when `limits` would be breached; `out` then
// holds a partial result and must be discarded.
ConvertError flattenSegmentAdaptive(
    const geom::CurveSegment& seg,
    double maxError,
    const AdaptiveLimits& limits,
    std::vector<Point2>& out,
    std::vector<double>* outParams = nullptr
);

// One point list per segment, in segment order.
ConvertError flattenPathAdaptive(
    const geom::Path& path,
    double maxError,
    const AdaptiveLimits& limits,
    std::vector<std::vector<Point2>>& outPerSegment
);

} // namespace polyflat::flatten

#endif // POLYFLAT_FLATTEN_ADAPTIVE_FLATTENER_H
