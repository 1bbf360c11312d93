#ifndef POLYFLAT_FLATTEN_FIXED_FLATTENER_H
#define POLYFLAT_FLATTEN_FIXED_FLATTENER_H

#include "polyflat/core/types.h"
#include "polyflat/geom/curve_segment.h"
#include "polyflat/geom/path.h"

#include <vector>

namespace polyflat::flatten {

// Appends steps+1 samples at t = i/steps, i in [0, steps].
ConvertError sampleSegmentFixed(const geom::CurveSegment& seg, int steps, std::vector<Point2>& out);

// One point list per segment, in segment order. Join points appear in both
// neighbouring lists; PathAssembler removes them.
ConvertError flattenPathFixed(const geom::Path& path, int steps, std::vector<std::vector<Point2>>& outPerSegment);

// Plain concatenation of every segment's samples, join points included twice.
ConvertError flattenPathFixedRaw(const geom::Path& path, int steps, std::vector<Point2>& out);

} // namespace polyflat::flatten

#endif // POLYFLAT_FLATTEN_FIXED_FLATTENER_H
