#include "polyflat/flatten/fixed_flattener.h"

#include <cstddef>

namespace polyflat::flatten {

ConvertError sampleSegmentFixed(const geom::CurveSegment& seg, int steps, std::vector<Point2>& out) {
    if (steps <= 0) return ConvertError::InvalidStepCount;

    out.reserve(out.size() + static_cast<std::size_t>(steps) + 1);
    for (int i = 0; i <= steps; i++) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        out.push_back(seg.evaluate(t));
    }
    return ConvertError::Ok;
}

ConvertError flattenPathFixed(const geom::Path& path, int steps, std::vector<std::vector<Point2>>& outPerSegment) {
    outPerSegment.clear();
    if (steps <= 0) return ConvertError::InvalidStepCount;

    outPerSegment.resize(path.segments.size());
    for (std::size_t i = 0; i < path.segments.size(); i++) {
        const ConvertError err = sampleSegmentFixed(path.segments[i], steps, outPerSegment[i]);
        if (err != ConvertError::Ok) return err;
    }
    return ConvertError::Ok;
}

ConvertError flattenPathFixedRaw(const geom::Path& path, int steps, std::vector<Point2>& out) {
    out.clear();
    if (steps <= 0) return ConvertError::InvalidStepCount;

    out.reserve(path.segments.size() * (static_cast<std::size_t>(steps) + 1));
    for (const geom::CurveSegment& seg : path.segments) {
        const ConvertError err = sampleSegmentFixed(seg, steps, out);
        if (err != ConvertError::Ok) return err;
    }
    return ConvertError::Ok;
}

} // namespace polyflat::flatten
