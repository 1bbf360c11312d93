#include "polyflat/flatten/adaptive_flattener.h"
#include "polyflat/core/logging.h"

#include <cmath>

namespace polyflat::flatten {

namespace {

struct IntervalWork {
    double t0;
    double t1;
    Point2 p0;
    Point2 p2;
    std::uint32_t depth;
};

} // namespace

double chordError(const Point2& p0, const Point2& p1, const Point2& p2) noexcept {
    const Point2 chordVec = sub(p2, p0);
    const double chordLen = len(chordVec);
    if (chordLen == 0.0) return 0.0;
    const Point2 midVec = sub(p1, p0);
    return std::abs(cross(chordVec, midVec)) / chordLen;
}

ConvertError flattenSegmentAdaptive(
    const geom::CurveSegment& seg,
    double maxError,
    const AdaptiveLimits& limits,
    std::vector<Point2>& out,
    std::vector<double>* outParams
) {
    if (!(maxError > 0.0) || !std::isfinite(maxError)) return ConvertError::InvalidMaxError;
    if (limits.maxDepth == 0 || limits.maxPoints < 2) return ConvertError::InvalidSubdivisionLimit;

    // Iterative subdivision (stack) instead of recursion; the depth cap bounds the
    // stack at maxDepth + 1 entries.
    std::vector<IntervalWork> stack;
    stack.reserve(limits.maxDepth + 1);

    const Point2 first = seg.evaluate(0.0);
    out.push_back(first);
    if (outParams) outParams->push_back(0.0);
    std::size_t emitted = 1;

    stack.push_back(IntervalWork{0.0, 1.0, first, seg.evaluate(1.0), 0});
    while (!stack.empty()) {
        const IntervalWork w = stack.back();
        stack.pop_back();

        const double tm = 0.5 * (w.t0 + w.t1);
        const Point2 p1 = seg.evaluate(tm);

        // Degenerate chords terminate the branch; so does an accepted chord.
        const bool degenerate = len(sub(w.p2, w.p0)) == 0.0;
        if (degenerate || chordError(w.p0, p1, w.p2) <= maxError) {
            if (emitted >= limits.maxPoints) {
                POLYFLAT_LOG_WARN("adaptive flattening exceeded %zu points (max error %g)", limits.maxPoints, maxError);
                return ConvertError::SubdivisionLimitExceeded;
            }
            out.push_back(w.p2);
            if (outParams) outParams->push_back(w.t1);
            emitted++;
            continue;
        }

        if (w.depth >= limits.maxDepth) {
            POLYFLAT_LOG_WARN("adaptive flattening exceeded depth %u (max error %g)", limits.maxDepth, maxError);
            return ConvertError::SubdivisionLimitExceeded;
        }

        // Push second half first so first half is processed first (LIFO).
        stack.push_back(IntervalWork{tm, w.t1, p1, w.p2, w.depth + 1});
        stack.push_back(IntervalWork{w.t0, tm, w.p0, p1, w.depth + 1});
    }
    return ConvertError::Ok;
}

ConvertError flattenPathAdaptive(
    const geom::Path& path,
    double maxError,
    const AdaptiveLimits& limits,
    std::vector<std::vector<Point2>>& outPerSegment
) {
    outPerSegment.clear();
    outPerSegment.resize(path.segments.size());
    for (std::size_t i = 0; i < path.segments.size(); i++) {
        const ConvertError err = flattenSegmentAdaptive(path.segments[i], maxError, limits, outPerSegment[i]);
        if (err != ConvertError::Ok) {
            outPerSegment.clear();
            return err;
        }
    }
    return ConvertError::Ok;
}

} // namespace polyflat::flatten
