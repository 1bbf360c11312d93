#ifndef POLYFLAT_FLATTEN_PATH_ASSEMBLER_H
#define POLYFLAT_FLATTEN_PATH_ASSEMBLER_H

#include "polyflat/core/types.h"
#include "polyflat/geom/polygon.h"

#include <cstdint>
#include <vector>

namespace polyflat::flatten {

// Folds per-segment point lists into one polygon. The last appended point is
// the fold state: a list whose first point matches it (within kJoinTolerance on
// both axes) contributes everything but that first point.
class PathAssembler {
public:
    PathAssembler() = default;

    void append(const std::vector<Point2>& segmentPoints);

    // Moves the accumulated points into a Polygon and resets the assembler.
    geom::Polygon finish(std::int32_t layer, std::uint32_t pathId = 0, bool closed = false);

    std::size_t pointCount() const noexcept { return points_.size(); }
    bool empty() const noexcept { return points_.empty(); }

private:
    std::vector<Point2> points_;
    Point2 last_{};
    bool hasLast_{false};
};

geom::Polygon assemblePolygon(const std::vector<std::vector<Point2>>& perSegment, std::int32_t layer);

} // namespace polyflat::flatten

#endif // POLYFLAT_FLATTEN_PATH_ASSEMBLER_H
