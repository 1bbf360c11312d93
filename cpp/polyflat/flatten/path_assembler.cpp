#include "polyflat/flatten/path_assembler.h"

#include <utility>

namespace polyflat::flatten {

void PathAssembler::append(const std::vector<Point2>& segmentPoints) {
    if (segmentPoints.empty()) return;

    auto first = segmentPoints.begin();
    if (hasLast_ && nearlyEqual(last_, *first, kJoinTolerance)) {
        ++first;
    }
    points_.insert(points_.end(), first, segmentPoints.end());
    last_ = segmentPoints.back();
    hasLast_ = true;
}

geom::Polygon PathAssembler::finish(std::int32_t layer, std::uint32_t pathId, bool closed) {
    geom::Polygon poly;
    poly.points = std::move(points_);
    poly.layer = layer;
    poly.pathId = pathId;
    poly.closed = closed;

    points_.clear();
    hasLast_ = false;
    return poly;
}

geom::Polygon assemblePolygon(const std::vector<std::vector<Point2>>& perSegment, std::int32_t layer) {
    PathAssembler assembler;
    for (const auto& pts : perSegment) assembler.append(pts);
    return assembler.finish(layer);
}

} // namespace polyflat::flatten
