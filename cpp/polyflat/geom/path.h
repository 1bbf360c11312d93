#ifndef POLYFLAT_GEOM_PATH_H
#define POLYFLAT_GEOM_PATH_H

#include "polyflat/core/types.h"
#include "polyflat/geom/curve_segment.h"

#include <cstdint>
#include <vector>

namespace polyflat::geom {

// One contiguous outline. Segments are read-only inputs to the flatteners.
struct Path {
    std::uint32_t id{0};
    std::vector<CurveSegment> segments;
    bool closed{false};
};

// Turns pen-style drawing commands into self-contained segments. Each moveTo
// starts a new Path; contours without segments are dropped.
class PathBuilder {
public:
    PathBuilder() = default;

    PathBuilder& moveTo(Point2 p);
    PathBuilder& lineTo(Point2 p);
    PathBuilder& quadTo(Point2 control, Point2 p);
    PathBuilder& cubicTo(Point2 control1, Point2 control2, Point2 p);
    PathBuilder& arcTo(Point2 radius, double rotation, bool largeArc, bool sweep, Point2 p);
    PathBuilder& close();

    // Finalizes the open contour and hands over every collected path.
    std::vector<Path> build();

    Point2 currentPoint() const noexcept { return curr_; }

private:
    void finishContour();
    void ensureContour();
    void append(const CurveSegment& seg, Point2 to);

    std::vector<Path> paths_;
    Path contour_;
    Point2 curr_{};
    Point2 start_{};
    bool contourOpen_{false};
    std::uint32_t nextId_{0};
};

} // namespace polyflat::geom

#endif // POLYFLAT_GEOM_PATH_H
