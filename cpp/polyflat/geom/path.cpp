#include "polyflat/geom/path.h"

#include <utility>

namespace polyflat::geom {

PathBuilder& PathBuilder::moveTo(Point2 p) {
    finishContour();
    curr_ = p;
    start_ = p;
    contourOpen_ = true;
    return *this;
}

PathBuilder& PathBuilder::lineTo(Point2 p) {
    append(CurveSegment::line(curr_, p), p);
    return *this;
}

PathBuilder& PathBuilder::quadTo(Point2 control, Point2 p) {
    append(CurveSegment::quadratic(curr_, control, p), p);
    return *this;
}

PathBuilder& PathBuilder::cubicTo(Point2 control1, Point2 control2, Point2 p) {
    append(CurveSegment::cubic(curr_, control1, control2, p), p);
    return *this;
}

PathBuilder& PathBuilder::arcTo(Point2 radius, double rotation, bool largeArc, bool sweep, Point2 p) {
    append(arcFromEndpoints(curr_, p, radius, rotation, largeArc, sweep), p);
    return *this;
}

PathBuilder& PathBuilder::close() {
    if (!contourOpen_) return *this;
    if (curr_ != start_) {
        contour_.segments.push_back(CurveSegment::line(curr_, start_));
        curr_ = start_;
    }
    contour_.closed = true;
    finishContour();
    // A command after close continues from the contour start (SVG semantics).
    contourOpen_ = true;
    return *this;
}

std::vector<Path> PathBuilder::build() {
    finishContour();
    contourOpen_ = false;
    std::vector<Path> out = std::move(paths_);
    paths_.clear();
    return out;
}

void PathBuilder::ensureContour() {
    if (contourOpen_) return;
    // Drawing without a preceding moveTo starts at the current point (origin initially).
    start_ = curr_;
    contourOpen_ = true;
}

void PathBuilder::append(const CurveSegment& seg, Point2 to) {
    ensureContour();
    contour_.segments.push_back(seg);
    curr_ = to;
}

void PathBuilder::finishContour() {
    if (!contour_.segments.empty()) {
        contour_.id = nextId_++;
        paths_.push_back(std::move(contour_));
    }
    contour_ = Path{};
}

} // namespace polyflat::geom
