#ifndef POLYFLAT_GEOM_CURVE_SEGMENT_H
#define POLYFLAT_GEOM_CURVE_SEGMENT_H

#include "polyflat/core/types.h"

#include <cstdint>

namespace polyflat::geom {

enum class SegmentKind : std::uint8_t { Line = 0, Quadratic = 1, Cubic = 2, Arc = 3 };

// A primitive curve over t in [0,1]. Every segment carries its own start point,
// so it can be evaluated without looking at its neighbours.
struct CurveSegment {
    SegmentKind kind{SegmentKind::Line};
    // For Line: p0, p1
    // For Quadratic: p0, c1, p1
    // For Cubic: p0, c1, c2, p1
    // For Arc: center, radius (rx,ry), rotation, startAngle, sweepAngle (signed, radians)
    Point2 p0{};
    Point2 c1{};
    Point2 c2{};
    Point2 p1{};
    Point2 center{};
    Point2 radius{};
    double rotation{0.0};
    double startAngle{0.0};
    double sweepAngle{0.0};

    static CurveSegment line(Point2 from, Point2 to) noexcept {
        CurveSegment s;
        s.kind = SegmentKind::Line;
        s.p0 = from;
        s.p1 = to;
        return s;
    }
    static CurveSegment quadratic(Point2 from, Point2 control, Point2 to) noexcept {
        CurveSegment s;
        s.kind = SegmentKind::Quadratic;
        s.p0 = from;
        s.c1 = control;
        s.p1 = to;
        return s;
    }
    static CurveSegment cubic(Point2 from, Point2 control1, Point2 control2, Point2 to) noexcept {
        CurveSegment s;
        s.kind = SegmentKind::Cubic;
        s.p0 = from;
        s.c1 = control1;
        s.c2 = control2;
        s.p1 = to;
        return s;
    }
    static CurveSegment arc(Point2 arcCenter, Point2 arcRadius, double arcRotation, double arcStartAngle, double arcSweepAngle) noexcept {
        CurveSegment s;
        s.kind = SegmentKind::Arc;
        s.center = arcCenter;
        s.radius = arcRadius;
        s.rotation = arcRotation;
        s.startAngle = arcStartAngle;
        s.sweepAngle = arcSweepAngle;
        return s;
    }

    Point2 evaluate(double t) const noexcept;
    Point2 startPoint() const noexcept { return evaluate(0.0); }
    Point2 endPoint() const noexcept { return evaluate(1.0); }
};

// Converts an SVG endpoint-parameterized elliptical arc into a center-parameterized
// segment. Radii that are too small are scaled up until the endpoints fit; a zero
// radius degrades to a straight line.
CurveSegment arcFromEndpoints(Point2 from, Point2 to, Point2 radius, double rotation, bool largeArc, bool sweep) noexcept;

} // namespace polyflat::geom

#endif // POLYFLAT_GEOM_CURVE_SEGMENT_H
