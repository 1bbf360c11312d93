#include "polyflat/geom/curve_segment.h"

#include <algorithm>
#include <cmath>

namespace polyflat::geom {

namespace {

constexpr double kPi = 3.14159265358979323846;

inline Point2 rotate(const Point2& v, double cosR, double sinR) noexcept {
    return Point2{v.x * cosR - v.y * sinR, v.x * sinR + v.y * cosR};
}

// Signed angle from a to b in (-pi, pi].
inline double signedAngle(const Point2& a, const Point2& b) noexcept {
    return std::atan2(cross(a, b), dot(a, b));
}

} // namespace

Point2 CurveSegment::evaluate(double t) const noexcept {
    switch (kind) {
        case SegmentKind::Line: {
            return Point2{p0.x + (p1.x - p0.x) * t, p0.y + (p1.y - p0.y) * t};
        }
        case SegmentKind::Quadratic: {
            const double u = 1.0 - t;
            const double a = u * u;
            const double b = 2.0 * u * t;
            const double c = t * t;
            return Point2{
                a * p0.x + b * c1.x + c * p1.x,
                a * p0.y + b * c1.y + c * p1.y,
            };
        }
        case SegmentKind::Cubic: {
            const double u = 1.0 - t;
            const double a = u * u * u;
            const double b = 3.0 * u * u * t;
            const double c = 3.0 * u * t * t;
            const double d = t * t * t;
            return Point2{
                a * p0.x + b * c1.x + c * c2.x + d * p1.x,
                a * p0.y + b * c1.y + c * c2.y + d * p1.y,
            };
        }
        case SegmentKind::Arc: {
            const double angle = startAngle + sweepAngle * t;
            const Point2 local{std::cos(angle) * radius.x, std::sin(angle) * radius.y};
            const double cosR = rotation != 0.0 ? std::cos(rotation) : 1.0;
            const double sinR = rotation != 0.0 ? std::sin(rotation) : 0.0;
            return add(center, rotate(local, cosR, sinR));
        }
    }
    return p0;
}

CurveSegment arcFromEndpoints(Point2 from, Point2 to, Point2 radius, double rotation, bool largeArc, bool sweep) noexcept {
    double rx = std::abs(radius.x);
    double ry = std::abs(radius.y);
    if (rx == 0.0 || ry == 0.0) {
        return CurveSegment::line(from, to);
    }

    const double cosR = std::cos(rotation);
    const double sinR = std::sin(rotation);

    if (from == to) {
        // Zero sweep anchored at the endpoint; evaluates to `from` everywhere.
        return CurveSegment::arc(Point2{from.x - rx * cosR, from.y - rx * sinR}, Point2{rx, ry}, rotation, 0.0, 0.0);
    }

    // Midpoint in the ellipse's own frame.
    const Point2 rm = rotate(mul(sub(from, to), 0.5), cosR, -sinR);
    const double rm2x = rm.x * rm.x;
    const double rm2y = rm.y * rm.y;
    double rx2 = rx * rx;
    double ry2 = ry * ry;
    const double radiusGap = rm2x / rx2 + rm2y / ry2;
    if (radiusGap > 1.0) {
        const double k = std::sqrt(radiusGap);
        rx *= k;
        ry *= k;
        rx2 = rx * rx;
        ry2 = ry * ry;
    }

    const double dq = rx2 * rm2y + ry2 * rm2x;
    const double pq = dq > 0.0 ? (rx2 * ry2 / dq - 1.0) : 0.0;
    const double q = (largeArc == sweep ? -1.0 : 1.0) * std::sqrt(std::max(pq, 0.0));
    const Point2 rc{q * rx * rm.y / ry, -q * ry * rm.x / rx};
    const Point2 mid = mul(add(from, to), 0.5);
    const Point2 arcCenter = add(mid, rotate(rc, cosR, sinR));

    const Point2 startDir{(rm.x - rc.x) / rx, (rm.y - rc.y) / ry};
    const Point2 endDir{(-rm.x - rc.x) / rx, (-rm.y - rc.y) / ry};
    const double startAngle = signedAngle(Point2{1.0, 0.0}, startDir);
    double extent = signedAngle(startDir, endDir);
    if (!sweep && extent > 0.0) {
        extent -= 2.0 * kPi;
    } else if (sweep && extent < 0.0) {
        extent += 2.0 * kPi;
    }

    return CurveSegment::arc(arcCenter, Point2{rx, ry}, rotation, startAngle, extent);
}

} // namespace polyflat::geom
