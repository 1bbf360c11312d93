#ifndef POLYFLAT_CORE_TYPES_H
#define POLYFLAT_CORE_TYPES_H

#include <cmath>
#include <cstdint>
#include <cstddef>

namespace polyflat {

// Absolute tolerance used to detect a shared vertex between consecutive segments.
static constexpr double kJoinTolerance = 1e-12;

struct Point2 {
    double x{0.0};
    double y{0.0};
};

inline bool operator==(const Point2& a, const Point2& b) noexcept { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) noexcept { return !(a == b); }

inline bool nearlyEqual(const Point2& a, const Point2& b, double tol) noexcept {
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol;
}

inline Point2 sub(const Point2& a, const Point2& b) noexcept { return Point2{a.x - b.x, a.y - b.y}; }
inline Point2 add(const Point2& a, const Point2& b) noexcept { return Point2{a.x + b.x, a.y + b.y}; }
inline Point2 mul(const Point2& a, double s) noexcept { return Point2{a.x * s, a.y * s}; }

inline double dot(const Point2& a, const Point2& b) noexcept { return a.x * b.x + a.y * b.y; }
inline double cross(const Point2& a, const Point2& b) noexcept { return a.x * b.y - a.y * b.x; }
inline double len(const Point2& v) noexcept { return std::sqrt(dot(v, v)); }

enum class ConvertError : std::uint32_t {
    Ok = 0,
    InvalidStepCount = 1,
    InvalidMaxError = 2,
    InvalidTargetWidth = 3,
    InvalidSubdivisionLimit = 4,
    UnknownMethod = 5,
    SubdivisionLimitExceeded = 6,
    PolygonTooLarge = 7,
    CoordinateOverflow = 8,
    InvalidSinkState = 9,
};

const char* errorMessage(ConvertError error) noexcept;

} // namespace polyflat

#endif // POLYFLAT_CORE_TYPES_H
