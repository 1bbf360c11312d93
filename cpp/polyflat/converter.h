#ifndef POLYFLAT_CONVERTER_H
#define POLYFLAT_CONVERTER_H

#include "polyflat/core/types.h"
#include "polyflat/emit/polygon_sink.h"
#include "polyflat/flatten/adaptive_flattener.h"
#include "polyflat/geom/path.h"
#include "polyflat/geom/polygon.h"
#include "polyflat/xform/bounds.h"
#include "polyflat/xform/transform.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace polyflat {

enum class FlattenMethod : std::uint8_t { Fixed = 0, Adaptive = 1 };

struct ConvertOptions {
    FlattenMethod method{FlattenMethod::Fixed};
    int steps{1000};                     // samples per segment, Fixed only
    double maxError{0.01};               // chord tolerance, Adaptive only
    std::optional<double> targetWidth;   // output width of the combined bounding box; unset = no scaling
    bool flipY{true};
    std::int32_t layer{0};
    flatten::AdaptiveLimits limits{};
};

struct ConvertResult {
    ConvertError error{ConvertError::Ok};
    bool hasGeometry{false};             // false: nothing to emit, not a failure
    // Polygons and points handed to the sink; a sink may still skip some
    // (see GdsStreamWriter::skippedCount).
    std::size_t polygonCount{0};
    std::size_t pointCount{0};
    xform::BoundingBox bounds{};         // before transform; valid when hasGeometry
    xform::TransformParams transform{};

    bool ok() const noexcept { return error == ConvertError::Ok; }
};

// Accepts "fixed" and "adaptive".
ConvertError parseFlattenMethod(std::string_view name, FlattenMethod& out) noexcept;

// Checks every option the selected method reads, plus the shared ones.
ConvertError validateOptions(const ConvertOptions& options) noexcept;

// Flattens and assembles every path in input order. Paths that contribute no
// points are skipped. Polygons carry options.layer.
ConvertError flattenPaths(const std::vector<geom::Path>& paths, const ConvertOptions& options, std::vector<geom::Polygon>& out);

// Full run: validate, flatten, aggregate bounds over all polygons, derive the
// transform, apply it and emit in input order. Nothing reaches the sink when
// validation or flattening fails.
ConvertResult convertPaths(const std::vector<geom::Path>& paths, const ConvertOptions& options, emit::PolygonSink& sink);

} // namespace polyflat

#endif // POLYFLAT_CONVERTER_H
