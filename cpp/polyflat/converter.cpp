#include "polyflat/converter.h"
#include "polyflat/core/logging.h"
#include "polyflat/flatten/fixed_flattener.h"
#include "polyflat/flatten/path_assembler.h"

#include <cmath>
#include <utility>

namespace polyflat {

ConvertError parseFlattenMethod(std::string_view name, FlattenMethod& out) noexcept {
    if (name == "fixed") {
        out = FlattenMethod::Fixed;
        return ConvertError::Ok;
    }
    if (name == "adaptive") {
        out = FlattenMethod::Adaptive;
        return ConvertError::Ok;
    }
    return ConvertError::UnknownMethod;
}

ConvertError validateOptions(const ConvertOptions& options) noexcept {
    switch (options.method) {
        case FlattenMethod::Fixed:
            if (options.steps <= 0) return ConvertError::InvalidStepCount;
            break;
        case FlattenMethod::Adaptive:
            if (!(options.maxError > 0.0) || !std::isfinite(options.maxError)) return ConvertError::InvalidMaxError;
            if (options.limits.maxDepth == 0 || options.limits.maxPoints < 2) return ConvertError::InvalidSubdivisionLimit;
            break;
        default:
            return ConvertError::UnknownMethod;
    }
    if (options.targetWidth) {
        const double w = *options.targetWidth;
        if (!(w > 0.0) || !std::isfinite(w)) return ConvertError::InvalidTargetWidth;
    }
    return ConvertError::Ok;
}

ConvertError flattenPaths(const std::vector<geom::Path>& paths, const ConvertOptions& options, std::vector<geom::Polygon>& out) {
    out.clear();
    const ConvertError valid = validateOptions(options);
    if (valid != ConvertError::Ok) return valid;

    out.reserve(paths.size());
    std::vector<std::vector<Point2>> perSegment;
    flatten::PathAssembler assembler;

    for (const geom::Path& path : paths) {
        ConvertError err = ConvertError::Ok;
        if (options.method == FlattenMethod::Fixed) {
            err = flatten::flattenPathFixed(path, options.steps, perSegment);
        } else {
            err = flatten::flattenPathAdaptive(path, options.maxError, options.limits, perSegment);
        }
        if (err != ConvertError::Ok) {
            POLYFLAT_LOG_WARN("flattening path %u failed: %s", path.id, errorMessage(err));
            out.clear();
            return err;
        }

        for (const auto& pts : perSegment) assembler.append(pts);
        geom::Polygon poly = assembler.finish(options.layer, path.id, path.closed);
        if (poly.points.empty()) continue;
        out.push_back(std::move(poly));
    }
    return ConvertError::Ok;
}

ConvertResult convertPaths(const std::vector<geom::Path>& paths, const ConvertOptions& options, emit::PolygonSink& sink) {
    ConvertResult result;

    std::vector<geom::Polygon> polygons;
    result.error = flattenPaths(paths, options, polygons);
    if (result.error != ConvertError::Ok) return result;

    // Barrier: the scale is global, so the box must cover every polygon first.
    if (!xform::computeBounds(polygons, result.bounds)) {
        POLYFLAT_LOG_WARN("no geometry in %zu paths; nothing to emit", paths.size());
        return result;
    }
    result.hasGeometry = true;

    result.transform = xform::deriveTransform(result.bounds, options.targetWidth, options.flipY);
    xform::applyTransform(result.transform, polygons);

    for (const geom::Polygon& poly : polygons) {
        const ConvertError err = sink.emitPolygon(poly.points, poly.layer);
        if (err != ConvertError::Ok) {
            POLYFLAT_LOG_WARN("sink refused polygon from path %u: %s", poly.pathId, errorMessage(err));
            result.error = err;
            return result;
        }
        result.polygonCount++;
        result.pointCount += poly.points.size();
    }

    POLYFLAT_LOG_DEBUG("converted %zu polygons (%zu points), scale %g", result.polygonCount, result.pointCount, result.transform.scale);
    return result;
}

} // namespace polyflat
