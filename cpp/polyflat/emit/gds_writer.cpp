#include "polyflat/emit/gds_writer.h"
#include "polyflat/emit/gds_records.h"
#include "polyflat/core/logging.h"
#include "polyflat/core/util.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace polyflat::emit {
using namespace gds::detail;

namespace {

void appendRecord(std::vector<std::uint8_t>& out, std::uint16_t tag, std::size_t payloadBytes) {
    appendU16BE(out, static_cast<std::uint16_t>(recordHeaderBytes + payloadBytes));
    appendU16BE(out, tag);
}

void appendInt16Record(std::vector<std::uint8_t>& out, std::uint16_t tag, std::int16_t v) {
    appendRecord(out, tag, 2);
    appendU16BE(out, static_cast<std::uint16_t>(v));
}

void appendAsciiRecord(std::vector<std::uint8_t>& out, std::uint16_t tag, const std::string& s) {
    // ASCII payloads are padded to an even length with NUL.
    const std::size_t padded = s.size() + (s.size() % 2);
    appendRecord(out, tag, padded);
    for (char c : s) appendU8(out, static_cast<std::uint8_t>(c));
    if (padded != s.size()) appendU8(out, 0);
}

void appendTimestamps(std::vector<std::uint8_t>& out, std::uint16_t tag, const GdsTimestamp& ts) {
    // Modification time followed by access time.
    appendRecord(out, tag, 24);
    for (int i = 0; i < 2; i++) {
        appendU16BE(out, static_cast<std::uint16_t>(ts.year));
        appendU16BE(out, static_cast<std::uint16_t>(ts.month));
        appendU16BE(out, static_cast<std::uint16_t>(ts.day));
        appendU16BE(out, static_cast<std::uint16_t>(ts.hour));
        appendU16BE(out, static_cast<std::uint16_t>(ts.minute));
        appendU16BE(out, static_cast<std::uint16_t>(ts.second));
    }
}

bool toDatabaseUnits(double v, double dbPerUserUnit, std::int32_t& out) noexcept {
    const double scaled = std::round(v * dbPerUserUnit);
    if (!std::isfinite(scaled)) return false;
    if (scaled < static_cast<double>(std::numeric_limits<std::int32_t>::min())) return false;
    if (scaled > static_cast<double>(std::numeric_limits<std::int32_t>::max())) return false;
    out = static_cast<std::int32_t>(scaled);
    return true;
}

} // namespace

std::uint64_t encodeGdsReal(double value) noexcept {
    if (value == 0.0 || !std::isfinite(value)) return 0;

    std::uint64_t sign = 0;
    if (value < 0.0) {
        sign = 1ull << 63;
        value = -value;
    }

    // Normalize the mantissa into [1/16, 1).
    int exponent = 64;
    while (value >= 1.0) {
        value /= 16.0;
        exponent++;
    }
    while (value < 1.0 / 16.0) {
        value *= 16.0;
        exponent--;
    }

    std::uint64_t mantissa = static_cast<std::uint64_t>(std::llround(std::ldexp(value, 56)));
    if (mantissa >= (1ull << 56)) {
        // Rounding carried into a new hex digit.
        mantissa >>= 4;
        exponent++;
    }
    if (exponent < 0) return 0;
    if (exponent > 127) {
        exponent = 127;
        mantissa = (1ull << 56) - 1;
    }
    return sign | (static_cast<std::uint64_t>(exponent) << 56) | mantissa;
}

double decodeGdsReal(std::uint64_t bits) noexcept {
    const bool negative = (bits >> 63) != 0;
    const int exponent = static_cast<int>((bits >> 56) & 0x7F) - 64;
    const std::uint64_t mantissa = bits & ((1ull << 56) - 1);
    const double v = std::ldexp(static_cast<double>(mantissa), 4 * exponent - 56);
    return negative ? -v : v;
}

GdsStreamWriter::GdsStreamWriter(GdsOptions options) : options_(std::move(options)) {
    if (!(options_.userUnitMeters > 0.0) || !(options_.precisionMeters > 0.0)) {
        throw std::runtime_error("GDS units must be positive");
    }
    if (options_.libraryName.empty() || options_.cellName.empty()) {
        throw std::runtime_error("GDS library and cell names must not be empty");
    }
    if (options_.libraryName.size() > maxNameBytes || options_.cellName.size() > maxNameBytes) {
        throw std::runtime_error("GDS library or cell name does not fit in one record");
    }
    dbPerUserUnit_ = options_.userUnitMeters / options_.precisionMeters;
    writeHeader();
}

void GdsStreamWriter::writeHeader() {
    bytes_.reserve(256);
    appendInt16Record(bytes_, REC_HEADER, streamVersion);
    appendTimestamps(bytes_, REC_BGNLIB, options_.timestamp);
    appendAsciiRecord(bytes_, REC_LIBNAME, options_.libraryName);

    appendRecord(bytes_, REC_UNITS, 16);
    appendU64BE(bytes_, encodeGdsReal(options_.precisionMeters / options_.userUnitMeters));
    appendU64BE(bytes_, encodeGdsReal(options_.precisionMeters));

    appendTimestamps(bytes_, REC_BGNSTR, options_.timestamp);
    appendAsciiRecord(bytes_, REC_STRNAME, options_.cellName);
}

ConvertError GdsStreamWriter::emitPolygon(const std::vector<Point2>& points, std::int32_t layer) {
    if (finished_) return ConvertError::InvalidSinkState;
    if (layer < std::numeric_limits<std::int16_t>::min() || layer > std::numeric_limits<std::int16_t>::max()) {
        POLYFLAT_LOG_WARN("GDS layer %d out of range", static_cast<int>(layer));
        return ConvertError::InvalidSinkState;
    }

    std::size_t vertexCount = points.size();
    if (vertexCount >= 2 && points.front() == points.back()) vertexCount--;
    if (vertexCount < 3) {
        POLYFLAT_LOG_WARN("skipping GDS boundary with %zu vertices", vertexCount);
        skippedCount_++;
        return ConvertError::Ok;
    }

    xy_.clear();
    xy_.reserve(vertexCount * 2);
    for (std::size_t i = 0; i < vertexCount; i++) {
        std::int32_t x = 0;
        std::int32_t y = 0;
        if (!toDatabaseUnits(points[i].x, dbPerUserUnit_, x) || !toDatabaseUnits(points[i].y, dbPerUserUnit_, y)) {
            return ConvertError::CoordinateOverflow;
        }
        xy_.push_back(x);
        xy_.push_back(y);
    }

    const std::int16_t gdsLayer = static_cast<std::int16_t>(layer);
    if (vertexCount <= maxBoundaryVertices) {
        writeBoundary(gdsLayer, xy_);
        return ConvertError::Ok;
    }

    // Fan split: vertex 0 plus consecutive runs of the outline, neighbouring
    // runs sharing an end vertex so the pieces tile the fan triangles once.
    POLYFLAT_LOG_DEBUG("splitting GDS boundary with %zu vertices", vertexCount);
    std::size_t first = 1;
    while (first + 1 < vertexCount) {
        const std::size_t last = std::min(first + maxBoundaryVertices - 2, vertexCount - 1);
        piece_.clear();
        piece_.push_back(xy_[0]);
        piece_.push_back(xy_[1]);
        piece_.insert(piece_.end(), xy_.begin() + 2 * first, xy_.begin() + 2 * (last + 1));
        writeBoundary(gdsLayer, piece_);
        first = last;
    }
    return ConvertError::Ok;
}

// `xy` holds interleaved vertices without the closing repeat.
void GdsStreamWriter::writeBoundary(std::int16_t layer, const std::vector<std::int32_t>& xy) {
    appendRecord(bytes_, REC_BOUNDARY, 0);
    appendInt16Record(bytes_, REC_LAYER, layer);
    appendInt16Record(bytes_, REC_DATATYPE, options_.dataType);
    appendRecord(bytes_, REC_XY, (xy.size() + 2) * 4);
    for (std::int32_t v : xy) appendU32BE(bytes_, static_cast<std::uint32_t>(v));
    appendU32BE(bytes_, static_cast<std::uint32_t>(xy[0]));
    appendU32BE(bytes_, static_cast<std::uint32_t>(xy[1]));
    appendRecord(bytes_, REC_ENDEL, 0);
    boundaryCount_++;
}

std::vector<std::uint8_t> GdsStreamWriter::finish() {
    if (finished_) return {};
    appendRecord(bytes_, REC_ENDSTR, 0);
    appendRecord(bytes_, REC_ENDLIB, 0);
    finished_ = true;
    POLYFLAT_LOG_DEBUG("GDS stream: %zu boundaries, %zu bytes", boundaryCount_, bytes_.size());
    std::vector<std::uint8_t> out = std::move(bytes_);
    bytes_.clear();
    return out;
}

} // namespace polyflat::emit
