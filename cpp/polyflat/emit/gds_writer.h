#ifndef POLYFLAT_EMIT_GDS_WRITER_H
#define POLYFLAT_EMIT_GDS_WRITER_H

#include "polyflat/core/types.h"
#include "polyflat/emit/polygon_sink.h"

#include <cstdint>
#include <string>
#include <vector>

namespace polyflat::emit {

struct GdsTimestamp {
    std::int16_t year{1970};
    std::int16_t month{1};
    std::int16_t day{1};
    std::int16_t hour{0};
    std::int16_t minute{0};
    std::int16_t second{0};
};

struct GdsOptions {
    std::string libraryName{"POLYFLAT"};
    std::string cellName{"TOP"};
    double userUnitMeters{1e-6};     // coordinates handed to the sink are in user units
    double precisionMeters{1e-9};    // database unit
    std::int16_t dataType{0};
    GdsTimestamp timestamp{};        // fixed so identical input gives identical bytes
};

// GDSII 8-byte real: sign bit, excess-64 base-16 exponent, 56-bit mantissa.
std::uint64_t encodeGdsReal(double value) noexcept;
double decodeGdsReal(std::uint64_t bits) noexcept;

// Builds a single-cell GDSII stream in memory, one BOUNDARY per polygon.
// Outlines with more vertices than one XY record holds are split into a fan
// of BOUNDARY elements sharing the first vertex.
// Construction throws std::runtime_error for unusable options.
class GdsStreamWriter : public PolygonSink {
public:
    explicit GdsStreamWriter(GdsOptions options = {});

    ConvertError emitPolygon(const std::vector<Point2>& points, std::int32_t layer) override;

    // Closes the cell and library and hands over the stream. Further polygons
    // are rejected with InvalidSinkState.
    std::vector<std::uint8_t> finish();

    std::size_t boundaryCount() const noexcept { return boundaryCount_; }
    // Polygons accepted with Ok but not written (fewer than 3 distinct vertices).
    std::size_t skippedCount() const noexcept { return skippedCount_; }
    bool finished() const noexcept { return finished_; }

private:
    void writeHeader();
    void writeBoundary(std::int16_t layer, const std::vector<std::int32_t>& xy);

    GdsOptions options_;
    double dbPerUserUnit_{1000.0};
    std::vector<std::uint8_t> bytes_;
    std::vector<std::int32_t> xy_;
    std::vector<std::int32_t> piece_;
    std::size_t boundaryCount_{0};
    std::size_t skippedCount_{0};
    bool finished_{false};
};

} // namespace polyflat::emit

#endif // POLYFLAT_EMIT_GDS_WRITER_H
