#pragma once

#include <cstddef>
#include <cstdint>

namespace polyflat::emit::gds::detail {

// Record type in the high byte, data type in the low byte.
constexpr std::uint16_t recordTag(std::uint8_t recordType, std::uint8_t dataType) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(recordType) << 8) | dataType);
}

constexpr std::uint8_t DT_NONE = 0x00;
constexpr std::uint8_t DT_INT16 = 0x02;
constexpr std::uint8_t DT_INT32 = 0x03;
constexpr std::uint8_t DT_REAL8 = 0x05;
constexpr std::uint8_t DT_ASCII = 0x06;

constexpr std::uint16_t REC_HEADER = recordTag(0x00, DT_INT16);
constexpr std::uint16_t REC_BGNLIB = recordTag(0x01, DT_INT16);
constexpr std::uint16_t REC_LIBNAME = recordTag(0x02, DT_ASCII);
constexpr std::uint16_t REC_UNITS = recordTag(0x03, DT_REAL8);
constexpr std::uint16_t REC_ENDLIB = recordTag(0x04, DT_NONE);
constexpr std::uint16_t REC_BGNSTR = recordTag(0x05, DT_INT16);
constexpr std::uint16_t REC_STRNAME = recordTag(0x06, DT_ASCII);
constexpr std::uint16_t REC_ENDSTR = recordTag(0x07, DT_NONE);
constexpr std::uint16_t REC_BOUNDARY = recordTag(0x08, DT_NONE);
constexpr std::uint16_t REC_LAYER = recordTag(0x0D, DT_INT16);
constexpr std::uint16_t REC_DATATYPE = recordTag(0x0E, DT_INT16);
constexpr std::uint16_t REC_XY = recordTag(0x10, DT_INT32);
constexpr std::uint16_t REC_ENDEL = recordTag(0x11, DT_NONE);

constexpr std::int16_t streamVersion = 600;
constexpr std::size_t recordHeaderBytes = 4;
constexpr std::size_t maxRecordBytes = 0xFFFF;
// XY holds the closing vertex as well, hence one less than what fits.
constexpr std::size_t maxBoundaryVertices = (maxRecordBytes - recordHeaderBytes) / 8 - 1;
// Longest LIBNAME/STRNAME whose even-padded record length still fits.
constexpr std::size_t maxNameBytes = ((maxRecordBytes - recordHeaderBytes) & ~std::size_t{1});

} // namespace polyflat::emit::gds::detail
