#ifndef POLYFLAT_CORE_UTIL_H
#define POLYFLAT_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <vector>

// Big-endian writers for stream formats (GDSII is big-endian throughout).

static inline void appendU8(std::vector<std::uint8_t>& out, std::uint8_t v) {
    out.push_back(v);
}

static inline void appendU16BE(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

static inline void appendU32BE(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

static inline void appendU64BE(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
    }
}

static inline std::uint16_t readU16BE(const std::uint8_t* src, std::size_t offset) noexcept {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(src[offset]) << 8) | src[offset + 1]);
}

static inline std::uint32_t readU32BE(const std::uint8_t* src, std::size_t offset) noexcept {
    return (static_cast<std::uint32_t>(src[offset]) << 24)
        | (static_cast<std::uint32_t>(src[offset + 1]) << 16)
        | (static_cast<std::uint32_t>(src[offset + 2]) << 8)
        | static_cast<std::uint32_t>(src[offset + 3]);
}

static inline std::uint64_t readU64BE(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        v = (v << 8) | static_cast<std::uint64_t>(src[offset + i]);
    }
    return v;
}

#endif // POLYFLAT_CORE_UTIL_H
