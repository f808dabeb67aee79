#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// CRC-32C (Castagnoli) as used to protect framed records. Portable table
// driven implementation, one byte per step.

namespace recordflow {
namespace crc32c {

inline constexpr std::uint32_t kPolynomial = 0x82F63B78u; // reflected 0x1EDC6F41
inline constexpr std::uint32_t kMaskDelta = 0xa282ead8u;

inline const std::array<std::uint32_t, 256>& table() {
    static const std::array<std::uint32_t, 256> t = [] {
        std::array<std::uint32_t, 256> out{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k)
                c = (c & 1) ? (c >> 1) ^ kPolynomial : c >> 1;
            out[i] = c;
        }
        return out;
    }();
    return t;
}

/// Return the crc of data[0,n-1] appended to a crc of earlier data.
inline std::uint32_t extend(std::uint32_t crc, const char* data, std::size_t n) {
    const auto& t = table();
    const auto* p = reinterpret_cast<const unsigned char*>(data);
    std::uint32_t c = crc ^ 0xFFFFFFFFu;
    for (std::size_t i = 0; i < n; ++i)
        c = t[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    return c ^ 0xFFFFFFFFu;
}

inline std::uint32_t value(const char* data, std::size_t n) { return extend(0, data, n); }

/// Masked representation stored on disk. Computing the crc of a string that
/// itself contains embedded crcs is problematic, hence the rotation.
inline std::uint32_t mask(std::uint32_t crc) { return ((crc >> 15) | (crc << 17)) + kMaskDelta; }

inline std::uint32_t unmask(std::uint32_t masked) {
    std::uint32_t rot = masked - kMaskDelta;
    return (rot >> 17) | (rot << 15);
}

} // namespace crc32c
} // namespace recordflow
