#pragma once

#include <cstdint>
#include <string>

// Little-endian fixed width integers as stored in framed record headers.

namespace recordflow {

inline void put_fixed32(std::string* dst, std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
        dst->push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
}

inline void put_fixed64(std::string* dst, std::uint64_t v) {
    for (int i = 0; i < 8; ++i)
        dst->push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
}

inline std::uint32_t decode_fixed32(const char* p) {
    const auto* b = reinterpret_cast<const unsigned char*>(p);
    return static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8) |
           (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24);
}

inline std::uint64_t decode_fixed64(const char* p) {
    std::uint64_t lo = decode_fixed32(p);
    std::uint64_t hi = decode_fixed32(p + 4);
    return lo | (hi << 32);
}

} // namespace recordflow
