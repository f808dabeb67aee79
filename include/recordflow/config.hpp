#pragma once

#include <cstddef>
#include <cstdint>
#include <cerrno>
#include <cstdlib>

#ifndef RECORDFLOW_HAS_ZSTD
#define RECORDFLOW_HAS_ZSTD 1
#endif

namespace recordflow {

/// Read-ahead buffer used when a dataset is not given an explicit size.
inline constexpr std::size_t kDefaultBufferSize = 256 * 1024;

/// Largest framed payload accepted before the length field is deemed corrupt.
inline constexpr std::uint64_t kDefaultMaxRecordBytes = std::uint64_t{1} << 30;

/// Positive integer value of environment variable \p name, or \p fallback
/// when it is unset, empty, negative, zero, out of range or not a number.
inline std::int64_t positive_env_value(const char* name, std::int64_t fallback) {
    const char* env = std::getenv(name);
    if (!env || *env == '\0')
        return fallback;
    char* end = nullptr;
    errno = 0;
    long long val = std::strtoll(env, &end, 10);
    if (errno == ERANGE || end == env || *end != '\0' || val <= 0)
        return fallback;
    return static_cast<std::int64_t>(val);
}

inline std::size_t default_buffer_size() {
    return static_cast<std::size_t>(positive_env_value(
        "RECORDFLOW_READ_BUFFER_SIZE", static_cast<std::int64_t>(kDefaultBufferSize)));
}

inline std::uint64_t max_record_bytes() {
    return static_cast<std::uint64_t>(positive_env_value(
        "RECORDFLOW_MAX_RECORD_BYTES", static_cast<std::int64_t>(kDefaultMaxRecordBytes)));
}

inline constexpr bool zstd_available() {
#if RECORDFLOW_HAS_ZSTD
    return true;
#else
    return false;
#endif
}

} // namespace recordflow
