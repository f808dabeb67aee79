#pragma once

#define RECORDFLOW_VERSION_MAJOR 0
#define RECORDFLOW_VERSION_MINOR 3
#define RECORDFLOW_VERSION_PATCH 0

namespace recordflow {

inline constexpr int version() {
    return RECORDFLOW_VERSION_MAJOR * 10000 + RECORDFLOW_VERSION_MINOR * 100 +
           RECORDFLOW_VERSION_PATCH;
}

inline const char* version_string() { return "0.3.0"; }

} // namespace recordflow
