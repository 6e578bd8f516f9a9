#pragma once

#include <cstdint>
#include <string>

namespace uploadguard::core {

/// @brief Returns the current time formatted as ISO8601 UTC.
std::string NowIso8601();
/// @brief Milliseconds since the Unix epoch.
std::int64_t NowUnixMillis();

}  // namespace uploadguard::core
