#pragma once

#include <cstddef>
#include <string>

#include "uploadguard/core/result.h"

namespace uploadguard::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();

/// @brief Lower-case hex encoding of `byte_count` bytes from the OpenSSL CSPRNG.
Result<std::string> RandomHex(std::size_t byte_count);

}  // namespace uploadguard::core
