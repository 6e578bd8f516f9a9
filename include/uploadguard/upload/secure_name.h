#pragma once

#include <cstddef>
#include <string>

#include "uploadguard/core/result.h"

namespace uploadguard::upload {

/// Random bytes per generated name (rendered as 32 hex characters).
inline constexpr std::size_t kSecureNameRandomBytes = 16;

/// @brief Storage name `<unix-millis>_<32 hex>.<ext>`; only the lower-cased
/// extension of `original_name` survives.
core::Result<std::string> GenerateSecureName(const std::string& original_name);

}  // namespace uploadguard::upload
