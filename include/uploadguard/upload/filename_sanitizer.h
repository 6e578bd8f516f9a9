#pragma once

#include <string>

namespace uploadguard::upload {

/// @brief Rejects control characters, path separators, `:"*?|<>`, "." / "..",
/// over-long names and reserved device names (CON, PRN, AUX, NUL, COM1-9, LPT1-9).
bool IsSafeFilename(const std::string& filename);

/// @brief Final extension, lower-cased and dot-prefixed; empty for "name" or ".hidden".
std::string ExtensionOf(const std::string& filename);

/// @brief Filename without its final extension.
std::string StemOf(const std::string& filename);

}  // namespace uploadguard::upload
