#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace uploadguard::upload {

/// Bytes at the start of a file that the scanner looks at.
inline constexpr std::size_t kScanWindowBytes = 1024;

/// @brief Heuristic check for script or markup injected into an uploaded file.
///
/// Only the first kScanWindowBytes are read, as text, and tested case-insensitively for
/// `<script>...</script>` blocks, `javascript:` / `vbscript:` URIs and `onload=` /
/// `onerror=` handler attributes. Obfuscated or split payloads are not detected; this is
/// a filter layered on top of the signature check, not a sandbox.
bool LooksMalicious(const std::vector<unsigned char>& leading_bytes);

/// @brief Same as above for text input (used by tests and callers holding strings).
bool LooksMalicious(const std::string& leading_text);

}  // namespace uploadguard::upload
