#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace uploadguard::upload {

/// @brief Magic number expected at `offset` for files declared as `mime_type`.
struct MagicSignature {
    std::string mime_type;
    std::size_t offset{0};
    std::vector<unsigned char> bytes;
};

/// @brief The fixed signature table.
const std::vector<MagicSignature>& SignatureTable();

/// @brief True if `mime_type` has an entry in the signature table.
bool HasSignature(const std::string& mime_type);

/// @brief Checks the leading bytes of a file against the signature for its declared type.
///
/// Declared types without a table entry pass unchecked (audio/wav, video/webm and most
/// document types have no entry). A mapped type needs every signature byte to match at
/// its offset; input too short to hold the signature is a mismatch.
bool MatchesSignature(const std::vector<unsigned char>& leading_bytes,
                      const std::string& declared_mime_type);

}  // namespace uploadguard::upload
