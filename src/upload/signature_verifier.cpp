#include "uploadguard/upload/signature_verifier.h"

namespace uploadguard::upload {

namespace {

const MagicSignature* FindSignature(const std::string& mime_type) {
    for (const auto& signature : SignatureTable()) {
        if (signature.mime_type == mime_type) {
            return &signature;
        }
    }
    return nullptr;
}

}  // namespace

const std::vector<MagicSignature>& SignatureTable() {
    static const std::vector<MagicSignature> kTable = {
        {"image/jpeg", 0, {0xFF, 0xD8, 0xFF}},
        {"image/png", 0, {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}},
        {"image/gif", 0, {0x47, 0x49, 0x46, 0x38}},       // GIF8
        {"image/webp", 0, {0x52, 0x49, 0x46, 0x46}},      // RIFF
        {"application/pdf", 0, {0x25, 0x50, 0x44, 0x46}}, // %PDF
        {"audio/mpeg", 0, {0xFF, 0xFB}},                  // MPEG-1 layer III frame sync
        // ISO base media: 4-byte box size, then the ftyp box type.
        {"video/mp4", 4, {0x66, 0x74, 0x79, 0x70}},
    };
    return kTable;
}

bool HasSignature(const std::string& mime_type) {
    return FindSignature(mime_type) != nullptr;
}

bool MatchesSignature(const std::vector<unsigned char>& leading_bytes,
                      const std::string& declared_mime_type) {
    const auto* signature = FindSignature(declared_mime_type);
    if (!signature) {
        return true;
    }
    if (leading_bytes.size() < signature->offset + signature->bytes.size()) {
        return false;
    }
    for (std::size_t i = 0; i < signature->bytes.size(); ++i) {
        if (leading_bytes[signature->offset + i] != signature->bytes[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace uploadguard::upload
