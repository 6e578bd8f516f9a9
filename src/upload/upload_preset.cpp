#include "uploadguard/upload/upload_preset.h"

namespace uploadguard::upload {

const std::vector<UploadPreset>& DefaultPresets() {
    static const std::vector<UploadPreset> kPresets = {
        {"image", UploadCategory::kImage, "file", false},
        {"images", UploadCategory::kImage, "images", true},
        {"avatar", UploadCategory::kAvatar, "avatar", false},
        {"cover_photo", UploadCategory::kCoverPhoto, "cover_photo", false},
        {"document", UploadCategory::kDocument, "file", false},
        {"documents", UploadCategory::kDocument, "documents", true},
        {"voice", UploadCategory::kVoice, "voice", false},
        {"video", UploadCategory::kVideo, "video", false},
    };
    return kPresets;
}

core::Result<UploadPreset> FindPreset(const std::string& name) {
    for (const auto& preset : DefaultPresets()) {
        if (preset.name == name) {
            return preset;
        }
    }
    return core::Error{core::ErrorCode::kNotFound, "unknown upload preset: " + name};
}

std::size_t MaxFilesFor(const UploadPreset& preset, std::size_t max_files_per_request) {
    return preset.multiple ? max_files_per_request : 1;
}

std::uint64_t MultipartBodyLimit(const UploadPreset& preset, const TypeProfile& profile,
                                 std::size_t max_files_per_request) {
    const auto files = static_cast<std::uint64_t>(MaxFilesFor(preset, max_files_per_request));
    // One extra part's worth of framing covers plain form fields and the closing boundary.
    return files * (profile.max_bytes + kMultipartPartOverheadBytes) + kMultipartPartOverheadBytes;
}

}  // namespace uploadguard::upload
