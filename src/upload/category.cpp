#include "uploadguard/upload/category.h"

namespace uploadguard::upload {

const char* CategoryName(UploadCategory category) {
    switch (category) {
        case UploadCategory::kImage:
            return "image";
        case UploadCategory::kAvatar:
            return "avatar";
        case UploadCategory::kCoverPhoto:
            return "cover_photo";
        case UploadCategory::kDocument:
            return "document";
        case UploadCategory::kVoice:
            return "voice";
        case UploadCategory::kVideo:
            return "video";
    }
    return "unknown";
}

core::Result<UploadCategory> ParseCategory(const std::string& name) {
    for (const auto category : kAllCategories) {
        if (name == CategoryName(category)) {
            return category;
        }
    }
    return core::Error{core::ErrorCode::kUnsupportedCategory,
                       "Unsupported file type: " + name};
}

}  // namespace uploadguard::upload
