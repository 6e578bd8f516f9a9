#pragma once

#include <array>
#include <string>

#include "uploadguard/core/result.h"

namespace uploadguard::upload {

/// @brief The fixed kinds of user-submitted media.
enum class UploadCategory {
    kImage,
    kAvatar,
    kCoverPhoto,
    kDocument,
    kVoice,
    kVideo,
};

inline constexpr std::array<UploadCategory, 6> kAllCategories = {
    UploadCategory::kImage,    UploadCategory::kAvatar, UploadCategory::kCoverPhoto,
    UploadCategory::kDocument, UploadCategory::kVoice,  UploadCategory::kVideo,
};

/// @brief "image", "avatar", "cover_photo", "document", "voice" or "video".
const char* CategoryName(UploadCategory category);

/// @brief Inverse of CategoryName; anything else is kUnsupportedCategory.
core::Result<UploadCategory> ParseCategory(const std::string& name);

}  // namespace uploadguard::upload
