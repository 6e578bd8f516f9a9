#include "uploadguard/upload/type_profile.h"

#include <filesystem>
#include <stdexcept>

#include "uploadguard/storage/local_storage.h"

namespace uploadguard::upload {

namespace {

TypeProfile MakeProfile(UploadCategory category, std::set<std::string> extensions,
                        std::set<std::string> mime_types, std::uint64_t max_bytes,
                        const std::string& directory_name, const std::string& uploads_root) {
    TypeProfile profile;
    profile.category = category;
    profile.allowed_extensions = std::move(extensions);
    profile.allowed_mime_types = std::move(mime_types);
    profile.max_bytes = max_bytes;
    profile.directory_name = directory_name;
    profile.destination_dir = (std::filesystem::path(uploads_root) / directory_name).string();
    return profile;
}

}  // namespace

bool TypeProfile::AllowsExtension(const std::string& extension) const {
    return allowed_extensions.count(extension) > 0;
}

bool TypeProfile::AllowsMimeType(const std::string& mime_type) const {
    return allowed_mime_types.count(mime_type) > 0;
}

TypeProfileRegistry::TypeProfileRegistry(std::string uploads_root, std::string staging_dir)
    : uploads_root_(std::move(uploads_root)), staging_dir_(std::move(staging_dir)) {
    // Order must follow kAllCategories so ProfileFor can index directly.
    profiles_.push_back(MakeProfile(UploadCategory::kImage,
                                    {".jpg", ".jpeg", ".png", ".gif", ".webp"},
                                    {"image/jpeg", "image/png", "image/gif", "image/webp"},
                                    10 * kMiB, "images", uploads_root_));
    profiles_.push_back(MakeProfile(UploadCategory::kAvatar,
                                    {".jpg", ".jpeg", ".png", ".webp"},
                                    {"image/jpeg", "image/png", "image/webp"},
                                    5 * kMiB, "avatars", uploads_root_));
    profiles_.push_back(MakeProfile(UploadCategory::kCoverPhoto,
                                    {".jpg", ".jpeg", ".png", ".webp"},
                                    {"image/jpeg", "image/png", "image/webp"},
                                    10 * kMiB, "covers", uploads_root_));
    profiles_.push_back(MakeProfile(
        UploadCategory::kDocument, {".pdf", ".doc", ".docx", ".txt"},
        {"application/pdf", "application/msword",
         "application/vnd.openxmlformats-officedocument.wordprocessingml.document", "text/plain"},
        25 * kMiB, "documents", uploads_root_));
    profiles_.push_back(MakeProfile(UploadCategory::kVoice, {".mp3", ".wav", ".m4a", ".ogg"},
                                    {"audio/mpeg", "audio/wav", "audio/mp4", "audio/ogg"},
                                    15 * kMiB, "voice", uploads_root_));
    profiles_.push_back(MakeProfile(UploadCategory::kVideo, {".mp4", ".mov", ".avi", ".webm"},
                                    {"video/mp4", "video/quicktime", "video/x-msvideo",
                                     "video/webm"},
                                    100 * kMiB, "videos", uploads_root_));
}

const TypeProfile& TypeProfileRegistry::ProfileFor(UploadCategory category) const {
    const auto index = static_cast<std::size_t>(category);
    if (index >= profiles_.size()) {
        throw std::out_of_range("upload category out of range");
    }
    return profiles_[index];
}

core::Result<TypeProfile> TypeProfileRegistry::ProfileFor(const std::string& category_name) const {
    auto category = ParseCategory(category_name);
    if (!category.ok()) {
        return category.error();
    }
    return ProfileFor(category.value());
}

core::Result<void> TypeProfileRegistry::EnsureDirectories() const {
    auto staging = storage::EnsureDirectory(staging_dir_);
    if (!staging.ok()) {
        return staging;
    }
    for (const auto& profile : profiles_) {
        auto created = storage::EnsureDirectory(profile.destination_dir);
        if (!created.ok()) {
            return created;
        }
    }
    return core::Ok();
}

}  // namespace uploadguard::upload
