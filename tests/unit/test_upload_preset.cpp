#include <gtest/gtest.h>

#include "uploadguard/upload/type_profile.h"
#include "uploadguard/upload/upload_preset.h"

using uploadguard::core::ErrorCode;
using uploadguard::upload::FindPreset;
using uploadguard::upload::kMiB;
using uploadguard::upload::kMultipartPartOverheadBytes;
using uploadguard::upload::MaxFilesFor;
using uploadguard::upload::MultipartBodyLimit;
using uploadguard::upload::TypeProfileRegistry;
using uploadguard::upload::UploadCategory;

TEST(UploadPreset, DefaultsCoverEveryEntryPoint) {
    EXPECT_EQ(uploadguard::upload::DefaultPresets().size(), 8u);
}

TEST(UploadPreset, SingleImageUsesFileField) {
    auto preset = FindPreset("image");
    ASSERT_TRUE(preset.ok());
    EXPECT_EQ(preset.value().category, UploadCategory::kImage);
    EXPECT_EQ(preset.value().field_name, "file");
    EXPECT_FALSE(preset.value().multiple);
    EXPECT_EQ(MaxFilesFor(preset.value(), 10), 1u);
}

TEST(UploadPreset, MultipleDocumentsUseConfiguredCap) {
    auto preset = FindPreset("documents");
    ASSERT_TRUE(preset.ok());
    EXPECT_EQ(preset.value().category, UploadCategory::kDocument);
    EXPECT_EQ(preset.value().field_name, "documents");
    EXPECT_TRUE(preset.value().multiple);
    EXPECT_EQ(MaxFilesFor(preset.value(), 10), 10u);
}

TEST(UploadPreset, CoverPhotoMapsToItsCategory) {
    auto preset = FindPreset("cover_photo");
    ASSERT_TRUE(preset.ok());
    EXPECT_EQ(preset.value().category, UploadCategory::kCoverPhoto);
    EXPECT_EQ(preset.value().field_name, "cover_photo");
}

TEST(UploadPreset, UnknownPresetIsNotFound) {
    auto preset = FindPreset("executables");
    ASSERT_FALSE(preset.ok());
    EXPECT_EQ(preset.code(), ErrorCode::kNotFound);
}

TEST(UploadPreset, MultipartLimitFollowsTheCategoryCeiling) {
    const TypeProfileRegistry registry("uploads", "uploads/tmp");

    auto avatar = FindPreset("avatar");
    ASSERT_TRUE(avatar.ok());
    const auto& avatar_profile = registry.ProfileFor(UploadCategory::kAvatar);
    EXPECT_EQ(MultipartBodyLimit(avatar.value(), avatar_profile, 10),
              5 * kMiB + 2 * kMultipartPartOverheadBytes);
    // A 200MB avatar can never be accepted, so its body is never worth reading.
    EXPECT_LT(MultipartBodyLimit(avatar.value(), avatar_profile, 10), 200ull * 1000 * 1000);

    auto images = FindPreset("images");
    ASSERT_TRUE(images.ok());
    EXPECT_EQ(MultipartBodyLimit(images.value(), registry.ProfileFor(UploadCategory::kImage), 3),
              3 * (10 * kMiB + kMultipartPartOverheadBytes) + kMultipartPartOverheadBytes);
}
