#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "uploadguard/core/result.h"
#include "uploadguard/upload/category.h"
#include "uploadguard/upload/type_profile.h"

namespace uploadguard::upload {

/// Room for one part's boundary line and headers in a multipart/form-data body.
inline constexpr std::uint64_t kMultipartPartOverheadBytes = 16 * 1024;

/// @brief Named upload entry point: which category, which form field, one file or many.
struct UploadPreset {
    std::string name;
    UploadCategory category{UploadCategory::kImage};
    std::string field_name;
    bool multiple{false};
};

const std::vector<UploadPreset>& DefaultPresets();
/// @brief Unknown preset names are kNotFound.
core::Result<UploadPreset> FindPreset(const std::string& name);
/// @brief 1 for single-file presets, otherwise the configured per-request cap.
std::size_t MaxFilesFor(const UploadPreset& preset, std::size_t max_files_per_request);
/// @brief Largest multipart body that can still hold an acceptable request for `preset`:
/// MaxFilesFor() parts of at most `profile.max_bytes`, plus framing. Anything larger can be
/// refused before its body is read.
std::uint64_t MultipartBodyLimit(const UploadPreset& preset, const TypeProfile& profile,
                                 std::size_t max_files_per_request);

}  // namespace uploadguard::upload
