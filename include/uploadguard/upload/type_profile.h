#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "uploadguard/core/result.h"
#include "uploadguard/upload/category.h"

namespace uploadguard::upload {

inline constexpr std::uint64_t kMiB = 1024ull * 1024ull;

/// @brief Upload policy for one category: what may be uploaded, how big, and where it lands.
struct TypeProfile {
    UploadCategory category{UploadCategory::kImage};
    /// Lower-case, dot-prefixed (".jpg").
    std::set<std::string> allowed_extensions;
    std::set<std::string> allowed_mime_types;
    std::uint64_t max_bytes{0};
    /// Sub-directory of the uploads root ("images").
    std::string directory_name;
    /// uploads_root / directory_name.
    std::string destination_dir;

    bool AllowsExtension(const std::string& extension) const;
    bool AllowsMimeType(const std::string& mime_type) const;
};

/// @brief Immutable category -> profile table, built once at startup and shared read-only.
class TypeProfileRegistry {
public:
    TypeProfileRegistry(std::string uploads_root, std::string staging_dir);

    /// @brief Total over UploadCategory.
    const TypeProfile& ProfileFor(UploadCategory category) const;
    /// @brief Lookup by category name; unknown names are kUnsupportedCategory.
    core::Result<TypeProfile> ProfileFor(const std::string& category_name) const;

    const std::vector<TypeProfile>& profiles() const { return profiles_; }
    const std::string& uploads_root() const { return uploads_root_; }
    const std::string& staging_dir() const { return staging_dir_; }

    /// @brief Creates the staging directory and every category directory.
    core::Result<void> EnsureDirectories() const;

private:
    std::string uploads_root_;
    std::string staging_dir_;
    std::vector<TypeProfile> profiles_;
};

}  // namespace uploadguard::upload
