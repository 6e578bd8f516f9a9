#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "uploadguard/upload/type_profile.h"

namespace uploadguard::upload {

struct RetentionPolicy {
    std::int64_t max_age_seconds{7 * 24 * 60 * 60};
    /// Floor that keeps the sweeper away from files that may still be in flight.
    std::int64_t min_age_seconds{60 * 60};

    std::int64_t EffectiveAgeSeconds() const;
};

struct SweepReport {
    /// False when another sweep was already running and this one was skipped.
    bool ran{false};
    std::size_t directories{0};
    std::size_t scanned{0};
    std::size_t deleted{0};
    std::size_t failed{0};
};

/// @brief Deletes stored and staged files older than the retention window.
///
/// Per-file failures are logged and counted; a sweep never fails as a whole.
class RetentionSweeper {
public:
    RetentionSweeper(std::shared_ptr<const TypeProfileRegistry> registry, RetentionPolicy policy);

    SweepReport SweepOnce();
    SweepReport SweepOnce(std::filesystem::file_time_type now);

    const RetentionPolicy& policy() const { return policy_; }

private:
    void SweepEntry(const std::filesystem::directory_entry& entry,
                    std::filesystem::file_time_type cutoff, SweepReport& report);
    void SweepDirectory(const std::filesystem::path& directory,
                        std::filesystem::file_time_type cutoff, SweepReport& report);

    std::shared_ptr<const TypeProfileRegistry> registry_;
    RetentionPolicy policy_;
    std::atomic<bool> running_{false};
};

}  // namespace uploadguard::upload
