#include "uploadguard/upload/retention_sweeper.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <system_error>
#include <vector>

#include "uploadguard/core/logger.h"
#include "uploadguard/observability/metrics.h"

namespace uploadguard::upload {

namespace fs = std::filesystem;

namespace {

// Clears the running flag on every exit from a sweep, including a throwing logger.
class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunningGuard() { flag_.store(false); }

    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

}  // namespace

std::int64_t RetentionPolicy::EffectiveAgeSeconds() const {
    return std::max(max_age_seconds, min_age_seconds);
}

RetentionSweeper::RetentionSweeper(std::shared_ptr<const TypeProfileRegistry> registry,
                                   RetentionPolicy policy)
    : registry_(std::move(registry)), policy_(policy) {}

SweepReport RetentionSweeper::SweepOnce() { return SweepOnce(fs::file_time_type::clock::now()); }

SweepReport RetentionSweeper::SweepOnce(fs::file_time_type now) {
    SweepReport report;
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        core::LogWarning("Retention sweep already running, skipping");
        return report;
    }
    RunningGuard guard(running_);
    report.ran = true;

    const auto cutoff = now - std::chrono::seconds(policy_.EffectiveAgeSeconds());
    std::vector<fs::path> directories;
    for (const auto& profile : registry_->profiles()) {
        directories.emplace_back(profile.destination_dir);
    }
    directories.emplace_back(registry_->staging_dir());

    for (const auto& directory : directories) {
        SweepDirectory(directory, cutoff, report);
    }

    core::LogEvent("retention_sweep",
                   {{"directories", std::to_string(report.directories)},
                    {"scanned", std::to_string(report.scanned)},
                    {"deleted", std::to_string(report.deleted)},
                    {"failed", std::to_string(report.failed)},
                    {"max_age_seconds", std::to_string(policy_.EffectiveAgeSeconds())}});
    observability::RecordSweep(report.deleted, report.failed);
    return report;
}

void RetentionSweeper::SweepEntry(const fs::directory_entry& entry, fs::file_time_type cutoff,
                                  SweepReport& report) {
    std::error_code ec;
    // The staging directory may live inside the uploads root; nested dirs are not ours.
    if (!entry.is_regular_file(ec)) {
        return;
    }
    ++report.scanned;
    const auto modified = entry.last_write_time(ec);
    if (ec) {
        core::LogError("Retention sweep failed to stat " + entry.path().string() + ": " +
                       ec.message());
        ++report.failed;
        return;
    }
    if (modified >= cutoff) {
        return;
    }
    fs::remove(entry.path(), ec);
    if (ec) {
        core::LogError("Retention sweep failed to delete " + entry.path().string() + ": " +
                       ec.message());
        ++report.failed;
        return;
    }
    ++report.deleted;
    core::LogEvent("retention_deleted", {{"path", entry.path().string()}});
}

void RetentionSweeper::SweepDirectory(const fs::path& directory, fs::file_time_type cutoff,
                                      SweepReport& report) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return;
    }
    ++report.directories;

    fs::directory_iterator it(directory, ec);
    if (ec) {
        core::LogError("Retention sweep failed to list " + directory.string() + ": " +
                       ec.message());
        ++report.failed;
        return;
    }
    const fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        SweepEntry(*it, cutoff, report);
    }
    if (ec) {
        core::LogError("Retention sweep stopped listing " + directory.string() + ": " +
                       ec.message());
        ++report.failed;
    }
}

}  // namespace uploadguard::upload
