#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <Poco/AutoPtr.h>
#include <Poco/Channel.h>
#include <Poco/Exception.h>
#include <Poco/Logger.h>
#include <Poco/Message.h>
#include <Poco/NullChannel.h>
#include <Poco/UUIDGenerator.h>

#include "uploadguard/upload/retention_sweeper.h"

namespace fs = std::filesystem;

using uploadguard::upload::RetentionPolicy;
using uploadguard::upload::RetentionSweeper;
using uploadguard::upload::TypeProfileRegistry;

namespace {

fs::path MakeTempRoot() {
    return fs::temp_directory_path() /
           ("uploadguard_sweep_" + Poco::UUIDGenerator().createOne().toString());
}

fs::path WriteAgedFile(const fs::path& path, std::chrono::seconds age) {
    std::ofstream(path) << "payload";
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
    return path;
}

constexpr std::chrono::seconds kDay{24 * 60 * 60};

class FailingChannel : public Poco::Channel {
public:
    void log(const Poco::Message&) override { throw Poco::IOException("log sink unavailable"); }
};

}  // namespace

TEST(RetentionSweeper, DeletesOnlyFilesPastTheWindow) {
    const auto root = MakeTempRoot();
    auto registry = std::make_shared<const TypeProfileRegistry>(root.string(),
                                                                (root / "tmp").string());
    ASSERT_TRUE(registry->EnsureDirectories().ok());

    const auto old_image = WriteAgedFile(root / "images" / "old.png", 8 * kDay);
    const auto old_video = WriteAgedFile(root / "videos" / "old.mp4", 30 * kDay);
    const auto fresh_doc = WriteAgedFile(root / "documents" / "new.pdf", std::chrono::hours(1));

    RetentionSweeper sweeper(registry, RetentionPolicy{7 * 24 * 60 * 60, 60 * 60});
    const auto report = sweeper.SweepOnce();

    EXPECT_TRUE(report.ran);
    EXPECT_EQ(report.directories, 7u);
    EXPECT_EQ(report.scanned, 3u);
    EXPECT_EQ(report.deleted, 2u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_FALSE(fs::exists(old_image));
    EXPECT_FALSE(fs::exists(old_video));
    EXPECT_TRUE(fs::exists(fresh_doc));

    fs::remove_all(root);
}

TEST(RetentionSweeper, MinimumAgeProtectsRecentFiles) {
    const auto root = MakeTempRoot();
    auto registry = std::make_shared<const TypeProfileRegistry>(root.string(),
                                                                (root / "tmp").string());
    ASSERT_TRUE(registry->EnsureDirectories().ok());

    const auto recent = WriteAgedFile(root / "avatars" / "me.png", std::chrono::minutes(10));
    const auto older = WriteAgedFile(root / "avatars" / "old.png", std::chrono::hours(2));

    RetentionSweeper sweeper(registry, RetentionPolicy{60, 60 * 60});
    EXPECT_EQ(sweeper.policy().EffectiveAgeSeconds(), 60 * 60);
    const auto report = sweeper.SweepOnce();

    EXPECT_EQ(report.deleted, 1u);
    EXPECT_TRUE(fs::exists(recent));
    EXPECT_FALSE(fs::exists(older));

    fs::remove_all(root);
}

TEST(RetentionSweeper, SweepsAbandonedStagingFiles) {
    const auto root = MakeTempRoot();
    auto registry = std::make_shared<const TypeProfileRegistry>(root.string(),
                                                                (root / "tmp").string());
    ASSERT_TRUE(registry->EnsureDirectories().ok());

    const auto stale = WriteAgedFile(root / "tmp" / "1700000000000_abc.jpg", 8 * kDay);

    RetentionSweeper sweeper(registry, RetentionPolicy{});
    const auto report = sweeper.SweepOnce();

    EXPECT_EQ(report.deleted, 1u);
    EXPECT_FALSE(fs::exists(stale));

    fs::remove_all(root);
}

TEST(RetentionSweeper, ClockIsInjectable) {
    const auto root = MakeTempRoot();
    auto registry = std::make_shared<const TypeProfileRegistry>(root.string(),
                                                                (root / "tmp").string());
    ASSERT_TRUE(registry->EnsureDirectories().ok());

    const auto file = WriteAgedFile(root / "voice" / "note.mp3", std::chrono::seconds(0));
    RetentionSweeper sweeper(registry, RetentionPolicy{});

    EXPECT_EQ(sweeper.SweepOnce(fs::file_time_type::clock::now() + 6 * kDay).deleted, 0u);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_EQ(sweeper.SweepOnce(fs::file_time_type::clock::now() + 8 * kDay).deleted, 1u);
    EXPECT_FALSE(fs::exists(file));

    fs::remove_all(root);
}

TEST(RetentionSweeper, MissingDirectoriesAreSkipped) {
    const auto root = MakeTempRoot();
    auto registry = std::make_shared<const TypeProfileRegistry>(root.string(),
                                                                (root / "tmp").string());

    RetentionSweeper sweeper(registry, RetentionPolicy{});
    const auto report = sweeper.SweepOnce();

    EXPECT_TRUE(report.ran);
    EXPECT_EQ(report.directories, 0u);
    EXPECT_EQ(report.scanned, 0u);
    EXPECT_EQ(report.failed, 0u);
}

TEST(RetentionSweeper, ThrowingSweepDoesNotBlockLaterSweeps) {
    const auto root = MakeTempRoot();
    auto registry = std::make_shared<const TypeProfileRegistry>(root.string(),
                                                                (root / "tmp").string());
    ASSERT_TRUE(registry->EnsureDirectories().ok());
    const auto old_image = WriteAgedFile(root / "images" / "old.png", 8 * kDay);

    auto& logger = Poco::Logger::get("uploadguard");
    logger.setLevel(Poco::Message::PRIO_INFORMATION);
    logger.setChannel(Poco::AutoPtr<FailingChannel>(new FailingChannel()));

    RetentionSweeper sweeper(registry, RetentionPolicy{});
    EXPECT_THROW(sweeper.SweepOnce(), Poco::IOException);

    logger.setChannel(Poco::AutoPtr<Poco::NullChannel>(new Poco::NullChannel()));
    const auto report = sweeper.SweepOnce();
    EXPECT_TRUE(report.ran);
    EXPECT_FALSE(fs::exists(old_image));

    fs::remove_all(root);
}
