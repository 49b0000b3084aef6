/**
 * @file TemporaryImageManagerTest.cpp
 * @brief Unit tests for TemporaryImageManager
 */

#include "services/TemporaryImageManager.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/FakeSleeper.hpp"
#include "mocks/MockProcessRunner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;

namespace {

const std::string ATTACH_OUTPUT =
    "/dev/disk6          \tGUID_partition_scheme          \t\n"
    "/dev/disk6s1        \tApple_HFS                      \t/Volumes/IMG\n";

}  // namespace

class TemporaryImageManagerTest : public TempDirFixture {
protected:
    testing::StrictMock<MockProcessRunner> runner;
    FakeSleeper sleeper;
    ToolCommands tools;
    DetachSupervisor supervisor{runner, sleeper, tools};
    TemporaryImageManager manager{runner, supervisor, tools};
    Report report{Parameters{.case_name = "CASE1", .image_name = "IMG"}, "Test"};

    auto image_path() const -> std::filesystem::path { return temp_dir / "IMG" / "IMG.sparseimage"; }

    void expect_create(int exit_code) {
        EXPECT_CALL(runner, run_streamed(ElementsAre("hdiutil", "create", "-sectors", "2048",
                                                     "-volname", "IMG", image_path().string()),
                                         true, _))
            .WillOnce(Return(MockProcessRunner::Exited(exit_code)));
    }
};

// ========== create_and_attach Tests ==========

TEST_F(TemporaryImageManagerTest, CreateAndAttach_Success_RecordsImage) {
    expect_create(0);
    EXPECT_CALL(runner, run_streamed(ElementsAre("hdiutil", "attach", image_path().string()), true, _))
        .WillOnce(Return(MockProcessRunner::Exited(0, ATTACH_OUTPUT)));

    auto image = manager.create_and_attach(2048, "IMG", temp_dir, report);

    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->image_path, image_path());
    EXPECT_EQ(image->volume, "/dev/disk6");
    EXPECT_TRUE(std::filesystem::is_directory(temp_dir / "IMG"));
    EXPECT_THAT(report.output_files(), ElementsAre(image_path()));
}

TEST_F(TemporaryImageManagerTest, CreateAndAttach_CreateFails_NothingRecorded) {
    expect_create(1);

    auto image = manager.create_and_attach(2048, "IMG", temp_dir, report);

    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().kind, util::ErrorKind::PROCESS_EXIT_FAILURE);
    EXPECT_EQ(image.error().code, 1);
    EXPECT_TRUE(report.output_files().empty());
}

TEST_F(TemporaryImageManagerTest, CreateAndAttach_AttachFails_NothingRecorded) {
    expect_create(0);
    EXPECT_CALL(runner, run_streamed(ElementsAre("hdiutil", "attach", _), true, _))
        .WillOnce(Return(MockProcessRunner::Exited(1, "hdiutil: attach failed")));

    auto image = manager.create_and_attach(2048, "IMG", temp_dir, report);

    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().kind, util::ErrorKind::PROCESS_EXIT_FAILURE);
    EXPECT_TRUE(report.output_files().empty());
}

TEST_F(TemporaryImageManagerTest, CreateAndAttach_AttachSilent_ReturnsParseFailure) {
    expect_create(0);
    EXPECT_CALL(runner, run_streamed(ElementsAre("hdiutil", "attach", _), true, _))
        .WillOnce(Return(MockProcessRunner::Exited(0, "")));

    auto image = manager.create_and_attach(2048, "IMG", temp_dir, report);

    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().kind, util::ErrorKind::PARSE_FAILURE);
}

TEST_F(TemporaryImageManagerTest, CreateAndAttach_SpawnFailure_Propagates) {
    EXPECT_CALL(runner, run_streamed(_, true, _)).WillOnce(Return(MockProcessRunner::SpawnFailed()));

    auto image = manager.create_and_attach(2048, "IMG", temp_dir, report);

    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().kind, util::ErrorKind::PROCESS_SPAWN_FAILURE);
}

// ========== convert Tests ==========

TEST_F(TemporaryImageManagerTest, Convert_AfterCreate_AppendsInOrder) {
    expect_create(0);
    EXPECT_CALL(runner, run_streamed(ElementsAre("hdiutil", "attach", _), true, _))
        .WillOnce(Return(MockProcessRunner::Exited(0, ATTACH_OUTPUT)));

    const auto destination = temp_dir / "dest";
    const auto dmg = destination / "IMG" / "IMG.dmg";
    EXPECT_CALL(runner, run_streamed(ElementsAre("hdiutil", "convert", image_path().string(),
                                                 "-format", "UDZO", "-o", dmg.string()),
                                     true, _))
        .WillOnce(Return(MockProcessRunner::Exited(0)));

    auto image = manager.create_and_attach(2048, "IMG", temp_dir, report);
    ASSERT_TRUE(image.has_value());
    auto converted = manager.convert(image->image_path, "IMG", destination, report);

    ASSERT_TRUE(converted.has_value());
    EXPECT_EQ(*converted, dmg);
    EXPECT_THAT(report.output_files(), ElementsAre(image_path(), dmg));
}

TEST_F(TemporaryImageManagerTest, Convert_Fails_NotRecorded) {
    EXPECT_CALL(runner, run_streamed(ElementsAre("hdiutil", "convert", _, _, _, _, _), true, _))
        .WillOnce(Return(MockProcessRunner::Exited(1)));

    auto converted = manager.convert(image_path(), "IMG", temp_dir / "dest", report);

    ASSERT_FALSE(converted.has_value());
    EXPECT_EQ(converted.error().kind, util::ErrorKind::PROCESS_EXIT_FAILURE);
    EXPECT_TRUE(report.output_files().empty());
}

// ========== detach Tests ==========

TEST_F(TemporaryImageManagerTest, Detach_UsesAttachedVolume) {
    EXPECT_CALL(runner, run_captured(ElementsAre("hdiutil", "detach", "/dev/disk6"), false))
        .WillOnce(Return(MockProcessRunner::Exited(0)));

    TemporaryImage image{.image_path = image_path(), .volume = "/dev/disk6"};
    EXPECT_TRUE(manager.detach(image, DetachPolicy{.delay = std::chrono::seconds{0}}));
    EXPECT_TRUE(sleeper.sleeps.empty());
}
