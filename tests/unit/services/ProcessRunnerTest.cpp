/**
 * @file ProcessRunnerTest.cpp
 * @brief Unit tests for ProcessRunner against real child processes
 */

#include "services/ProcessRunner.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ProcessRunnerTest : public TempDirFixture {
protected:
    std::ostringstream echo;
    // "env VAR=1 cmd" stands in for the keep-awake wrapper
    ProcessRunner runner{{"env", "FUJI_KEEP_AWAKE=1"}, echo};
};

// ========== command_line Tests ==========

TEST_F(ProcessRunnerTest, CommandLine_KeepAwake_PrependsPrefix) {
    EXPECT_THAT(runner.command_line({"hdiutil", "attach", "x.dmg"}, true),
                ElementsAre("env", "FUJI_KEEP_AWAKE=1", "hdiutil", "attach", "x.dmg"));
}

TEST_F(ProcessRunnerTest, CommandLine_NoKeepAwake_Unchanged) {
    EXPECT_THAT(runner.command_line({"hdiutil", "attach", "x.dmg"}, false),
                ElementsAre("hdiutil", "attach", "x.dmg"));
}

// ========== run_captured Tests ==========

TEST_F(ProcessRunnerTest, RunCaptured_Success_ReturnsStdout) {
    auto result = runner.run_captured({"sh", "-c", "echo hello"}, false);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_TRUE(result->succeeded());
    EXPECT_EQ(result->output, "hello\n");
    EXPECT_TRUE(echo.str().empty());
}

TEST_F(ProcessRunnerTest, RunCaptured_NonZeroExit_ReportsExitCode) {
    auto result = runner.run_captured({"sh", "-c", "echo partial; exit 3"}, false);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_FALSE(result->succeeded());
    EXPECT_EQ(result->output, "partial\n");
}

TEST_F(ProcessRunnerTest, RunCaptured_StderrNotInOutput) {
    auto result = runner.run_captured({"sh", "-c", "echo out; echo err 1>&2"}, false);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->output, "out\n");
}

TEST_F(ProcessRunnerTest, RunCaptured_KeepAwake_RunsUnderWrapper) {
    auto wrapped = runner.run_captured({"sh", "-c", "echo \"[$FUJI_KEEP_AWAKE]\""}, true);
    auto plain = runner.run_captured({"sh", "-c", "echo \"[$FUJI_KEEP_AWAKE]\""}, false);

    ASSERT_TRUE(wrapped.has_value());
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(wrapped->output, "[1]\n");
    EXPECT_EQ(plain->output, "[]\n");
}

TEST_F(ProcessRunnerTest, RunCaptured_MissingProgram_ReturnsSpawnFailure) {
    auto result = runner.run_captured({"/nonexistent/fuji-tool"}, false);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::PROCESS_SPAWN_FAILURE);
}

TEST_F(ProcessRunnerTest, RunCaptured_EmptyArgs_ReturnsSpawnFailure) {
    auto result = runner.run_captured({}, false);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::PROCESS_SPAWN_FAILURE);
}

// ========== run_streamed Tests ==========

TEST_F(ProcessRunnerTest, RunStreamed_EchoesMergedOutput) {
    auto result = runner.run_streamed({"sh", "-c", "echo out; echo err 1>&2"}, false, std::nullopt);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_EQ(result->output, "out\nerr\n");
    EXPECT_EQ(echo.str(), result->output);
}

TEST_F(ProcessRunnerTest, RunStreamed_NonZeroExit_StillReturnsOutput) {
    auto result = runner.run_streamed({"sh", "-c", "printf 'no newline'; exit 7"}, false,
                                      std::nullopt);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 7);
    EXPECT_EQ(result->output, "no newline");
}

TEST_F(ProcessRunnerTest, RunStreamed_KilledBySignal_ReportsShellStyleCode) {
    auto result = runner.run_streamed({"sh", "-c", "kill -9 $$"}, false, std::nullopt);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 128 + 9);
}

TEST_F(ProcessRunnerTest, RunStreamed_TeeFile_ReceivesOutput) {
    const auto log = temp_dir / "copy.log";

    auto result = runner.run_streamed({"sh", "-c", "echo line1; echo line2 1>&2"}, true, log);

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(std::filesystem::exists(log));
    EXPECT_EQ(read_file(log), "line1\nline2\n");
}

TEST_F(ProcessRunnerTest, RunStreamed_UnwritableTeeFile_StillSucceeds) {
    const auto log = temp_dir / "missing" / "dir" / "copy.log";

    auto result = runner.run_streamed({"sh", "-c", "echo ok"}, false, log);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_FALSE(std::filesystem::exists(log));
}

TEST_F(ProcessRunnerTest, RunStreamed_MissingProgram_ReturnsSpawnFailure) {
    auto result = runner.run_streamed({"/nonexistent/fuji-tool", "--flag"}, false, std::nullopt);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::PROCESS_SPAWN_FAILURE);
    EXPECT_THAT(result.error().message, HasSubstr("/nonexistent/fuji-tool"));
}
