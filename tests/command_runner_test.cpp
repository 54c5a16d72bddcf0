#include "polywatch/process/command_runner.hpp"
#include "polywatch/process/spawn.hpp"

#include <signal.h>

#include <filesystem>
#include <fstream>
#include <format>
#include <sstream>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace polywatch;
namespace fs = std::filesystem;

namespace {

auto read_file(const fs::path& p) -> std::string {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

class CommandRunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    runner_ = create_shell_runner();
  }

  test::TempDir dir_;
  std::unique_ptr<ICommandRunner> runner_;
};

TEST_F(CommandRunnerTest, EmptyCommand_SucceedsWithoutSpawning) {
  EXPECT_TRUE(runner_->run("").has_value());
}

TEST_F(CommandRunnerTest, SuccessfulCommand_ReturnsOk) {
  EXPECT_TRUE(runner_->run("true").has_value());
}

TEST_F(CommandRunnerTest, NonZeroExit_IsCommandFailed) {
  auto result = runner_->run("exit 3");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::CommandFailed);
}

TEST_F(CommandRunnerTest, UnknownProgram_IsCommandFailed) {
  // The shell itself starts fine and reports 127.
  auto result = runner_->run("definitely-not-a-real-program-xyz 2>/dev/null");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::CommandFailed);
}

TEST_F(CommandRunnerTest, BlocksUntilCommandFinishes) {
  auto marker = dir_.path() / "done";
  auto cmd = std::format("sleep 0.2 && touch '{}'", marker.string());
  ASSERT_TRUE(runner_->run(cmd).has_value());
  EXPECT_TRUE(fs::exists(marker));
}

TEST_F(CommandRunnerTest, ShellSyntaxIsInterpreted) {
  auto out = dir_.path() / "out.txt";
  auto cmd = std::format("for i in 1 2 3; do printf $i; done > '{}'",
                         out.string());
  ASSERT_TRUE(runner_->run(cmd).has_value());
  EXPECT_EQ(read_file(out), "123");
}

TEST_F(CommandRunnerTest, RunsInWorkDir) {
  auto runner = create_shell_runner(dir_.path().string());
  ASSERT_TRUE(runner->run("pwd > where.txt").has_value());

  auto where = read_file(dir_.path() / "where.txt");
  EXPECT_EQ(fs::canonical(where.substr(0, where.find('\n'))).string(),
            fs::canonical(dir_.path()).string());
}

TEST_F(CommandRunnerTest, MissingWorkDir_IsSpawnFailed) {
  auto runner = create_shell_runner((dir_.path() / "missing").string());
  auto result = runner->run("true");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), Error::SpawnFailed);
}

TEST_F(CommandRunnerTest, StdinIsDevNull) {
  EXPECT_TRUE(
      runner_->run("[ \"$(readlink /proc/$$/fd/0)\" = /dev/null ]")
          .has_value());
}

TEST_F(CommandRunnerTest, ReadingStdin_SeesEofInsteadOfBlocking) {
  EXPECT_TRUE(runner_->run("if read x; then exit 1; fi").has_value());
}

TEST(SpawnTest, ReadFromStdin_Returns) {
  auto pid = process::spawn_shell("read x; exit 7", "");
  ASSERT_TRUE(pid.has_value());
  auto code = process::wait_exit(*pid);
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, 7);
}

TEST(SpawnTest, AwaitExit_KeepsZombieUntilWaited) {
  auto pid = process::spawn_shell("exit 4", "");
  ASSERT_TRUE(pid.has_value());

  ASSERT_TRUE(process::await_exit(*pid).has_value());
  EXPECT_EQ(::kill(*pid, 0), 0);
  EXPECT_FALSE(test::pid_alive(*pid));

  auto code = process::wait_exit(*pid);
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, 4);
  EXPECT_NE(::kill(*pid, 0), 0);
}

TEST(SpawnTest, ExitCodeOfSignalDeath) {
  auto pid = process::spawn_shell("kill -9 $$", "");
  ASSERT_TRUE(pid.has_value());
  auto code = process::wait_exit(*pid);
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, 128 + 9);
}

TEST(SpawnTest, ChildLeadsItsOwnProcessGroup) {
  auto pid = process::spawn_shell("sleep 5", "");
  ASSERT_TRUE(pid.has_value());
  EXPECT_EQ(::getpgid(*pid), *pid);

  process::kill_group(*pid);
  auto code = process::wait_exit(*pid);
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, 128 + 9);
}
