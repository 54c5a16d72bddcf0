#include "polywatch/cli/commands.hpp"

#include <string_view>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace polywatch;
using namespace std::chrono_literals;

namespace {

auto parse(std::vector<std::string_view> args) -> Result<cli::CliOptions> {
  return cli::parse_args(args);
}

}  // namespace

TEST(CliTest, NoArgs_LeavesEverythingUnset) {
  auto opts = parse({});
  ASSERT_TRUE(opts.has_value());
  EXPECT_FALSE(opts->build.has_value());
  EXPECT_FALSE(opts->config_file.has_value());
  EXPECT_FALSE(opts->help);
  EXPECT_FALSE(opts->version);
}

TEST(CliTest, SpaceAndEqualsForms) {
  auto opts = parse({"--build", "make", "--run=./app", "--interval=250ms",
                     "--include", ".c,.h", "--exclude=.git"});
  ASSERT_TRUE(opts.has_value());
  EXPECT_EQ(opts->build, "make");
  EXPECT_EQ(opts->run, "./app");
  EXPECT_EQ(opts->interval, "250ms");
  EXPECT_EQ(opts->include, ".c,.h");
  EXPECT_EQ(opts->exclude, ".git");
}

TEST(CliTest, ValueMayContainEquals) {
  auto opts = parse({"--run=FOO=1 ./app"});
  ASSERT_TRUE(opts.has_value());
  EXPECT_EQ(opts->run, "FOO=1 ./app");
}

TEST(CliTest, HelpAndVersionFlags) {
  auto opts = parse({"-h", "--version"});
  ASSERT_TRUE(opts.has_value());
  EXPECT_TRUE(opts->help);
  EXPECT_TRUE(opts->version);
}

TEST(CliTest, UnknownOption_Fails) {
  auto opts = parse({"--bogus"});
  ASSERT_FALSE(opts.has_value());
  EXPECT_EQ(opts.error(), Error::InvalidArgument);
}

TEST(CliTest, MissingValue_Fails) {
  auto opts = parse({"--build"});
  ASSERT_FALSE(opts.has_value());
  EXPECT_EQ(opts.error(), Error::InvalidArgument);
}

TEST(CliTest, Resolve_DefaultsWithoutFlags) {
  auto config = cli::resolve_config(cli::CliOptions{});
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->root.string(), ".");
  EXPECT_EQ(config->interval, 1000ms);
  EXPECT_EQ(config->build_command, "echo 'No build command specified'");
}

TEST(CliTest, Resolve_FlagsSplitRulesAndParseInterval) {
  auto opts = parse({"--include", ".go,,services", "--interval", "1m30s",
                     "--depfile", "go.mod", "--depcommand", "go mod tidy"});
  ASSERT_TRUE(opts.has_value());
  auto config = cli::resolve_config(*opts);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->includes, (std::vector<std::string>{".go", "services"}));
  EXPECT_EQ(config->interval, 90000ms);
  EXPECT_EQ(config->dep_file, "go.mod");
  EXPECT_EQ(config->dep_command, "go mod tidy");
}

TEST(CliTest, Resolve_FlagsOverrideConfigFile) {
  test::TempDir dir;
  ASSERT_TRUE(dir.valid());
  auto path = dir.write("watch.yaml",
                        "build: make\nrun: ./old\nexclude: [tmp]\n");

  cli::CliOptions opts;
  opts.config_file = path.string();
  opts.run = "./new";

  auto config = cli::resolve_config(opts);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->build_command, "make");
  EXPECT_EQ(config->run_command, "./new");
  EXPECT_EQ(config->excludes, (std::vector<std::string>{"tmp"}));
}

TEST(CliTest, Resolve_RejectsBadInterval) {
  cli::CliOptions opts;
  opts.interval = "fast";
  EXPECT_FALSE(cli::resolve_config(opts).has_value());

  opts.interval = "0";
  EXPECT_FALSE(cli::resolve_config(opts).has_value());
}

TEST(CliTest, Resolve_RejectsUnknownLogLevel) {
  cli::CliOptions opts;
  opts.log_level = "loud";
  EXPECT_FALSE(cli::resolve_config(opts).has_value());
}

TEST(CliTest, Resolve_MissingConfigFile) {
  cli::CliOptions opts;
  opts.config_file = "/nonexistent/watch.yaml";
  auto config = cli::resolve_config(opts);
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), Error::FileNotFound);
}
