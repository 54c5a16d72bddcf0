#pragma once

#include "polywatch/config/watcher_config.hpp"
#include "polywatch/core/error.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace polywatch::cli {

// Raw command-line values. Unset fields fall back to the config file, then
// to the WatcherConfig defaults.
struct CliOptions {
  std::optional<std::string> config_file;
  std::optional<std::string> root;
  std::optional<std::string> interval;
  std::optional<std::string> build;
  std::optional<std::string> run;
  std::optional<std::string> dep_file;
  std::optional<std::string> dep_command;
  std::optional<std::string> include;
  std::optional<std::string> exclude;
  std::optional<std::string> work_dir;
  std::optional<std::string> log_level;
  bool help{false};
  bool version{false};
};

// args excludes the program name. Accepts "--flag value" and "--flag=value".
// Problems are reported on stderr and returned as Error::InvalidArgument.
[[nodiscard]] auto parse_args(std::span<const std::string_view> args)
    -> Result<CliOptions>;

// Config file (if any) first, flags on top, then sanity checks.
[[nodiscard]] auto resolve_config(const CliOptions& opts)
    -> Result<WatcherConfig>;

void print_banner();
void print_usage(std::string_view prog);
void print_version();

// Runs the watcher until SIGINT or SIGTERM. Returns the process exit code.
[[nodiscard]] auto cmd_watch(const WatcherConfig& config) -> int;

}  // namespace polywatch::cli
