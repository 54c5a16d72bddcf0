#pragma once

#include "polywatch/core/constants.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace polywatch {

// Immutable once handed to the WatchLoop. Empty command strings are no-ops.
struct WatcherConfig {
  std::filesystem::path root{defaults::kRoot};
  std::chrono::milliseconds interval{timing::kDefaultPollInterval};
  std::string build_command{defaults::kBuildCommand};
  std::string run_command{defaults::kRunCommand};
  std::string dep_file;
  std::string dep_command;
  std::vector<std::string> includes;
  std::vector<std::string> excludes;
  // Directory the build, dependency and run commands start in; empty
  // means the watcher's own working directory.
  std::string work_dir;
  std::string log_level{defaults::kLogLevel};
};

// Splits a comma-separated rule list, dropping empty segments.
[[nodiscard]] auto split_rules(std::string_view csv) -> std::vector<std::string>;

}  // namespace polywatch
