#pragma once

#include "polywatch/config/watcher_config.hpp"
#include "polywatch/core/error.hpp"
#include "polywatch/process/command_runner.hpp"
#include "polywatch/process/process_supervisor.hpp"
#include "polywatch/watch/fingerprint.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>

namespace polywatch {

// How a single poll cycle ended.
enum class TickOutcome : std::uint8_t {
  ScanFailed,
  Unchanged,
  DependencyFailed,
  BuildFailed,
  RestartFailed,
  Restarted,
};

[[nodiscard]] constexpr auto to_string_view(TickOutcome outcome) noexcept
    -> std::string_view {
  switch (outcome) {
    case TickOutcome::ScanFailed: return "scan_failed";
    case TickOutcome::Unchanged: return "unchanged";
    case TickOutcome::DependencyFailed: return "dependency_failed";
    case TickOutcome::BuildFailed: return "build_failed";
    case TickOutcome::RestartFailed: return "restart_failed";
    case TickOutcome::Restarted: return "restarted";
  }
  return "unknown";
}

// Polls the tree and, whenever its fingerprint moves, runs the dependency
// command (if the dependency file changed), then the build command, then
// restarts the run command.
//
// The new fingerprint is recorded before the build runs. A failed build is
// therefore not retried until the tree changes again.
class WatchLoop {
public:
  WatchLoop(WatcherConfig config, ICommandRunner& runner,
            IProcessSupervisor& supervisor);
  ~WatchLoop();

  WatchLoop(const WatchLoop&) = delete;
  auto operator=(const WatchLoop&) -> WatchLoop& = delete;

  // Runs the loop on a background thread until stop().
  auto start() -> void;
  // Interrupts the inter-tick sleep and joins. A command already running is
  // allowed to finish first.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Runs the loop on the calling thread until st is triggered.
  auto run(std::stop_token st) -> void;

  // One scan / compare / dependency / build / restart cycle, no sleep.
  auto tick() -> TickOutcome;

  [[nodiscard]] auto previous_fingerprint() const noexcept -> std::uint64_t {
    return previous_fingerprint_;
  }

  [[nodiscard]] auto config() const noexcept -> const WatcherConfig& {
    return config_;
  }

private:
  auto sleep_interval(std::stop_token st) -> void;

  WatcherConfig config_;
  TreeFingerprinter fingerprinter_;
  ICommandRunner* runner_;
  IProcessSupervisor* supervisor_;

  // Zero until the first successful scan; a real tree virtually never
  // hashes to it, so the first tick rebuilds.
  std::uint64_t previous_fingerprint_{0};
  std::filesystem::file_time_type previous_dep_mtime_{};

  std::atomic<bool> running_{false};
  std::mutex sleep_mutex_;
  std::condition_variable_any sleep_cv_;
  std::jthread loop_thread_;
};

}  // namespace polywatch
