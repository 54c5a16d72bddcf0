#pragma once

#include "polywatch/core/error.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace polywatch {

class IProcessSupervisor {
public:
  virtual ~IProcessSupervisor() = default;

  // Kills the tracked run-process, if any, and starts run_command in its
  // place.
  virtual auto restart(std::string_view run_command) -> Result<void> = 0;
};

// Identity of one launch. The generation tells two launches apart even if
// the kernel hands out the same pid again.
struct ProcessHandle {
  pid_t pid{-1};
  std::uint64_t generation{0};

  auto operator==(const ProcessHandle&) const -> bool = default;
};

// The single tracked-process slot. Every read and write goes through the
// one mutex, shared by restarts and exit-watchers.
class ProcessSlot {
public:
  using SpawnFn = std::function<Result<pid_t>()>;

  [[nodiscard]] auto current() const -> std::optional<ProcessHandle>;

  // Under the lock: SIGKILL the tracked group without waiting for it, clear
  // the slot, run spawn and track what it started. On spawn failure the
  // slot stays empty.
  auto swap_and_kill(const SpawnFn& spawn) -> Result<ProcessHandle>;

  // Kills and clears whatever is tracked.
  auto kill_current() -> std::optional<ProcessHandle>;

  // Clears the slot only if it still holds the given launch.
  auto clear_if_matches(const ProcessHandle& handle) -> bool;

  auto wait_until_empty(std::chrono::milliseconds timeout) -> bool;

private:
  mutable std::mutex mutex_;
  std::condition_variable emptied_;
  std::optional<ProcessHandle> current_;
  std::uint64_t next_generation_{1};
};

// Owns the run-process. Each launch gets an exit-watcher thread that waits
// for the process to exit, clears the slot while the process is still an
// unreaped zombie, then reaps it. A handle read from the slot therefore
// never names a recycled process group.
//
// The previous process is killed but not reaped before its replacement
// starts, so both may exist for a moment (e.g. both holding a port).
class ProcessSupervisor : public IProcessSupervisor {
public:
  explicit ProcessSupervisor(std::string work_dir = {});
  ~ProcessSupervisor() override;

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  auto operator=(const ProcessSupervisor&) -> ProcessSupervisor& = delete;

  auto restart(std::string_view run_command) -> Result<void> override;

  // Kills the tracked process and joins every exit-watcher.
  auto stop() -> void;

  [[nodiscard]] auto current_pid() const -> std::optional<pid_t>;

  // True once nothing is tracked; false if timeout elapsed first.
  auto wait_until_idle(std::chrono::milliseconds timeout) -> bool;

private:
  struct ExitWatcher {
    ProcessHandle handle;
    std::atomic<bool> done{false};
    std::jthread thread;
  };

  auto watch_exit(ExitWatcher& watcher) -> void;
  auto reap_finished_watchers() -> void;

  std::string work_dir_;
  ProcessSlot slot_;

  std::mutex watchers_mutex_;
  std::list<ExitWatcher> watchers_;
};

}  // namespace polywatch
