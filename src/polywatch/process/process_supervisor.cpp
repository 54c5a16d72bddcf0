#include "polywatch/process/process_supervisor.hpp"

#include "polywatch/process/spawn.hpp"
#include "polywatch/util/log.hpp"

#include <utility>

namespace polywatch {

auto ProcessSlot::current() const -> std::optional<ProcessHandle> {
  std::lock_guard lock(mutex_);
  return current_;
}

auto ProcessSlot::swap_and_kill(const SpawnFn& spawn)
    -> Result<ProcessHandle> {
  std::lock_guard lock(mutex_);

  if (current_) {
    log::info("Stopping previous app process...");
    process::kill_group(current_->pid);
    current_.reset();
    emptied_.notify_all();
  }

  auto pid = spawn();
  if (!pid) {
    return fail(pid.error());
  }

  current_ = ProcessHandle{*pid, next_generation_++};
  return ok(*current_);
}

auto ProcessSlot::kill_current() -> std::optional<ProcessHandle> {
  std::lock_guard lock(mutex_);
  auto killed = std::exchange(current_, std::nullopt);
  if (killed) {
    process::kill_group(killed->pid);
    emptied_.notify_all();
  }
  return killed;
}

auto ProcessSlot::clear_if_matches(const ProcessHandle& handle) -> bool {
  std::lock_guard lock(mutex_);
  if (!current_ || *current_ != handle) {
    return false;
  }
  current_.reset();
  emptied_.notify_all();
  return true;
}

auto ProcessSlot::wait_until_empty(std::chrono::milliseconds timeout) -> bool {
  std::unique_lock lock(mutex_);
  return emptied_.wait_for(lock, timeout, [this] { return !current_; });
}

ProcessSupervisor::ProcessSupervisor(std::string work_dir)
    : work_dir_{std::move(work_dir)} {}

ProcessSupervisor::~ProcessSupervisor() {
  stop();
}

auto ProcessSupervisor::restart(std::string_view run_command) -> Result<void> {
  reap_finished_watchers();

  auto handle = slot_.swap_and_kill([&]() -> Result<pid_t> {
    log::info("Starting app...");
    return process::spawn_shell(run_command, work_dir_);
  });
  if (!handle) {
    return fail(handle.error());
  }
  log::debug("App running as pid {}", handle->pid);

  std::lock_guard lock(watchers_mutex_);
  auto& watcher = watchers_.emplace_back();
  watcher.handle = *handle;
  watcher.thread = std::jthread([this, &watcher] { watch_exit(watcher); });
  return ok();
}

auto ProcessSupervisor::stop() -> void {
  if (auto killed = slot_.kill_current()) {
    log::info("Stopping app process (pid {})", killed->pid);
  }

  std::list<ExitWatcher> watchers;
  {
    std::lock_guard lock(watchers_mutex_);
    watchers.splice(watchers.end(), watchers_);
  }
  // Every tracked group has been killed, so each join returns promptly.
  watchers.clear();
}

auto ProcessSupervisor::current_pid() const -> std::optional<pid_t> {
  if (auto handle = slot_.current()) {
    return handle->pid;
  }
  return std::nullopt;
}

auto ProcessSupervisor::wait_until_idle(std::chrono::milliseconds timeout)
    -> bool {
  return slot_.wait_until_empty(timeout);
}

// The slot is cleared while the exited leader is still a zombie. A later
// kill_group on a handle from the slot can then never reach a recycled pgid.
auto ProcessSupervisor::watch_exit(ExitWatcher& watcher) -> void {
  auto exited = process::await_exit(watcher.handle.pid);
  slot_.clear_if_matches(watcher.handle);

  if (exited) {
    auto status = process::wait_exit(watcher.handle.pid);
    if (status) {
      log::info("App exited (pid {}, status {})", watcher.handle.pid,
                *status);
    } else {
      log::warn("Lost track of app pid {}: {}", watcher.handle.pid,
                status.error().message());
    }
  }
  watcher.done.store(true, std::memory_order_release);
}

auto ProcessSupervisor::reap_finished_watchers() -> void {
  std::lock_guard lock(watchers_mutex_);
  watchers_.remove_if([](const ExitWatcher& w) {
    return w.done.load(std::memory_order_acquire);
  });
}

}  // namespace polywatch
