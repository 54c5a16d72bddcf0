#include "polywatch/watch/watch_loop.hpp"

#include "polywatch/util/duration.hpp"
#include "polywatch/util/log.hpp"

namespace polywatch {

WatchLoop::WatchLoop(WatcherConfig config, ICommandRunner& runner,
                     IProcessSupervisor& supervisor)
    : config_{std::move(config)},
      fingerprinter_{config_},
      runner_{&runner},
      supervisor_{&supervisor} {}

WatchLoop::~WatchLoop() {
  stop();
}

auto WatchLoop::start() -> void {
  if (running_.exchange(true)) {
    return;
  }

  loop_thread_ = std::jthread([this](std::stop_token st) { run(st); });
  log::info("Watching {} every {}", config_.root.string(),
            util::format_duration(config_.interval));
}

auto WatchLoop::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  if (loop_thread_.joinable()) {
    loop_thread_.request_stop();
    loop_thread_.join();
  }
  log::info("Watch loop stopped");
}

auto WatchLoop::is_running() const noexcept -> bool {
  return running_.load();
}

auto WatchLoop::run(std::stop_token st) -> void {
  while (!st.stop_requested()) {
    auto outcome = tick();
    log::trace("Tick finished: {}", to_string_view(outcome));
    sleep_interval(st);
  }
}

auto WatchLoop::tick() -> TickOutcome {
  auto scan = fingerprinter_.scan(previous_dep_mtime_);
  if (!scan) {
    log::error("Error hashing dir: {}", scan.error().message());
    return TickOutcome::ScanFailed;
  }
  previous_dep_mtime_ = scan->dep_mtime;

  if (scan->fingerprint == previous_fingerprint_) {
    return TickOutcome::Unchanged;
  }

  log::info("Change detected, rebuilding...");
  previous_fingerprint_ = scan->fingerprint;

  if (scan->dep_changed && !config_.dep_command.empty()) {
    log::info("{} changed: running {}...", config_.dep_file,
              config_.dep_command);
    if (auto r = runner_->run(config_.dep_command); !r) {
      log::error("Build failed: dependency command: {}", r.error().message());
      return TickOutcome::DependencyFailed;
    }
  }

  log::info("Running build command...");
  if (auto r = runner_->run(config_.build_command); !r) {
    log::error("Build failed: {}", r.error().message());
    return TickOutcome::BuildFailed;
  }

  if (auto r = supervisor_->restart(config_.run_command); !r) {
    log::error("App start failed: {}", r.error().message());
    return TickOutcome::RestartFailed;
  }
  return TickOutcome::Restarted;
}

auto WatchLoop::sleep_interval(std::stop_token st) -> void {
  std::unique_lock lock(sleep_mutex_);
  sleep_cv_.wait_for(lock, st, config_.interval, [] { return false; });
}

}  // namespace polywatch
