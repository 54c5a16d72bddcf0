#include "polywatch/cli/commands.hpp"

#include "polywatch/process/command_runner.hpp"
#include "polywatch/process/process_supervisor.hpp"
#include "polywatch/util/log.hpp"
#include "polywatch/util/shutdown.hpp"
#include "polywatch/watch/watch_loop.hpp"

namespace polywatch::cli {

auto cmd_watch(const WatcherConfig& config) -> int {
  log::set_level(config.log_level);
  log::start();

  auto runner = create_shell_runner(config.work_dir);
  ProcessSupervisor supervisor(config.work_dir);
  WatchLoop loop(config, *runner, supervisor);

  setup_signal_handlers();

  log::info("Starting polywatch...");
  loop.start();

  wait_for_shutdown();
  log::info("Received shutdown signal, stopping...");

  loop.stop();
  supervisor.stop();

  log::info("polywatch stopped.");
  log::stop();
  return 0;
}

}  // namespace polywatch::cli
