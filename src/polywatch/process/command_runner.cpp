#include "polywatch/process/command_runner.hpp"

#include "polywatch/process/spawn.hpp"
#include "polywatch/util/log.hpp"

#include <utility>

namespace polywatch {

namespace {

class ShellCommandRunner : public ICommandRunner {
public:
  explicit ShellCommandRunner(std::string work_dir)
      : work_dir_{std::move(work_dir)} {}

  auto run(std::string_view command) -> Result<void> override {
    if (command.empty()) {
      return ok();
    }

    auto pid = process::spawn_shell(command, work_dir_);
    if (!pid) {
      return fail(pid.error());
    }
    log::debug("Spawned pid {} for '{}'", *pid, command);

    auto exit_code = process::wait_exit(*pid);
    if (!exit_code) {
      return fail(exit_code.error());
    }
    if (*exit_code != 0) {
      log::warn("'{}' exited with status {}", command, *exit_code);
      return fail(Error::CommandFailed);
    }
    return ok();
  }

private:
  std::string work_dir_;
};

}  // namespace

auto create_shell_runner(std::string work_dir)
    -> std::unique_ptr<ICommandRunner> {
  return std::make_unique<ShellCommandRunner>(std::move(work_dir));
}

}  // namespace polywatch
