#pragma once

#include "polywatch/core/error.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace polywatch {

class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  // Runs command to completion. An empty command succeeds without spawning.
  virtual auto run(std::string_view command) -> Result<void> = 0;
};

// Runs commands through /bin/sh with the caller's stdout and stderr, in
// work_dir when it is non-empty. No timeout.
[[nodiscard]] auto create_shell_runner(std::string work_dir = {})
    -> std::unique_ptr<ICommandRunner>;

}  // namespace polywatch
