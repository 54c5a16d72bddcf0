#pragma once

#include "polywatch/core/error.hpp"

#include <sys/types.h>

#include <string_view>

namespace polywatch::process {

// Starts `/bin/sh -c command` as the leader of a new process group. The
// child reads stdin from /dev/null and inherits stdout and stderr. Returns
// once exec has succeeded;
// an exec failure comes back as Error::SpawnFailed instead of a child that
// exits 127.
[[nodiscard]] auto spawn_shell(std::string_view command,
                               std::string_view work_dir) -> Result<pid_t>;

// Blocks until pid exits and returns its exit code. Death by signal maps to
// 128 + signal number.
[[nodiscard]] auto wait_exit(pid_t pid) -> Result<int>;

// Blocks until pid has exited but leaves it a zombie, so its pid and
// process group id stay reserved until wait_exit reaps it.
[[nodiscard]] auto await_exit(pid_t pid) -> Result<void>;

// SIGKILL to the whole process group led by pid. Errors are ignored: the
// group may already be gone.
auto kill_group(pid_t pid) noexcept -> void;

[[nodiscard]] auto exit_code_of(int status) noexcept -> int;

}  // namespace polywatch::process
