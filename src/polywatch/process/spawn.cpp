#include "polywatch/process/spawn.hpp"

#include "polywatch/core/constants.hpp"
#include "polywatch/util/log.hpp"

#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace polywatch::process {

namespace {

auto create_status_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

// Reads the errno a failed exec wrote. EOF means exec went through and the
// close-on-exec write end vanished with it.
auto read_exec_errno(int fd) -> int {
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

}  // namespace

auto spawn_shell(std::string_view command, std::string_view work_dir)
    -> Result<pid_t> {
  std::string cmd{command};
  std::string dir{work_dir};

  auto [status_read, status_write] = create_status_pipe();
  if (status_read < 0) {
    log::error("Failed to create status pipe: {}", strerror(errno));
    return fail(Error::SpawnFailed);
  }

  int null_in = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_in < 0) {
    log::error("Failed to open /dev/null: {}", strerror(errno));
    close(status_read);
    close(status_write);
    return fail(Error::SpawnFailed);
  }

  pid_t pid = vfork();
  if (pid < 0) {
    log::error("Failed to fork: {}", strerror(errno));
    close(null_in);
    close(status_read);
    close(status_write);
    return fail(Error::SpawnFailed);
  }

  if (pid == 0) {
    // Child process - must only use async-signal-safe functions
    setpgid(0, 0);

    // A background group reading the terminal would be stopped by SIGTTIN.
    if (dup2(null_in, STDIN_FILENO) < 0) {
      int err = errno;
      (void)write(status_write, &err, sizeof(err));
      _exit(shell::kExecFailedStatus);
    }

    if (!dir.empty() && chdir(dir.c_str()) < 0) {
      int err = errno;
      (void)write(status_write, &err, sizeof(err));
      _exit(shell::kExecFailedStatus);
    }

    execl(shell::kPath, shell::kArgv0, "-c", cmd.c_str(), nullptr);
    int err = errno;
    (void)write(status_write, &err, sizeof(err));
    _exit(shell::kExecFailedStatus);
  }

  close(null_in);
  close(status_write);
  setpgid(pid, pid);

  int child_errno = read_exec_errno(status_read);
  close(status_read);

  if (child_errno != 0) {
    log::error("Failed to start '{}': {}", command, strerror(child_errno));
    int status = 0;
    waitpid(pid, &status, 0);
    return fail(Error::SpawnFailed);
  }

  return ok(pid);
}

auto wait_exit(pid_t pid) -> Result<int> {
  int status = 0;
  pid_t r = 0;
  do {
    r = waitpid(pid, &status, 0);
  } while (r < 0 && errno == EINTR);

  if (r < 0) {
    int err = errno;
    log::warn("waitpid failed for pid {}: {}", pid, strerror(err));
    return fail(std::error_code{err, std::generic_category()});
  }
  return ok(exit_code_of(status));
}

auto await_exit(pid_t pid) -> Result<void> {
  siginfo_t info{};
  int r = 0;
  do {
    r = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
  } while (r < 0 && errno == EINTR);

  if (r < 0) {
    int err = errno;
    log::warn("waitid failed for pid {}: {}", pid, strerror(err));
    return fail(std::error_code{err, std::generic_category()});
  }
  return ok();
}

auto kill_group(pid_t pid) noexcept -> void {
  if (pid > 0) {
    kill(-pid, SIGKILL);
  }
}

auto exit_code_of(int status) noexcept -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace polywatch::process
