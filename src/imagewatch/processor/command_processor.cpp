#include "imagewatch/processor/command_processor.hpp"

#include "imagewatch/core/constants.hpp"
#include "imagewatch/core/event_loop.hpp"
#include "imagewatch/util/log.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace imagewatch {

namespace {

[[nodiscard]] auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto spawn_shell_command(const std::string& cmd, const std::string& arg)
    -> pid_t {
  pid_t pid = vfork();
  if (pid < 0) {
    return -1;
  }
  if (pid == 0) {
    setpgid(0, 0);
    execl("/bin/sh", "sh", "-c", cmd.c_str(), "imagewatch", arg.c_str(),
          nullptr);
    _exit(127);
  }
  setpgid(pid, pid);
  return pid;
}

auto kill_and_reap(pid_t pid) -> void {
  kill(-pid, SIGKILL);
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

auto run_command(std::string command, std::chrono::seconds timeout,
                 std::string path) -> task<Result<void>> {
  pid_t pid = spawn_shell_command(command, path);
  if (pid < 0) {
    log::error("Failed to spawn processor for {}: {}", path, strerror(errno));
    co_return fail(Error::ProcessingFailed);
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  int status = 0;
  while (true) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      break;
    }
    if (r < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::error("waitpid failed for pid {}: {}", pid, strerror(errno));
      co_return fail(Error::ProcessingFailed);
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      kill_and_reap(pid);
      log::warn("Processor for {} timed out after {}s", path, timeout.count());
      co_return fail(Error::Timeout);
    }

    auto slept = co_await async_sleep(timing::kChildPollInterval);
    if (!slept) {
      kill_and_reap(pid);
      co_return fail(slept.error());
    }
  }

  if (int code = get_exit_code(status); code != 0) {
    log::warn("Processor for {} exited with code {}", path, code);
    co_return fail(Error::ProcessingFailed);
  }
  co_return ok();
}

}  // namespace

auto make_command_processor(std::string command, std::chrono::seconds timeout)
    -> FileProcessor {
  return [command = std::move(command), timeout](std::string path) {
    return run_command(command, timeout, std::move(path));
  };
}

auto make_logging_processor() -> FileProcessor {
  return [](std::string path) -> task<Result<void>> {
    log::info("New image ready: {}", path);
    co_return ok();
  };
}

auto make_processor(const ProcessorConfig& config) -> FileProcessor {
  if (config.command.empty()) {
    return make_logging_processor();
  }
  return make_command_processor(config.command, config.timeout);
}

}  // namespace imagewatch
