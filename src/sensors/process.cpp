#include "sensors/process.hpp"

#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

namespace asset_agent::sensors {

namespace {
constexpr std::size_t kMaxOutputBytes = 64 * 1024;
}

bool run_process(const std::vector<std::string>& argv, const std::chrono::milliseconds timeout,
                 ProcessResult& result) noexcept {
  result = ProcessResult{};
  if (argv.empty()) {
    return false;
  }

  std::vector<char*> args;
  try {
    args.reserve(argv.size() + 1);
    for (const std::string& arg : argv) {
      args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
  } catch (const std::bad_alloc&) {
    return false;
  }

  int pipe_fds[2]{};
  if (pipe(pipe_fds) != 0) {
    return false;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    return false;
  }

  if (pid == 0) {
    close(pipe_fds[0]);
    dup2(pipe_fds[1], STDOUT_FILENO);
    close(pipe_fds[1]);
    execvp(args[0], args.data());
    _exit(127);
  }

  close(pipe_fds[1]);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char chunk[1024]{};
  pollfd pfd{};
  pfd.fd = pipe_fds[0];
  pfd.events = POLLIN;

  while (true) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) {
      result.timed_out = true;
      break;
    }
    const int ready = poll(&pfd, 1, static_cast<int>(left));
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    if (ready <= 0) {
      result.timed_out = ready == 0;
      break;
    }

    const ssize_t bytes_read = ::read(pipe_fds[0], chunk, sizeof(chunk));
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read <= 0) {
      break;
    }
    if (result.output.size() < kMaxOutputBytes) {
      try {
        result.output.append(chunk, static_cast<std::size_t>(bytes_read));
      } catch (const std::bad_alloc&) {
        break;
      }
    }
  }

  close(pipe_fds[0]);
  if (result.timed_out) {
    kill(pid, SIGKILL);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return true;
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return true;
}

}  // namespace asset_agent::sensors
