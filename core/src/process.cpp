#include "sdiff/process.h"

#include <chrono>
#include <cstring>

#if defined(_WIN32)
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace sdiff {

#if !defined(_WIN32)
namespace {
void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Returns false once the stream hit EOF or failed.
bool drain(int fd, std::string& out) {
  char buffer[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out.append(buffer, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}
} // namespace
#endif

ProcessResult run_process(const std::vector<std::string>& args, const ProcessOptions& options) {
  ProcessResult result;
#if defined(_WIN32)
  (void)args;
  (void)options;
  result.error = "process runner not implemented on Windows";
  return result;
#else
  if (args.empty()) {
    result.error = "missing command";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe(out_pipe) != 0) {
    result.error = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }
  if (::pipe(err_pipe) != 0) {
    result.error = std::string("pipe failed: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return result;
  }

  std::vector<char*> cargs;
  cargs.reserve(args.size() + 1);
  for (const auto& arg : args) {
    cargs.push_back(const_cast<char*>(arg.c_str()));
  }
  cargs.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid == 0) {
    if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) != 0) {
      _exit(kExitExecFailed);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    ::execvp(cargs[0], cargs.data());
    _exit(kExitExecFailed);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  if (pid < 0) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    return result;
  }
  result.started = true;

  ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
  ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

  using steady = std::chrono::steady_clock;
  const bool has_deadline = options.timeout_seconds > 0;
  const auto deadline = steady::now() + std::chrono::seconds(options.timeout_seconds);

  while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    int wait_ms = -1;
    if (has_deadline) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady::now()).count();
      if (left <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left);
    }

    pollfd fds[2];
    nfds_t count = 0;
    if (out_pipe[0] >= 0) fds[count++] = pollfd{out_pipe[0], POLLIN, 0};
    if (err_pipe[0] >= 0) fds[count++] = pollfd{err_pipe[0], POLLIN, 0};

    const int ready = ::poll(fds, count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      result.error = std::string("poll failed: ") + std::strerror(errno);
      break;
    }
    if (ready == 0) continue;

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;
      if (fds[i].fd == out_pipe[0]) {
        if (!drain(out_pipe[0], result.stdout_text)) close_fd(out_pipe[0]);
      } else {
        if (!drain(err_pipe[0], result.stderr_text)) close_fd(err_pipe[0]);
      }
    }
  }

  if (result.timed_out || !result.error.empty()) {
    ::kill(pid, SIGKILL);
  }
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  // The child may close both streams and keep running; the deadline still
  // applies until it is reaped.
  int status = 0;
  pid_t waited = -1;
  bool killed = result.timed_out || !result.error.empty();
  for (;;) {
    waited = ::waitpid(pid, &status, killed || !has_deadline ? 0 : WNOHANG);
    if (waited < 0 && errno == EINTR) continue;
    if (waited != 0) break;
    if (steady::now() >= deadline) {
      result.timed_out = true;
      ::kill(pid, SIGKILL);
      killed = true;
      continue;
    }
    ::usleep(10 * 1000);
  }

  if (result.timed_out) {
    result.exit_code = kExitTimedOut;
    result.error = "timed out after " + std::to_string(options.timeout_seconds) + "s";
  } else if (waited == pid) {
    result.exit_code = decode_status(status);
  }
  return result;
#endif
}

std::string format_command(const std::vector<std::string>& args) {
  std::string out;
  for (const auto& arg : args) {
    if (!out.empty()) out += ' ';
    const bool needs_quotes = arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos;
    if (needs_quotes) {
      out += '\'';
      for (char c : arg) {
        if (c == '\'') {
          out += "'\\''";
        } else {
          out += c;
        }
      }
      out += '\'';
    } else {
      out += arg;
    }
  }
  return out;
}

} // namespace sdiff
