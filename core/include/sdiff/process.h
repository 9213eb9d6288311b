#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sdiff {

struct ProcessOptions {
  std::filesystem::path cwd;
  // 0 waits indefinitely.
  int timeout_seconds = 0;
};

struct ProcessResult {
  bool started = false;
  int exit_code = -1;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
  std::string error;

  bool ok() const { return started && !timed_out && error.empty() && exit_code == 0; }
};

constexpr int kExitExecFailed = 127;
constexpr int kExitTimedOut = 124;

// Blocks until the child exits or the timeout kills it. Signalled children
// report 128 + signal number.
ProcessResult run_process(const std::vector<std::string>& args, const ProcessOptions& options);

std::string format_command(const std::vector<std::string>& args);

} // namespace sdiff
