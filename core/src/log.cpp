#include "sdiff/log.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <ctime>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>
#include <utility>

namespace sdiff::log {

namespace {
constexpr size_t kTailMax = 200;

struct LogState {
  std::mutex mutex;
  std::ofstream file;
  std::deque<std::string> tail;
  std::string app = "shapediff";
  bool echo = true;
};

LogState& state() {
  static LogState s;
  return s;
}

std::string stamp(const char* pattern) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[32];
  const size_t n = std::strftime(buf, sizeof(buf), pattern, &tm);
  return std::string(buf, n);
}

void write(const char* level, std::string_view msg) {
  LogState& s = state();
  std::string line = "[" + stamp("%Y-%m-%d %H:%M:%S") + "][" + level + "] ";
  line.append(msg.data(), msg.size());

  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.echo) {
    std::cerr << line << '\n';
  }
  if (s.file.is_open()) {
    s.file << line << '\n';
    s.file.flush();
  }
  s.tail.push_back(std::move(line));
  while (s.tail.size() > kTailMax) {
    s.tail.pop_front();
  }
}

void on_crash(int sig) {
  write("ERROR", "crash signal: " + std::to_string(sig));
  std::_Exit(1);
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  LogState& s = state();
  std::string open_error;
  {
    std::lock_guard<std::mutex> lock(s.mutex);
    s.app = app_name;
    if (s.file.is_open()) {
      s.file.close();
    }
    if (!log_dir.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(log_dir, ec);
      const auto path = log_dir / (s.app + "_" + stamp("%Y%m%d_%H%M%S") + ".log");
      if (!ec) {
        s.file.open(path, std::ios::out | std::ios::app);
      }
      if (ec || !s.file.is_open()) {
        open_error = "log file unavailable: " + path.string();
      }
    }
  }
  write("INFO", app_name + " log init");
  if (!open_error.empty()) {
    write("WARN", open_error);
  }
}

void shutdown() {
  write("INFO", "log shutdown");
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.file.is_open()) {
    s.file.close();
  }
}

void set_echo(bool enabled) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.echo = enabled;
}

void info(std::string_view msg) { write("INFO", msg); }
void warn(std::string_view msg) { write("WARN", msg); }
void error(std::string_view msg) { write("ERROR", msg); }

std::vector<std::string> recent(size_t max_entries) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  const size_t count = std::min(max_entries, s.tail.size());
  return std::vector<std::string>(s.tail.end() - count, s.tail.end());
}

void install_crash_handlers() {
  for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGILL}) {
    std::signal(sig, on_crash);
  }
}

} // namespace sdiff::log
