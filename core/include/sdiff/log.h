#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sdiff::log {

// Lines go to stderr (stdout belongs to case acknowledgments) and to a
// bounded in-memory tail. `log_dir` empty means no log file is written.
void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();
void install_crash_handlers();

void set_echo(bool enabled);

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace sdiff::log
