#include "sdiff/paths.h"

#include "sdiff/log.h"

#include <cstdlib>
#include <system_error>

namespace sdiff {

namespace {
std::filesystem::path absolute_or_self(const std::filesystem::path& path) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(path, ec);
  return ec ? path : abs.lexically_normal();
}

std::filesystem::path find_config_in(const std::filesystem::path& root) {
  for (const char* name : {"shapediff.yaml", "shapediff.yml", "shapediff.json"}) {
    const auto candidate = root / name;
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
  return {};
}
} // namespace

std::filesystem::path resolve_under_root(const std::filesystem::path& root, const std::filesystem::path& path) {
  return path.is_absolute() ? path : root / path;
}

ResolvedPaths resolve_paths(const std::optional<std::filesystem::path>& root_override,
                            const std::optional<std::filesystem::path>& config_override) {
  ResolvedPaths out;
  if (root_override.has_value()) {
    out.root = absolute_or_self(root_override.value());
  } else if (const char* env_root = std::getenv("SDIFF_ROOT")) {
    out.root = absolute_or_self(env_root);
  } else {
    std::error_code ec;
    out.root = std::filesystem::current_path(ec);
  }

  if (config_override.has_value()) {
    out.config_file = resolve_under_root(out.root, config_override.value());
  } else {
    out.config_file = find_config_in(out.root);
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(out.root, ec)) {
    log::warn(std::string("root path not found: ") + out.root.string());
  }
  return out;
}

} // namespace sdiff
