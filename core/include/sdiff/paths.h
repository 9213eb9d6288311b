#pragma once

#include <filesystem>
#include <optional>

namespace sdiff {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path config_file;
};

// Relative paths are taken against `root`; absolute ones are kept.
std::filesystem::path resolve_under_root(const std::filesystem::path& root, const std::filesystem::path& path);

// Root precedence: explicit override, SDIFF_ROOT, current directory.
ResolvedPaths resolve_paths(const std::optional<std::filesystem::path>& root_override,
                            const std::optional<std::filesystem::path>& config_override);

} // namespace sdiff
