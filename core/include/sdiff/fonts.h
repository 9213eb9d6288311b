#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sdiff::fonts {

const std::vector<std::filesystem::path>& default_font_candidates();

std::optional<std::filesystem::path> pick_default_font(const std::vector<std::filesystem::path>& candidates,
                                                       std::string& error);

// Copies `font` into <root>/<scratch_dir>/fonts/ unless a file of the same
// name is already there, and returns the staged path relative to `root`.
std::optional<std::filesystem::path> stage_font(const std::filesystem::path& root,
                                                const std::filesystem::path& scratch_dir,
                                                const std::filesystem::path& font,
                                                std::string& error);

} // namespace sdiff::fonts
