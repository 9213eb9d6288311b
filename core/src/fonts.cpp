#include "sdiff/fonts.h"

#include "sdiff/log.h"

#include <system_error>

namespace sdiff::fonts {

namespace fs = std::filesystem;

const std::vector<fs::path>& default_font_candidates() {
  static const std::vector<fs::path> kCandidates = {
      "/System/Library/Fonts/Supplemental/Arial.ttf",
      "/System/Library/Fonts/Supplemental/Times New Roman.ttf",
      "/System/Library/Fonts/Geneva.ttf",
      "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
      "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
  };
  return kCandidates;
}

std::optional<fs::path> pick_default_font(const std::vector<fs::path>& candidates, std::string& error) {
  error.clear();
  for (const auto& candidate : candidates) {
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && !ec) {
      return candidate;
    }
  }
  error = "No default font found. Please pass --font /path/to/font.(ttf|otf|ttc)";
  return std::nullopt;
}

std::optional<fs::path> stage_font(const fs::path& root,
                                   const fs::path& scratch_dir,
                                   const fs::path& font,
                                   std::string& error) {
  error.clear();
  std::error_code ec;
  if (!fs::is_regular_file(font, ec) || ec) {
    error = "font not found: " + font.string();
    return std::nullopt;
  }

  const fs::path fonts_dir = root / scratch_dir / "fonts";
  fs::create_directories(fonts_dir, ec);
  if (ec) {
    error = "cannot create " + fonts_dir.string() + ": " + ec.message();
    return std::nullopt;
  }

  const fs::path staged = fonts_dir / font.filename();
  if (fs::exists(staged, ec)) {
    log::info("reusing staged font: " + staged.string());
  } else {
    // Bytes only; some system fonts carry attributes that refuse to copy.
    fs::copy_file(font, staged, fs::copy_options::none, ec);
    if (ec) {
      error = "cannot stage font " + font.string() + ": " + ec.message();
      return std::nullopt;
    }
    log::info("staged font: " + staged.string());
  }

  return scratch_dir / "fonts" / font.filename();
}

} // namespace sdiff::fonts
