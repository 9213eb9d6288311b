#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sdiff {

struct DiffConfig {
  struct ReferenceConfig {
    std::filesystem::path dir = "swash-reference";
    std::string bin = "dump_json";
  };

  struct CandidateConfig {
    std::filesystem::path dir = "tools/moon_swash_dump";
    std::filesystem::path artifact = "target/wasm/release/build/moon_swash_dump.wasm";
    std::filesystem::path shim = "spectest.wasm";
  };

  ReferenceConfig reference;
  CandidateConfig candidate;
  // Root-relative; producers only see paths under the root.
  std::filesystem::path scratch_dir = ".tmp";
  // Empty keeps logging on stderr only.
  std::filesystem::path log_dir;
  double size = 14.0;
  double tolerance = 0.02;
  std::vector<std::string> texts = {"abc", "Hello, world!", "AV"};
  int timeout_seconds = 0;
  bool dump = false;
  bool exact_integers = false;
};

// Missing file leaves `cfg` at its defaults. Malformed files and invalid
// values fail with `error` set.
bool load_diff_config(const std::filesystem::path& path, DiffConfig& cfg, std::string& error);

bool validate_diff_config(const DiffConfig& cfg, std::string& error);

// Whole seconds in [0, kMaxTimeoutSeconds]; rejects fractions and junk.
constexpr long kMaxTimeoutSeconds = 24L * 60 * 60;
bool parse_timeout_seconds(const std::string& text, int& out, std::string& error);

} // namespace sdiff
