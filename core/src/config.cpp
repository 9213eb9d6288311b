#include "sdiff/config.h"

#include "sdiff/log.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>

#include <nlohmann/json.hpp>

#if SDIFF_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace sdiff {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct ConfigFields {
  std::optional<std::string> reference_dir;
  std::optional<std::string> reference_bin;
  std::optional<std::string> candidate_dir;
  std::optional<std::string> candidate_artifact;
  std::optional<std::string> candidate_shim;
  std::optional<std::string> scratch_dir;
  std::optional<std::string> log_dir;
  std::optional<double> size;
  std::optional<double> tolerance;
  std::vector<std::string> texts;
  std::optional<int> timeout_seconds;
  std::optional<bool> dump;
  std::optional<bool> exact_integers;
};

void apply_fields(DiffConfig& cfg, const ConfigFields& f) {
  if (f.reference_dir) cfg.reference.dir = *f.reference_dir;
  if (f.reference_bin) cfg.reference.bin = *f.reference_bin;
  if (f.candidate_dir) cfg.candidate.dir = *f.candidate_dir;
  if (f.candidate_artifact) cfg.candidate.artifact = *f.candidate_artifact;
  if (f.candidate_shim) cfg.candidate.shim = *f.candidate_shim;
  if (f.scratch_dir) cfg.scratch_dir = *f.scratch_dir;
  if (f.log_dir) cfg.log_dir = *f.log_dir;
  if (f.size) cfg.size = *f.size;
  if (f.tolerance) cfg.tolerance = *f.tolerance;
  if (!f.texts.empty()) cfg.texts = f.texts;
  if (f.timeout_seconds) cfg.timeout_seconds = *f.timeout_seconds;
  if (f.dump) cfg.dump = *f.dump;
  if (f.exact_integers) cfg.exact_integers = *f.exact_integers;
}

ConfigFields read_json_fields(const nlohmann::json& j) {
  const auto& root = j.contains("shapediff") ? j["shapediff"] : j;
  ConfigFields f;
  if (root.contains("reference")) {
    const auto& ref = root["reference"];
    if (ref.contains("dir")) f.reference_dir = ref["dir"].get<std::string>();
    if (ref.contains("bin")) f.reference_bin = ref["bin"].get<std::string>();
  }
  if (root.contains("candidate")) {
    const auto& cand = root["candidate"];
    if (cand.contains("dir")) f.candidate_dir = cand["dir"].get<std::string>();
    if (cand.contains("artifact")) f.candidate_artifact = cand["artifact"].get<std::string>();
    if (cand.contains("shim")) f.candidate_shim = cand["shim"].get<std::string>();
  }
  if (root.contains("scratch_dir")) f.scratch_dir = root["scratch_dir"].get<std::string>();
  if (root.contains("log_dir")) f.log_dir = root["log_dir"].get<std::string>();
  if (root.contains("size")) f.size = root["size"].get<double>();
  if (root.contains("tolerance")) f.tolerance = root["tolerance"].get<double>();
  if (root.contains("texts") && root["texts"].is_array()) {
    for (const auto& v : root["texts"]) {
      f.texts.push_back(v.get<std::string>());
    }
  }
  if (root.contains("timeout_seconds")) f.timeout_seconds = root["timeout_seconds"].get<int>();
  if (root.contains("dump")) f.dump = root["dump"].get<bool>();
  if (root.contains("exact_integers")) f.exact_integers = root["exact_integers"].get<bool>();
  return f;
}

#if SDIFF_ENABLE_DATA_YAML
ConfigFields read_yaml_fields(const YAML::Node& doc) {
  const YAML::Node root = doc["shapediff"] ? doc["shapediff"] : doc;
  ConfigFields f;
  if (root["reference"]) {
    const YAML::Node ref = root["reference"];
    if (ref["dir"]) f.reference_dir = ref["dir"].as<std::string>();
    if (ref["bin"]) f.reference_bin = ref["bin"].as<std::string>();
  }
  if (root["candidate"]) {
    const YAML::Node cand = root["candidate"];
    if (cand["dir"]) f.candidate_dir = cand["dir"].as<std::string>();
    if (cand["artifact"]) f.candidate_artifact = cand["artifact"].as<std::string>();
    if (cand["shim"]) f.candidate_shim = cand["shim"].as<std::string>();
  }
  if (root["scratch_dir"]) f.scratch_dir = root["scratch_dir"].as<std::string>();
  if (root["log_dir"]) f.log_dir = root["log_dir"].as<std::string>();
  if (root["size"]) f.size = root["size"].as<double>();
  if (root["tolerance"]) f.tolerance = root["tolerance"].as<double>();
  if (root["texts"]) {
    for (const auto& v : root["texts"]) {
      f.texts.push_back(v.as<std::string>());
    }
  }
  if (root["timeout_seconds"]) f.timeout_seconds = root["timeout_seconds"].as<int>();
  if (root["dump"]) f.dump = root["dump"].as<bool>();
  if (root["exact_integers"]) f.exact_integers = root["exact_integers"].as<bool>();
  return f;
}
#endif
} // namespace

bool load_diff_config(const std::filesystem::path& path, DiffConfig& cfg, std::string& error) {
  error.clear();
  if (path.empty()) {
    return true;
  }
  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return true;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    std::ifstream in(path);
    if (!in) {
      error = "config read failed: " + path.string();
      return false;
    }
    try {
      nlohmann::json j;
      in >> j;
      apply_fields(cfg, read_json_fields(j));
    } catch (const nlohmann::json::exception& e) {
      error = "config parse failed: " + path.string() + ": " + e.what();
      return false;
    }
    return validate_diff_config(cfg, error);
  }

  if (ext == ".yaml" || ext == ".yml") {
#if SDIFF_ENABLE_DATA_YAML
    try {
      apply_fields(cfg, read_yaml_fields(YAML::LoadFile(path.string())));
    } catch (const YAML::Exception& e) {
      error = "config parse failed: " + path.string() + ": " + e.what();
      return false;
    }
    return validate_diff_config(cfg, error);
#else
    log::warn("YAML config requested but YAML support is disabled.");
    return true;
#endif
  }

  log::warn("Unknown config extension; using defaults.");
  return true;
}

bool validate_diff_config(const DiffConfig& cfg, std::string& error) {
  if (!std::isfinite(cfg.tolerance) || cfg.tolerance < 0.0) {
    error = "tolerance must be a finite non-negative number";
    return false;
  }
  if (!std::isfinite(cfg.size) || cfg.size <= 0.0) {
    error = "size must be a finite positive number";
    return false;
  }
  if (cfg.timeout_seconds < 0) {
    error = "timeout_seconds must not be negative";
    return false;
  }
  if (cfg.scratch_dir.empty() || cfg.scratch_dir.is_absolute()) {
    error = "scratch_dir must be relative to the root: " + cfg.scratch_dir.string();
    return false;
  }
  if (cfg.texts.empty()) {
    error = "no texts to shape";
    return false;
  }
  return true;
}

bool parse_timeout_seconds(const std::string& text, int& out, std::string& error) {
  errno = 0;
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || end == text.c_str() || *end != '\0' || errno == ERANGE) {
    error = "invalid timeout seconds: " + text;
    return false;
  }
  if (value < 0 || value > kMaxTimeoutSeconds) {
    error = "timeout seconds out of range [0, " + std::to_string(kMaxTimeoutSeconds) + "]: " + text;
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

} // namespace sdiff
