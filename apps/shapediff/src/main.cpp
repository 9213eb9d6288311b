#include "sdiff/config.h"
#include "sdiff/fonts.h"
#include "sdiff/log.h"
#include "sdiff/paths.h"
#include "sdiff/producer.h"
#include "sdiff/suite.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct CliOptions {
  std::optional<fs::path> root;
  std::optional<fs::path> config;
  std::optional<fs::path> font;
  std::vector<std::string> texts;
  std::optional<double> size;
  std::optional<double> tolerance;
  std::optional<int> timeout_seconds;
  std::optional<fs::path> report;
  std::optional<fs::path> log_dir;
  bool quiet = false;
  bool exact_integers = false;
  bool dump = false;
  bool help = false;
};

void print_usage() {
  std::cout << "Usage:\n"
            << "  shapediff [--font <path>] [--text <text>]... [--size <n>] [--tol <n>] [--dump]\n"
            << "            [--root <dir>] [--config <file>] [--timeout-seconds <n>]\n"
            << "            [--exact-integers] [--report <file>] [--log-dir <dir>] [--quiet]\n"
            << "\n"
            << "Diffs the reference shaping engine against the candidate build, one case per --text.\n"
            << "Defaults: size 14, tol 0.02, texts 'abc' 'Hello, world!' 'AV'.\n";
}

bool parse_number(const std::string& flag, const char* text, double& out) {
  char* end = nullptr;
  out = std::strtod(text, &end);
  if (end == text || *end != '\0') {
    std::cerr << "invalid number for " << flag << ": " << text << "\n";
    return false;
  }
  return true;
}

bool parse_args(int argc, char** argv, CliOptions& opts) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--help" || arg == "-h") {
      opts.help = true;
    } else if (arg == "--root" && has_value) {
      opts.root = fs::path(argv[++i]);
    } else if (arg == "--config" && has_value) {
      opts.config = fs::path(argv[++i]);
    } else if (arg == "--font" && has_value) {
      opts.font = fs::path(argv[++i]);
    } else if (arg == "--text" && has_value) {
      opts.texts.emplace_back(argv[++i]);
    } else if (arg == "--size" && has_value) {
      double value = 0.0;
      if (!parse_number(arg, argv[++i], value)) return false;
      opts.size = value;
    } else if (arg == "--tol" && has_value) {
      double value = 0.0;
      if (!parse_number(arg, argv[++i], value)) return false;
      opts.tolerance = value;
    } else if (arg == "--timeout-seconds" && has_value) {
      int seconds = 0;
      std::string error;
      if (!sdiff::parse_timeout_seconds(argv[++i], seconds, error)) {
        std::cerr << error << "\n";
        return false;
      }
      opts.timeout_seconds = seconds;
    } else if (arg == "--report" && has_value) {
      opts.report = fs::path(argv[++i]);
    } else if (arg == "--log-dir" && has_value) {
      opts.log_dir = fs::path(argv[++i]);
    } else if (arg == "--quiet") {
      opts.quiet = true;
    } else if (arg == "--exact-integers") {
      opts.exact_integers = true;
    } else if (arg == "--dump") {
      opts.dump = true;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      return false;
    }
  }
  return true;
}

void apply_cli(const CliOptions& cli, sdiff::DiffConfig& cfg) {
  if (!cli.texts.empty()) cfg.texts = cli.texts;
  if (cli.size) cfg.size = *cli.size;
  if (cli.tolerance) cfg.tolerance = *cli.tolerance;
  if (cli.timeout_seconds) cfg.timeout_seconds = *cli.timeout_seconds;
  if (cli.exact_integers) cfg.exact_integers = true;
  if (cli.dump) cfg.dump = true;
  if (cli.log_dir) cfg.log_dir = *cli.log_dir;
}

} // namespace

int main(int argc, char** argv) {
  CliOptions cli;
  if (!parse_args(argc, argv, cli)) {
    print_usage();
    return 1;
  }
  if (cli.help) {
    print_usage();
    return 0;
  }

  sdiff::log::set_echo(!cli.quiet);
  const auto paths = sdiff::resolve_paths(cli.root, cli.config);

  sdiff::DiffConfig cfg;
  std::string error;
  if (!sdiff::load_diff_config(paths.config_file, cfg, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  apply_cli(cli, cfg);
  if (!sdiff::validate_diff_config(cfg, error)) {
    std::cerr << error << "\n";
    return 1;
  }

  const fs::path log_dir = cfg.log_dir.empty() ? fs::path() : sdiff::resolve_under_root(paths.root, cfg.log_dir);
  sdiff::log::init("shapediff", log_dir);
  sdiff::log::install_crash_handlers();

  fs::path font;
  if (cli.font.has_value()) {
    font = cli.font.value();
  } else {
    const auto picked = sdiff::fonts::pick_default_font(sdiff::fonts::default_font_candidates(), error);
    if (!picked.has_value()) {
      std::cerr << error << "\n";
      sdiff::log::shutdown();
      return 1;
    }
    font = picked.value();
  }

  const auto staged = sdiff::fonts::stage_font(paths.root, cfg.scratch_dir, font, error);
  if (!staged.has_value()) {
    std::cerr << error << "\n";
    sdiff::log::shutdown();
    return 1;
  }

  sdiff::ReferenceProducerOptions ref_opts;
  ref_opts.root = paths.root;
  ref_opts.checkout_dir = cfg.reference.dir;
  ref_opts.bin = cfg.reference.bin;
  ref_opts.timeout_seconds = cfg.timeout_seconds;
  sdiff::ReferenceProducer reference(ref_opts);

  sdiff::CandidateProducerOptions cand_opts;
  cand_opts.root = paths.root;
  cand_opts.project_dir = cfg.candidate.dir;
  cand_opts.artifact = cfg.candidate.artifact;
  cand_opts.shim = cfg.candidate.shim;
  cand_opts.timeout_seconds = cfg.timeout_seconds;
  sdiff::CandidateProducer candidate(cand_opts);

  sdiff::SuiteOptions suite;
  suite.font = staged.value();
  suite.font_label = font.string();
  suite.texts = cfg.texts;
  suite.size = cfg.size;
  suite.compare.tolerance = cfg.tolerance;
  suite.compare.exact_integers = cfg.exact_integers;
  suite.dump = cfg.dump;

  const sdiff::SuiteResult result = sdiff::run_suite(suite, reference, candidate, std::cout, std::cerr);

  if (cli.report.has_value()) {
    if (!sdiff::write_suite_report(cli.report.value(), suite, result, error)) {
      sdiff::log::warn(error);
    }
  }

  sdiff::log::shutdown();
  return result.exit_code;
}
