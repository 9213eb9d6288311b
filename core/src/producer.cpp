#include "sdiff/producer.h"

#include "sdiff/log.h"

#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>

namespace sdiff {

namespace fs = std::filesystem;

namespace {
void append_section(std::string& out, const char* label, const std::string& text) {
  if (text.empty()) return;
  out += label;
  out += ":\n";
  out += text;
  if (text.back() != '\n') out += '\n';
}

bool path_exists(const fs::path& path) {
  std::error_code ec;
  return fs::exists(path, ec) && !ec;
}

bool missing_artifact(const std::string& what, const fs::path& path, ProcessFailure& failure) {
  failure = ProcessFailure{};
  failure.what = what + " not found at " + path.string();
  failure.exit_code = 1;
  return false;
}
} // namespace

std::string ProcessFailure::describe() const {
  std::string out = what;
  if (!process_ran) {
    out += "\n";
    return out;
  }
  if (timed_out) {
    out += " timed out (exit=" + std::to_string(exit_code) + ")\n";
  } else {
    out += " failed (exit=" + std::to_string(exit_code) + ")\n";
  }
  append_section(out, "stdout", stdout_text);
  append_section(out, "stderr", stderr_text);
  return out;
}

std::string format_decimal(double value) {
  char buffer[64];
  const auto res = std::to_chars(buffer, buffer + sizeof(buffer), value);
  std::string out = res.ec == std::errc() ? std::string(buffer, res.ptr) : std::to_string(value);
  if (out.find_first_of(".eEn") == std::string::npos) {
    out += ".0";
  }
  return out;
}

std::string trim_trailing_whitespace(std::string value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.pop_back();
  }
  return value;
}

std::vector<std::string> case_arguments(const ShapeCase& shape_case) {
  return {shape_case.font.generic_string(), shape_case.text, format_decimal(shape_case.size)};
}

bool failure_from_process(const ProcessResult& result, const std::string& what, ProcessFailure& failure) {
  if (result.ok()) return false;
  failure = ProcessFailure{};
  failure.what = what;
  failure.process_ran = true;
  failure.timed_out = result.timed_out;
  failure.stdout_text = result.stdout_text;
  failure.stderr_text = result.stderr_text;
  if (!result.started) {
    failure.exit_code = 1;
    failure.stderr_text += result.error;
  } else {
    // A non-zero status passes through; a child that somehow reports 0 here
    // still has to fail the run.
    failure.exit_code = result.exit_code > 0 ? result.exit_code : 1;
    if (!result.timed_out && !result.error.empty()) {
      failure.stderr_text += result.error;
    }
  }
  return true;
}

ReferenceProducer::ReferenceProducer(ReferenceProducerOptions options) : options_(std::move(options)) {}

bool ReferenceProducer::check_checkout(ProcessFailure& failure) const {
  const fs::path manifest = options_.root / options_.checkout_dir / "Cargo.toml";
  if (path_exists(manifest)) return true;
  failure = ProcessFailure{};
  failure.what = options_.checkout_dir.generic_string() + " not found at ./" +
                 options_.checkout_dir.generic_string() + ".\n" +
                 "Place a checkout of the reference implementation there to run this verifier.";
  failure.exit_code = 1;
  return false;
}

bool ReferenceProducer::prepare(ProcessFailure& failure) {
  if (prepared_) return true;
  if (!check_checkout(failure)) return false;
  prepared_ = true;
  return true;
}

std::vector<std::string> ReferenceProducer::command_for(const ShapeCase& shape_case) const {
  std::vector<std::string> args = {
      "cargo",
      "run",
      "--quiet",
      "--manifest-path",
      (options_.root / options_.checkout_dir / "Cargo.toml").string(),
      "--bin",
      options_.bin,
      "--"};
  for (auto& arg : case_arguments(shape_case)) {
    args.push_back(std::move(arg));
  }
  return args;
}

bool ReferenceProducer::run(const ShapeCase& shape_case, std::string& out, ProcessFailure& failure) {
  if (!check_checkout(failure)) return false;
  ProcessOptions opts;
  opts.cwd = options_.root;
  opts.timeout_seconds = options_.timeout_seconds;
  const ProcessResult result = run_process(command_for(shape_case), opts);
  if (failure_from_process(result, "cargo run (" + options_.checkout_dir.generic_string() + " " + options_.bin + ")",
                           failure)) {
    return false;
  }
  out = trim_trailing_whitespace(result.stdout_text);
  return true;
}

CandidateProducer::CandidateProducer(CandidateProducerOptions options) : options_(std::move(options)) {}

fs::path CandidateProducer::artifact_path() const {
  return options_.root / options_.project_dir / options_.artifact;
}

fs::path CandidateProducer::shim_path() const {
  return options_.root / options_.project_dir / options_.shim;
}

std::vector<std::string> CandidateProducer::build_command() const {
  return {"moon", "build", "-C", (options_.root / options_.project_dir).string(),
          "--target", "wasm", "--release", "-d"};
}

std::vector<std::string> CandidateProducer::command_for(const ShapeCase& shape_case) const {
  // `--dir .` grants the guest the root, so fonts must be root-relative.
  std::vector<std::string> args = {
      "wasmtime", "run", "--dir", ".", "--preload", "spectest=" + shim_path().string(), artifact_path().string()};
  for (auto& arg : case_arguments(shape_case)) {
    args.push_back(std::move(arg));
  }
  return args;
}

bool CandidateProducer::prepare(ProcessFailure& failure) {
  if (prepared_) return true;
  log::info("building candidate: " + format_command(build_command()));
  ProcessOptions opts;
  opts.cwd = options_.root;
  const ProcessResult result = run_process(build_command(), opts);
  if (failure_from_process(result, "moon build (" + options_.project_dir.generic_string() + ")", failure)) {
    return false;
  }
  if (!path_exists(artifact_path())) {
    return missing_artifact("moon dump wasm", artifact_path(), failure);
  }
  if (!path_exists(shim_path())) {
    return missing_artifact("spectest shim wasm", shim_path(), failure);
  }
  prepared_ = true;
  return true;
}

bool CandidateProducer::run(const ShapeCase& shape_case, std::string& out, ProcessFailure& failure) {
  if (!prepared_) {
    failure = ProcessFailure{};
    failure.what = "candidate run requested before a successful build";
    failure.exit_code = 1;
    return false;
  }
  if (!path_exists(artifact_path())) {
    return missing_artifact("moon dump wasm", artifact_path(), failure);
  }
  ProcessOptions opts;
  opts.cwd = options_.root;
  opts.timeout_seconds = options_.timeout_seconds;
  const ProcessResult result = run_process(command_for(shape_case), opts);
  if (failure_from_process(result, "wasmtime run (moon_swash_dump)", failure)) {
    return false;
  }
  out = trim_trailing_whitespace(result.stdout_text);
  return true;
}

} // namespace sdiff
