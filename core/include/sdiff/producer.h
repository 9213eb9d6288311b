#pragma once

#include "sdiff/process.h"

#include <filesystem>
#include <string>
#include <vector>

namespace sdiff {

// One comparison unit. `font` is relative to the producers' working root.
struct ShapeCase {
  std::filesystem::path font;
  std::string text;
  double size = 14.0;
};

struct ProcessFailure {
  std::string what;
  // False for precondition failures (missing checkout or artifact).
  bool process_ran = false;
  int exit_code = 1;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;

  // "<what> failed (exit=N)" followed by verbatim stdout/stderr sections.
  std::string describe() const;
};

class IResultProducer {
 public:
  virtual ~IResultProducer() = default;

  virtual const std::string& name() const = 0;
  // Idempotent; a prepared producer returns true without redoing work.
  virtual bool prepare(ProcessFailure& failure) = 0;
  // Raw stdout of one invocation, trailing whitespace trimmed.
  virtual bool run(const ShapeCase& shape_case, std::string& out, ProcessFailure& failure) = 0;
};

// Shortest round-trip decimal that always carries a fraction: 14 -> "14.0".
std::string format_decimal(double value);

std::string trim_trailing_whitespace(std::string value);

std::vector<std::string> case_arguments(const ShapeCase& shape_case);

// Converts a finished process into a failure payload; returns false when the
// process succeeded and `failure` was left untouched.
bool failure_from_process(const ProcessResult& result, const std::string& what, ProcessFailure& failure);

struct ReferenceProducerOptions {
  std::filesystem::path root;
  std::filesystem::path checkout_dir = "swash-reference";
  std::string bin = "dump_json";
  int timeout_seconds = 0;
};

// `cargo run` against a checkout of the reference engine.
class ReferenceProducer final : public IResultProducer {
 public:
  explicit ReferenceProducer(ReferenceProducerOptions options);

  const std::string& name() const override { return name_; }
  bool prepare(ProcessFailure& failure) override;
  bool run(const ShapeCase& shape_case, std::string& out, ProcessFailure& failure) override;

  std::vector<std::string> command_for(const ShapeCase& shape_case) const;

 private:
  bool check_checkout(ProcessFailure& failure) const;

  ReferenceProducerOptions options_;
  std::string name_ = "ref";
  bool prepared_ = false;
};

struct CandidateProducerOptions {
  std::filesystem::path root;
  std::filesystem::path project_dir = "tools/moon_swash_dump";
  // Relative to project_dir.
  std::filesystem::path artifact = "target/wasm/release/build/moon_swash_dump.wasm";
  std::filesystem::path shim = "spectest.wasm";
  int timeout_seconds = 0;
};

// Builds the candidate to wasm once, then runs it under wasmtime.
class CandidateProducer final : public IResultProducer {
 public:
  explicit CandidateProducer(CandidateProducerOptions options);

  const std::string& name() const override { return name_; }
  bool prepare(ProcessFailure& failure) override;
  bool run(const ShapeCase& shape_case, std::string& out, ProcessFailure& failure) override;

  std::vector<std::string> build_command() const;
  std::vector<std::string> command_for(const ShapeCase& shape_case) const;
  std::filesystem::path artifact_path() const;
  std::filesystem::path shim_path() const;

 private:
  CandidateProducerOptions options_;
  std::string name_ = "candidate";
  bool prepared_ = false;
};

} // namespace sdiff
