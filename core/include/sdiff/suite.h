#pragma once

#include "sdiff/case_runner.h"
#include "sdiff/compare.h"
#include "sdiff/producer.h"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sdiff {

struct SuiteOptions {
  // Root-relative font handed to both producers.
  std::filesystem::path font;
  // Font as the user named it; only used in messages.
  std::string font_label;
  std::vector<std::string> texts;
  double size = 14.0;
  CompareOptions compare;
  bool dump = false;
};

struct CaseRecord {
  std::string text;
  bool ok = false;
  std::optional<FailureKind> failure;
  std::string message;
};

struct SuiteResult {
  int exit_code = 0;
  std::optional<FailureKind> failure;
  std::string message;
  std::vector<CaseRecord> cases;
};

int exit_status_for(const CaseFailure& failure);

// Prepares the candidate once, then runs each text in order and stops at the
// first failing case. `out` gets one "OK text=..." line per passing case;
// diagnostics go to `err`.
SuiteResult run_suite(const SuiteOptions& options,
                      IResultProducer& reference,
                      IResultProducer& candidate,
                      std::ostream& out,
                      std::ostream& err);

bool write_suite_report(const std::filesystem::path& path,
                        const SuiteOptions& options,
                        const SuiteResult& result,
                        std::string& error);

} // namespace sdiff
