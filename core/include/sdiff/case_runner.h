#pragma once

#include "sdiff/compare.h"
#include "sdiff/document.h"
#include "sdiff/producer.h"

#include <string>

namespace sdiff {

enum class FailureKind {
  Preparation,
  Execution,
  Parse,
  Mismatch
};

const char* failure_kind_name(FailureKind kind);

struct CaseFailure {
  FailureKind kind = FailureKind::Mismatch;
  // Producer that failed; empty for mismatches.
  std::string producer;
  ProcessFailure process;
  ParseError parse;
  MismatchReport mismatch;
};

struct CaseOutcome {
  std::string reference_raw;
  std::string candidate_raw;
  CaseFailure failure;
};

// Runs one case: reference first, then candidate, then parse and compare.
// A failing reference means the candidate is never invoked.
class CaseRunner {
 public:
  CaseRunner(IResultProducer& reference, IResultProducer& candidate);

  bool run(const ShapeCase& shape_case, const CompareOptions& options, CaseOutcome& outcome);

 private:
  IResultProducer& reference_;
  IResultProducer& candidate_;
};

// Python-style quoting used for case identity: 'abc', "it's".
std::string quote_text(const std::string& text);

std::string describe_case(const ShapeCase& shape_case, const std::string& font_label);

} // namespace sdiff
