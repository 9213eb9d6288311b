#include "sdiff/case_runner.h"

#include <cstdio>

namespace sdiff {

const char* failure_kind_name(FailureKind kind) {
  switch (kind) {
    case FailureKind::Preparation: return "preparation";
    case FailureKind::Execution: return "execution";
    case FailureKind::Parse: return "parse";
    case FailureKind::Mismatch: return "mismatch";
  }
  return "unknown";
}

CaseRunner::CaseRunner(IResultProducer& reference, IResultProducer& candidate)
    : reference_(reference), candidate_(candidate) {}

bool CaseRunner::run(const ShapeCase& shape_case, const CompareOptions& options, CaseOutcome& outcome) {
  outcome = CaseOutcome{};
  CaseFailure& failure = outcome.failure;

  if (!reference_.run(shape_case, outcome.reference_raw, failure.process)) {
    failure.kind = FailureKind::Execution;
    failure.producer = reference_.name();
    return false;
  }
  if (!candidate_.run(shape_case, outcome.candidate_raw, failure.process)) {
    failure.kind = FailureKind::Execution;
    failure.producer = candidate_.name();
    return false;
  }

  Document reference_doc;
  Document candidate_doc;
  if (!parse_document(outcome.reference_raw, reference_doc, failure.parse)) {
    failure.kind = FailureKind::Parse;
    failure.producer = reference_.name();
    return false;
  }
  if (!parse_document(outcome.candidate_raw, candidate_doc, failure.parse)) {
    failure.kind = FailureKind::Parse;
    failure.producer = candidate_.name();
    return false;
  }

  if (!compare_documents(reference_doc, candidate_doc, options, failure.mismatch)) {
    failure.kind = FailureKind::Mismatch;
    return false;
  }
  return true;
}

std::string quote_text(const std::string& text) {
  const bool has_single = text.find('\'') != std::string::npos;
  const bool has_double = text.find('"') != std::string::npos;
  const char quote = (has_single && !has_double) ? '"' : '\'';

  std::string out(1, quote);
  for (unsigned char c : text) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c == static_cast<unsigned char>(quote)) {
          out += '\\';
          out += static_cast<char>(c);
        } else if (c < 0x20 || c == 0x7f) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\x%02x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
        break;
    }
  }
  out += quote;
  return out;
}

std::string describe_case(const ShapeCase& shape_case, const std::string& font_label) {
  return "text=" + quote_text(shape_case.text) + " size=" + format_decimal(shape_case.size) +
         " font=" + font_label;
}

} // namespace sdiff
