#include "sdiff/suite.h"

#include "sdiff/log.h"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace sdiff {

namespace {
constexpr size_t kReportLogLines = 50;

void write_raw(std::ostream& err, const char* label, const std::string& raw) {
  err << "\n" << label << ":\n" << raw << "\n";
}

std::string report_failure(const CaseFailure& failure,
                           const CaseOutcome& outcome,
                           const std::string& identity,
                           bool dump,
                           std::ostream& err) {
  std::string message;
  switch (failure.kind) {
    case FailureKind::Preparation:
      message = failure.process.describe();
      err << message;
      break;
    case FailureKind::Execution:
      message = failure.process.describe();
      err << "Execution failed for " << identity << "\n" << message;
      break;
    case FailureKind::Parse:
      message = "failed to parse " + failure.producer + " json: " + failure.parse.message;
      err << "Parse failure for " << identity << "\n" << message << "\n" << failure.parse.raw_text << "\n";
      break;
    case FailureKind::Mismatch:
      message = failure.mismatch.message();
      err << "Mismatch for " << identity << "\n" << message << "\n";
      if (dump) {
        write_raw(err, "ref", outcome.reference_raw);
        write_raw(err, "candidate", outcome.candidate_raw);
      }
      break;
  }
  return message;
}
} // namespace

int exit_status_for(const CaseFailure& failure) {
  switch (failure.kind) {
    case FailureKind::Preparation:
    case FailureKind::Execution:
      return failure.process.exit_code != 0 ? failure.process.exit_code : 1;
    case FailureKind::Parse:
    case FailureKind::Mismatch:
      return 1;
  }
  return 1;
}

SuiteResult run_suite(const SuiteOptions& options,
                      IResultProducer& reference,
                      IResultProducer& candidate,
                      std::ostream& out,
                      std::ostream& err) {
  SuiteResult result;

  CaseFailure prep;
  prep.kind = FailureKind::Preparation;
  IResultProducer* order[] = {&candidate, &reference};
  for (IResultProducer* producer : order) {
    if (!producer->prepare(prep.process)) {
      prep.producer = producer->name();
      log::error("prepare failed: " + producer->name());
      result.message = report_failure(prep, CaseOutcome{}, std::string(), false, err);
      result.failure = FailureKind::Preparation;
      result.exit_code = exit_status_for(prep);
      return result;
    }
  }

  CaseRunner runner(reference, candidate);
  for (const auto& text : options.texts) {
    ShapeCase shape_case;
    shape_case.font = options.font;
    shape_case.text = text;
    shape_case.size = options.size;

    CaseRecord record;
    record.text = text;

    CaseOutcome outcome;
    if (!runner.run(shape_case, options.compare, outcome)) {
      const std::string identity = describe_case(shape_case, options.font_label);
      record.failure = outcome.failure.kind;
      record.message = report_failure(outcome.failure, outcome, identity, options.dump, err);
      result.cases.push_back(record);
      result.failure = outcome.failure.kind;
      result.message = record.message;
      result.exit_code = exit_status_for(outcome.failure);
      log::error(std::string(failure_kind_name(outcome.failure.kind)) + " failure: " + identity);
      return result;
    }

    record.ok = true;
    result.cases.push_back(std::move(record));
    out << "OK text=" << quote_text(text) << "\n";
    out.flush();
  }

  log::info("all " + std::to_string(options.texts.size()) + " cases matched");
  return result;
}

bool write_suite_report(const std::filesystem::path& path,
                        const SuiteOptions& options,
                        const SuiteResult& result,
                        std::string& error) {
  using json = nlohmann::json;
  json report = json::object();
  report["font"] = options.font_label;
  report["staged_font"] = options.font.generic_string();
  report["size"] = options.size;
  report["tolerance"] = options.compare.tolerance;
  report["exact_integers"] = options.compare.exact_integers;
  report["exit_code"] = result.exit_code;
  report["status"] = result.failure.has_value() ? failure_kind_name(result.failure.value()) : "ok";
  if (!result.message.empty()) {
    report["message"] = result.message;
  }

  json cases = json::array();
  for (const auto& record : result.cases) {
    json entry = json::object();
    entry["text"] = record.text;
    entry["ok"] = record.ok;
    if (record.failure.has_value()) {
      entry["failure"] = failure_kind_name(record.failure.value());
      entry["message"] = record.message;
    }
    cases.push_back(std::move(entry));
  }
  report["cases"] = std::move(cases);
  report["log"] = log::recent(kReportLogLines);

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream file(path);
  if (!file) {
    error = "report write failed: " + path.string();
    return false;
  }
  file << report.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
  file.flush();
  if (!file.good()) {
    error = "report write failed: " + path.string();
    return false;
  }
  return true;
}

} // namespace sdiff
