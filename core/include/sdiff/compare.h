#pragma once

#include "sdiff/document.h"

#include <cstddef>
#include <string>
#include <vector>

namespace sdiff {

struct PathSegment {
  bool is_index = false;
  std::string key;
  size_t index = 0;
};

// Location inside a document tree. The empty path renders as "$".
class ComparePath {
 public:
  ComparePath() = default;

  ComparePath child(const std::string& key) const;
  ComparePath child(size_t index) const;

  std::string render() const;

 private:
  std::vector<PathSegment> segments_;
};

enum class MismatchKind {
  KeySet,
  Length,
  Number,
  Value
};

struct MismatchReport {
  MismatchKind kind = MismatchKind::Value;
  std::string path;
  std::string reference;
  std::string candidate;
  double tolerance = 0.0;

  std::string message() const;
};

struct CompareOptions {
  double tolerance = 0.02;
  // Both sides written as JSON integers compare exactly.
  bool exact_integers = false;
};

const char* mismatch_kind_name(MismatchKind kind);

// Returns true when the trees are equivalent. On the first divergence, in
// sorted-key / positional order, fills `report` and stops.
bool compare_documents(const Document& reference,
                       const Document& candidate,
                       const CompareOptions& options,
                       MismatchReport& report);

} // namespace sdiff
