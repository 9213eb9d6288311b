#include "sdiff/compare.h"

#include <cmath>
#include <utility>

namespace sdiff {

namespace {
std::string render_keys(const Document& mapping) {
  Document keys = Document::array();
  // nlohmann::json objects iterate in sorted key order.
  for (auto it = mapping.begin(); it != mapping.end(); ++it) {
    keys.push_back(it.key());
  }
  return render_value(keys);
}

bool same_key_set(const Document& a, const Document& b) {
  if (a.size() != b.size()) return false;
  auto ia = a.begin();
  auto ib = b.begin();
  for (; ia != a.end(); ++ia, ++ib) {
    if (ia.key() != ib.key()) return false;
  }
  return true;
}

bool fail(MismatchReport& report, MismatchKind kind, const ComparePath& path,
          std::string reference, std::string candidate, double tolerance = 0.0) {
  report.kind = kind;
  report.path = path.render();
  report.reference = std::move(reference);
  report.candidate = std::move(candidate);
  report.tolerance = tolerance;
  return false;
}

bool compare_at(const Document& a, const Document& b, const CompareOptions& options,
                const ComparePath& path, MismatchReport& report) {
  const DocumentKind ka = kind_of(a);
  const DocumentKind kb = kind_of(b);

  if (ka == DocumentKind::Mapping && kb == DocumentKind::Mapping) {
    if (!same_key_set(a, b)) {
      return fail(report, MismatchKind::KeySet, path, render_keys(a), render_keys(b));
    }
    for (auto it = a.begin(); it != a.end(); ++it) {
      if (!compare_at(it.value(), b.at(it.key()), options, path.child(it.key()), report)) {
        return false;
      }
    }
    return true;
  }

  if (ka == DocumentKind::Sequence && kb == DocumentKind::Sequence) {
    if (a.size() != b.size()) {
      return fail(report, MismatchKind::Length, path, std::to_string(a.size()), std::to_string(b.size()));
    }
    for (size_t i = 0; i < a.size(); ++i) {
      if (!compare_at(a[i], b[i], options, path.child(i), report)) {
        return false;
      }
    }
    return true;
  }

  if (ka == DocumentKind::Number && kb == DocumentKind::Number) {
    if (options.exact_integers && is_integer_literal(a) && is_integer_literal(b)) {
      if (a == b) return true;
      return fail(report, MismatchKind::Number, path, render_value(a), render_value(b), 0.0);
    }
    const double x = a.get<double>();
    const double y = b.get<double>();
    if (std::fabs(x - y) <= options.tolerance) {
      return true;
    }
    return fail(report, MismatchKind::Number, path, render_value(a), render_value(b), options.tolerance);
  }

  if (ka == kb && a == b) {
    return true;
  }
  return fail(report, MismatchKind::Value, path, render_value(a), render_value(b));
}
} // namespace

ComparePath ComparePath::child(const std::string& key) const {
  ComparePath next = *this;
  PathSegment seg;
  seg.key = key;
  next.segments_.push_back(std::move(seg));
  return next;
}

ComparePath ComparePath::child(size_t index) const {
  ComparePath next = *this;
  PathSegment seg;
  seg.is_index = true;
  seg.index = index;
  next.segments_.push_back(std::move(seg));
  return next;
}

std::string ComparePath::render() const {
  std::string out = "$";
  for (const auto& seg : segments_) {
    if (seg.is_index) {
      out += "[" + std::to_string(seg.index) + "]";
    } else {
      out += "." + seg.key;
    }
  }
  return out;
}

const char* mismatch_kind_name(MismatchKind kind) {
  switch (kind) {
    case MismatchKind::KeySet: return "key";
    case MismatchKind::Length: return "length";
    case MismatchKind::Number: return "number";
    case MismatchKind::Value: return "value";
  }
  return "value";
}

std::string MismatchReport::message() const {
  std::string out = path + ": " + mismatch_kind_name(kind) + " mismatch: ref=" + reference +
                    " candidate=" + candidate;
  if (kind == MismatchKind::Number) {
    out += " (tol=" + render_value(Document(tolerance)) + ")";
  }
  return out;
}

bool compare_documents(const Document& reference,
                       const Document& candidate,
                       const CompareOptions& options,
                       MismatchReport& report) {
  report = MismatchReport{};
  return compare_at(reference, candidate, options, ComparePath{}, report);
}

} // namespace sdiff
