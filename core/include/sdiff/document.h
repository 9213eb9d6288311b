#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace sdiff {

// Parsed producer output. Objects are keyed maps, arrays keep their order.
using Document = nlohmann::json;

enum class DocumentKind {
  Null,
  Bool,
  Number,
  String,
  Sequence,
  Mapping
};

struct ParseError {
  std::string message;
  std::string raw_text;
};

DocumentKind kind_of(const Document& value);

// True when the value was written as a JSON integer (no fraction, no exponent).
bool is_integer_literal(const Document& value);

bool parse_document(const std::string& raw_text, Document& out, ParseError& error);

// Compact JSON rendering used in diagnostics.
std::string render_value(const Document& value);

} // namespace sdiff
