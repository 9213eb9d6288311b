#include "sdiff/document.h"

namespace sdiff {

DocumentKind kind_of(const Document& value) {
  switch (value.type()) {
    case Document::value_t::null:
    case Document::value_t::discarded:
      return DocumentKind::Null;
    case Document::value_t::boolean:
      return DocumentKind::Bool;
    case Document::value_t::number_integer:
    case Document::value_t::number_unsigned:
    case Document::value_t::number_float:
      return DocumentKind::Number;
    case Document::value_t::string:
    case Document::value_t::binary:
      return DocumentKind::String;
    case Document::value_t::array:
      return DocumentKind::Sequence;
    case Document::value_t::object:
      return DocumentKind::Mapping;
  }
  return DocumentKind::Null;
}

bool is_integer_literal(const Document& value) {
  return value.is_number_integer();
}

bool parse_document(const std::string& raw_text, Document& out, ParseError& error) {
  error = ParseError{};
  try {
    out = Document::parse(raw_text);
  } catch (const nlohmann::json::parse_error& e) {
    error.message = e.what();
    error.raw_text = raw_text;
    return false;
  }
  return true;
}

std::string render_value(const Document& value) {
  return value.dump(-1, ' ', false, Document::error_handler_t::replace);
}

} // namespace sdiff
