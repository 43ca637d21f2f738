#include "dialect.h"

#include "error.h"

#include <sstream>

namespace dsvkit {

namespace {

bool is_line_break(char c) { return c == '\n' || c == '\r'; }

// Quoted form of a dialect byte for to_string()
std::string quoted_char(char c) {
  switch (c) {
  case '\0':
    return "none";
  case '\t':
    return "'\\t'";
  case '\n':
    return "'\\n'";
  case '\r':
    return "'\\r'";
  default:
    return std::string("'") + c + "'";
  }
}

} // namespace

std::string describe_char(char c) {
  switch (c) {
  case '\0':
    return "none";
  case ',':
    return "comma";
  case '\t':
    return "tab";
  case ';':
    return "semicolon";
  case '|':
    return "pipe";
  case ' ':
    return "space";
  case '\n':
    return "newline";
  case '"':
    return "double-quote";
  case '\'':
    return "single-quote";
  case '`':
    return "backtick";
  case '\\':
    return "backslash";
  default:
    return std::string(1, c);
  }
}

std::string DialectParameters::validation_error() const {
  if (separator == '\r') {
    return "separator cannot be a carriage return";
  }
  if (quote != '\0') {
    if (is_line_break(quote) || quote == separator) {
      return "quote character cannot be a line break or the separator";
    }
  }
  if (escape != '\0') {
    if (is_line_break(escape) || escape == separator) {
      return "escape character cannot be a line break or the separator";
    }
  }
  for (char c : comment) {
    if (is_line_break(c) || c == separator) {
      return "comment prefix cannot contain a line break or the separator";
    }
  }
  return std::string();
}

void DialectParameters::validate() const {
  std::string msg = validation_error();
  if (!msg.empty()) {
    throw ParseException(
        ParseError(ErrorCode::INVALID_DIALECT, ErrorSeverity::ERROR, 0, msg + " (" + to_string() + ")"));
  }
}

std::string DialectParameters::to_string() const {
  std::ostringstream ss;
  ss << "Dialect{separator=" << quoted_char(separator);
  ss << ", quote=" << quoted_char(quote);
  if (quote != '\0') {
    ss << ", escape=" << (escape == quote ? std::string("doubled") : quoted_char(escape));
    ss << ", quoting=" << (quote_mode == QuoteMode::STRICT ? "strict" : "fuzzy");
  }
  ss << ", comment=";
  if (comment.empty()) {
    ss << "none";
  } else {
    ss << "\"" << comment << "\"";
  }
  ss << "}";
  return ss.str();
}

} // namespace dsvkit
