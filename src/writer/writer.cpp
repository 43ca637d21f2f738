#include "writer.h"

#include <exception>

namespace dsvkit {

namespace {

bool is_line_break(char c) { return c == '\n' || c == '\r'; }

} // namespace

WriterOptions WriterOptions::from_dialect(const DialectParameters& dialect) {
  WriterOptions options;
  if (dialect.separator != '\0' && dialect.separator != '\n') {
    options.separator = dialect.separator;
  }
  if (dialect.quote != '\0') {
    options.quote = dialect.quote;
    options.escape = dialect.escape != '\0' ? dialect.escape : dialect.quote;
  }
  if (!dialect.comment.empty()) {
    options.comment = dialect.comment;
  }
  options.reader_comment = dialect.comment;
  return options;
}

std::string WriterOptions::validation_error() const {
  if (separator == '\0' || is_line_break(separator)) {
    return "separator cannot be empty or a line break";
  }
  if (quote == '\0' || is_line_break(quote) || quote == separator) {
    return "quote cannot be empty, a line break or the separator";
  }
  if (escape == '\0' || is_line_break(escape) || escape == separator) {
    return "escape cannot be empty, a line break or the separator";
  }
  for (char c : comment) {
    if (is_line_break(c) || c == separator || c == quote) {
      return "comment prefix cannot contain the separator, the quote or a line break";
    }
  }
  if (buffer_size == 0) {
    return "buffer size must be positive";
  }
  return std::string();
}

Writer::Writer(std::ostream& output, const WriterOptions& options)
    : output_(&output), options_(options) {
  std::string problem = options_.validation_error();
  if (!problem.empty()) {
    throw ParseException(
        ParseError(ErrorCode::INVALID_DIALECT, ErrorSeverity::ERROR, 0, "Invalid writer options: " + problem));
  }
  special_ = {options_.quote, options_.separator, '\n', '\r'};
  buffer_.reserve(options_.buffer_size);
}

Writer::~Writer() {
  // Errors surface through error() only; nothing can be reported from here
  if (!error_) {
    drain();
  }
}

bool Writer::needs_quotes(std::string_view field) const {
  if (options_.enquote == EnquotePolicy::ALWAYS) {
    return true;
  }
  if (field.find_first_of(special_) != std::string_view::npos) {
    return true;
  }
  const std::string& prefix = options_.reader_comment;
  return at_row_start_ && !prefix.empty() && field.substr(0, prefix.size()) == prefix;
}

void Writer::drain() {
  if (buffer_.empty()) {
    return;
  }
  try {
    output_->write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
  } catch (const std::exception& e) {
    error_.emplace(ErrorCode::WRITE_ERROR, ErrorSeverity::FATAL, written_,
                   std::string("Write failed: ") + e.what());
    return;
  }
  if (!*output_) {
    error_.emplace(ErrorCode::WRITE_ERROR, ErrorSeverity::FATAL, written_,
                   "Write failed: output stream is in a failed state");
    return;
  }
  written_ += buffer_.size();
  buffer_.clear();
}

void Writer::write(std::string_view data) {
  if (error_) {
    return;
  }
  if (buffer_.size() + data.size() > options_.buffer_size) {
    drain();
    if (error_) {
      return;
    }
  }
  buffer_.append(data.data(), data.size());
}

void Writer::write_char(char c) { write(std::string_view(&c, 1)); }

void Writer::write_escaped(std::string_view data) {
  while (!data.empty()) {
    size_t n = data.find(options_.quote);
    if (n == std::string_view::npos) {
      write(data);
      return;
    }
    write(data.substr(0, n));
    write_char(options_.escape);
    write_char(options_.quote);
    data.remove_prefix(n + 1);
  }
}

void Writer::write_field(std::string_view field) {
  bool quoted = needs_quotes(field);
  if (!at_row_start_) {
    write_char(options_.separator);
  }
  at_row_start_ = false;
  if (quoted) {
    write_char(options_.quote);
    write_escaped(field);
    write_char(options_.quote);
  } else {
    write(field);
  }
}

void Writer::new_row() {
  if (!at_row_start_) {
    write_char('\n');
  }
  at_row_start_ = true;
}

void Writer::write_comment_line(std::string_view line) {
  if (!at_row_start_) {
    write_char('\n');
  }
  write(options_.comment);
  write(line);
  write_char('\n');
  at_row_start_ = true;
}

void Writer::write_comment(std::string_view comment) {
  size_t last = comment.find_last_not_of("\r\n\t ");
  comment = last == std::string_view::npos ? std::string_view() : comment.substr(0, last + 1);

  while (true) {
    size_t nl = comment.find('\n');
    std::string_view line = comment.substr(0, nl);
    while (!line.empty() && line.front() == '\r') {
      line.remove_prefix(1);
    }
    while (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    write_comment_line(line);
    if (nl == std::string_view::npos) {
      break;
    }
    comment.remove_prefix(nl + 1);
  }
}

void Writer::empty_row() {
  if (!at_row_start_) {
    write_char('\n');
  }
  write_char('\n');
  at_row_start_ = true;
}

void Writer::flush() {
  if (error_) {
    return;
  }
  drain();
  if (error_) {
    return;
  }
  try {
    output_->flush();
  } catch (const std::exception& e) {
    error_.emplace(ErrorCode::WRITE_ERROR, ErrorSeverity::FATAL, written_,
                   std::string("Flush failed: ") + e.what());
    return;
  }
  if (!*output_) {
    error_.emplace(ErrorCode::WRITE_ERROR, ErrorSeverity::FATAL, written_,
                   "Flush failed: output stream is in a failed state");
  }
}

} // namespace dsvkit
