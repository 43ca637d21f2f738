/**
 * @file writer.h
 * @brief Serializer for delimited text.
 *
 * Fields are written one at a time; the Writer inserts separators, quotes
 * fields that need it and ends rows on request. Output that a Tokenizer
 * configured with the same separator, quote, escape and comment prefix reads
 * back yields the fields that were written.
 */

#ifndef DSVKIT_WRITER_H
#define DSVKIT_WRITER_H

#include "dialect.h"
#include "error.h"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace dsvkit {

/**
 * @brief When fields get quoted.
 *
 * - ALWAYS: every field
 * - MINIMAL: only fields that contain the quote, the separator, '\\n' or
 *   '\\r', and a row's first field starting with the comment prefix
 */
enum class EnquotePolicy { ALWAYS, MINIMAL };

struct WriterOptions {
  char separator = ',';
  char quote = '"';
  char escape = '"';

  /// Prefix written before every comment line
  std::string comment = "# ";

  EnquotePolicy enquote = EnquotePolicy::MINIMAL;

  /// Comment prefix of the reader the output is meant for. A first field
  /// starting with it is quoted under MINIMAL so it is not read back as a
  /// comment. Empty disables the check.
  std::string reader_comment = "#";

  /// Output buffer size in bytes
  size_t buffer_size = 4096;

  /// Sets the quote character and makes it its own escape.
  WriterOptions& set_quote(char q) {
    quote = q;
    escape = q;
    return *this;
  }

  /// Options matching a dialect. The dialect's comment becomes both the
  /// written prefix and the reader prefix; without one the default written
  /// prefix stays. A single column dialect keeps the default separator, a
  /// dialect without quoting keeps the default quote, and one without escape
  /// escapes by doubling.
  static WriterOptions from_dialect(const DialectParameters& dialect);

  /// Empty when the options are consistent, otherwise the first conflict
  std::string validation_error() const;
};

/**
 * @brief Buffered delimited-text writer.
 *
 * Errors from the output stream are sticky: once a write or flush fails,
 * every later call is a no-op and error() reports the failure. Buffered
 * output is flushed by flush() and by the destructor.
 */
class Writer {
public:
  /// @throws ParseException with ErrorCode::INVALID_DIALECT for inconsistent options
  explicit Writer(std::ostream& output, const WriterOptions& options = WriterOptions());
  ~Writer();

  // Non-copyable, non-movable
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;

  /// Writes one field, preceded by a separator unless it starts a row.
  void write_field(std::string_view field);

  /// Ends the current row. Does nothing at the start of a row.
  void new_row();

  /**
   * @brief Writes a possibly multi-line comment.
   *
   * Trailing line breaks and blanks are dropped, then every line is written
   * on its own row behind the comment prefix, without '\\r'.
   */
  void write_comment(std::string_view comment);

  /// Ends the current row if needed, then writes an empty line.
  void empty_row();

  /// Writes buffered bytes to the output stream and flushes it.
  void flush();

  bool has_error() const { return error_.has_value(); }
  const std::optional<ParseError>& error() const { return error_; }

  /// True when nothing has been written on the current row
  bool at_row_start() const { return at_row_start_; }

  const WriterOptions& options() const { return options_; }

private:
  bool needs_quotes(std::string_view field) const;
  void write(std::string_view data);
  void write_char(char c);
  void write_escaped(std::string_view data);
  void write_comment_line(std::string_view line);
  void drain();

  std::ostream* output_;
  WriterOptions options_;
  std::string special_; // bytes that force quoting under MINIMAL
  std::string buffer_;
  size_t written_ = 0;  // bytes handed to the output stream
  bool at_row_start_ = true;
  std::optional<ParseError> error_;
};

} // namespace dsvkit

#endif // DSVKIT_WRITER_H
