/**
 * @file tokenizer.h
 * @brief Streaming field tokenizer for delimited text.
 *
 * The Tokenizer pulls pieces from a ChunkSplitter and assembles them into
 * fields, recognizing comment lines and quoted fields along the way.
 *
 * @example
 * @code
 * std::ifstream in("data.csv", std::ios::binary);
 * dsvkit::Tokenizer tok(in, dsvkit::DialectParameters::csv());
 * while (tok.next()) {
 *     if (tok.is_comment() || tok.is_empty_line()) continue;
 *     std::cout << tok.field() << (tok.at_row_end() ? "\n" : "|");
 * }
 * if (tok.has_error()) {
 *     std::cerr << tok.error()->to_string() << std::endl;
 * }
 * @endcode
 */

#ifndef DSVKIT_TOKENIZER_H
#define DSVKIT_TOKENIZER_H

#include "chunk_splitter.h"
#include "collectors.h"
#include "common_defs.h"
#include "debug.h"
#include "dialect.h"
#include "error.h"

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dsvkit {

/// Buffering and tracing settings of a Tokenizer.
struct TokenizerOptions {
  size_t chunk_size = DSVKIT_CHUNK_SIZE;
  size_t max_piece_size = DSVKIT_MAX_PIECE_SIZE;
  DebugConfig debug;
};

/**
 * @brief One field produced by the Tokenizer.
 *
 * data borrows the tokenizer's buffer and is valid until the next call to
 * Tokenizer::next(). Use str() to keep it.
 */
struct Field {
  std::string_view data;
  size_t offset = 0; ///< offset of the field's first source byte
  bool at_row_start = false;
  bool at_row_end = false;
  bool is_comment = false;
  bool is_quoted = false;
  bool is_empty_line = false;

  std::string str() const { return std::string(data); }
};

/**
 * @brief Pull-model tokenizer.
 *
 * Every call to next() yields exactly one field: a comment line (without its
 * prefix and line break), a quoted field (without quotes, escapes resolved),
 * or a plain field (without its terminator). Each field knows whether it
 * starts and/or ends a row. An unterminated comment or quoted field at end of
 * input is delivered as the final field instead of being reported.
 *
 * A read failure stops the tokenizer for good: next() returns false and
 * has_error() tells it apart from the end of input.
 */
class Tokenizer {
public:
  /// @throws ParseException with ErrorCode::INVALID_DIALECT for an invalid dialect
  Tokenizer(std::istream& input, const DialectParameters& dialect,
            const TokenizerOptions& options = TokenizerOptions());

  // Non-copyable, non-movable: the current field may view value_
  Tokenizer(const Tokenizer&) = delete;
  Tokenizer& operator=(const Tokenizer&) = delete;
  Tokenizer(Tokenizer&&) = delete;
  Tokenizer& operator=(Tokenizer&&) = delete;

  /// Advances to the next field. Returns false at end of input or on error.
  bool next();

  /// The current field as a borrowed view
  std::string_view field() const { return current_.data; }
  /// Owning copy of the current field content
  std::string bytes() const { return current_.str(); }
  const Field& current() const { return current_; }

  size_t offset() const { return current_.offset; }
  bool at_row_start() const { return current_.at_row_start; }
  bool at_row_end() const { return current_.at_row_end; }
  bool is_comment() const { return current_.is_comment; }
  bool is_quoted() const { return current_.is_quoted; }
  bool is_empty_line() const { return current_.is_empty_line; }

  /// Source bytes consumed so far
  size_t bytes_read() const { return splitter_.bytes_consumed(); }

  bool has_error() const { return splitter_.has_error(); }
  const std::optional<ParseError>& error() const { return splitter_.error(); }

  /**
   * @brief Reads the fields of the next data row, skipping comments and
   *        empty lines.
   *
   * @return false when no further data row exists (end of input or error)
   */
  bool next_row(std::vector<std::string>& row);

  const DialectParameters& dialect() const { return dialect_; }
  const DebugTrace& trace() const { return trace_; }

private:
  bool empty_content(std::string_view value) const;

  DialectParameters dialect_;
  ChunkSplitter splitter_;
  DebugTrace trace_;

  std::optional<Collector> comment_collector_;
  std::optional<Collector> quote_collector_;

  std::string value_; // accumulated field content
  Field current_;
  size_t next_offset_ = 0;
  bool last_row_end_ = true;
};

} // namespace dsvkit

#endif // DSVKIT_TOKENIZER_H
