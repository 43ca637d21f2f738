/**
 * @file chunk_splitter.h
 * @brief Splits a forward-only byte stream into separator-terminated pieces.
 */

#ifndef DSVKIT_CHUNK_SPLITTER_H
#define DSVKIT_CHUNK_SPLITTER_H

#include "common_defs.h"
#include "error.h"

#include <cstddef>
#include <istream>
#include <optional>
#include <string_view>
#include <vector>

namespace dsvkit {

/**
 * @brief Turns an input stream into a sequence of pieces.
 *
 * Each piece runs up to and including the earliest separator or '\n'. When
 * the separator is '\n' or 0 only line breaks end a piece. If the stream
 * ends without a terminator, the remaining bytes are delivered with a
 * synthetic '\n' appended, so every piece ends with a terminator. A stream
 * ending right after a separator gets a final "\n" piece, so the last row is
 * always closed by a line break.
 *
 * A piece view is valid only until the next call to next().
 *
 * Errors are sticky: once the stream fails (or a piece grows beyond
 * max_piece_size) next() keeps returning false and error() reports why.
 */
class ChunkSplitter {
public:
  ChunkSplitter(std::istream& input, char separator, size_t chunk_size = DSVKIT_CHUNK_SIZE,
                size_t max_piece_size = DSVKIT_MAX_PIECE_SIZE);

  // Non-copyable, moveable
  ChunkSplitter(const ChunkSplitter&) = delete;
  ChunkSplitter& operator=(const ChunkSplitter&) = delete;
  ChunkSplitter(ChunkSplitter&&) = default;
  ChunkSplitter& operator=(ChunkSplitter&&) = default;

  /// Fetches the next piece. Returns false at end of input or on error.
  bool next(std::string_view& piece);

  bool has_error() const { return error_.has_value(); }
  const std::optional<ParseError>& error() const { return error_; }

  /// Number of source bytes delivered so far (synthetic '\n' excluded).
  size_t bytes_consumed() const { return consumed_; }

  char separator() const { return separator_; }

private:
  // Compacts the buffer and reads one more chunk. Returns false on error.
  bool fill();

  std::istream* input_;
  char separator_;
  size_t chunk_size_;
  size_t max_piece_size_;

  std::vector<char> buffer_;
  size_t begin_ = 0;   // first undelivered byte
  size_t end_ = 0;     // one past the last buffered byte
  size_t scanned_ = 0; // bytes after begin_ already known to hold no terminator
  size_t consumed_ = 0;
  bool eof_ = false;
  bool row_open_ = false; // last piece ended with the separator

  std::optional<ParseError> error_;
};

} // namespace dsvkit

#endif // DSVKIT_CHUNK_SPLITTER_H
