/**
 * @file collectors.h
 * @brief Matchers that assemble comments and quoted fields from pieces.
 *
 * A collector recognizes the start of a special field kind in the first
 * piece of a field and its end in the same or a later piece. Collectors are
 * a closed set chosen once when a Tokenizer is configured:
 *
 * - COMMENT: a row starting with the comment prefix, up to the line break
 * - STRICT_QUOTE: quote as first byte, unescaped quote right before the
 *   terminator
 * - FUZZY_QUOTE: like STRICT_QUOTE but spaces and tabs may surround the quotes
 *
 * Collectors hold no per-field state, so one instance serves every field.
 */

#ifndef DSVKIT_COLLECTORS_H
#define DSVKIT_COLLECTORS_H

#include "dialect.h"

#include <string>
#include <string_view>
#include <utility>

namespace dsvkit {

enum class CollectorKind { COMMENT, STRICT_QUOTE, FUZZY_QUOTE };

/// Remainder of a piece after a start/end test, and whether the test matched.
struct CollectResult {
  std::string_view data;
  bool matched;
};

class Collector {
public:
  static Collector comment(const std::string& prefix);
  static Collector quote(QuoteMode mode, char quote, char escape);

  CollectorKind kind() const { return kind_; }

  /**
   * @brief Tests whether a piece opens a field of this kind.
   *
   * On a match, the returned data is the piece without the comment prefix or
   * the opening quote (and, in fuzzy mode, the blanks before it). Otherwise
   * the piece is returned unchanged.
   */
  CollectResult start(std::string_view piece) const;

  /**
   * @brief Tests whether a piece closes the current field.
   *
   * On a match, the returned data is the field content of this piece: the
   * terminator and the closing quote (or the comment's line break) removed.
   * Otherwise the whole piece is returned, terminator included, so that
   * embedded separators and line breaks are kept.
   */
  CollectResult end(std::string_view piece) const;

  /**
   * @brief Tests whether a strict quoted field already closed inside a piece
   *        that end() rejected, as in `"x" ,`.
   *
   * Such a field is read as a plain field, quotes included. Always false for
   * the comment and fuzzy collectors.
   */
  bool closed_early(std::string_view piece) const;

private:
  Collector(CollectorKind kind, std::string prefix, char quote, char escape)
      : kind_(kind), prefix_(std::move(prefix)), quote_(quote), escape_(escape) {}

  CollectResult end_quoted(std::string_view content) const;

  CollectorKind kind_;
  std::string prefix_;
  char quote_;
  char escape_;
};

/// Drops the trailing terminator of a piece, and a '\r' before a '\n'.
std::string_view remove_terminator(std::string_view piece);

/// True when data ends with a quote preceded by an even number of escapes.
bool ends_with_unescaped_quote(std::string_view data, char quote, char escape);

/**
 * @brief Replaces each <escape><quote> pair with a single quote.
 *
 * One left-to-right pass over non-overlapping pairs; the quote of a pair is
 * never reused as the escape of the next one. Quotes not preceded by the
 * escape byte are left alone. A zero escape disables the pass.
 */
void unescape_quotes(std::string& value, char quote, char escape);

} // namespace dsvkit

#endif // DSVKIT_COLLECTORS_H
