/**
 * @file sniffer.h
 * @brief Dialect guessing from a sample of delimited text.
 *
 * The Sniffer scores separator and quote candidates in one pass over the
 * sample, ranks every (separator, quote) combination, guesses the comment
 * prefix and the escape byte, then verifies candidates by tokenizing the
 * sample: a dialect is verified when it yields a consistent column count
 * (at least two columns) over the data rows.
 *
 * @example
 * @code
 * dsvkit::Sniffer sniffer(buf, len);
 * dsvkit::GuessResult guess = sniffer.guess_parameters();
 * if (guess.success()) {
 *     std::cout << guess.dialect->to_string()
 *               << (guess.verified ? "" : " (unverified)") << std::endl;
 * }
 * @endcode
 */

#ifndef DSVKIT_SNIFFER_H
#define DSVKIT_SNIFFER_H

#include "common_defs.h"
#include "debug.h"
#include "dialect.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dsvkit {

/// Escape candidate standing for "the quote character itself"
constexpr char ESCAPE_SAME_AS_QUOTE = static_cast<char>(0xFF);

/**
 * @brief Candidate sets and mode of a Sniffer.
 *
 * In strict mode the sniffer answers "none" (0, an empty prefix or no
 * guess at all) when the sample gives no evidence. In lenient mode it falls
 * back to the first candidate of each set.
 */
struct SnifferOptions {
  std::vector<char> separators = {',', ';', '\t', '|', '&'};
  std::vector<char> quotes = {'"', '\'', '`'};
  std::vector<char> escapes = {ESCAPE_SAME_AS_QUOTE, '\\'};
  std::vector<std::string> comments = {"#", "//"};
  bool strict = false;

  /// Bytes of a source the CLI feeds to the sniffer. The Sniffer itself
  /// always looks at the whole buffer it is given.
  size_t sample_size = DSVKIT_SAMPLE_SIZE;

  DebugConfig debug;
};

/// A ranked (separator, quote) combination
struct SepQuoteScore {
  char separator;
  char quote;
  int score;

  bool operator==(const SepQuoteScore& other) const {
    return separator == other.separator && quote == other.quote && score == other.score;
  }
};

/// Outcome of Sniffer::guess_parameters()
struct GuessResult {
  std::optional<DialectParameters> dialect; ///< empty when nothing could be guessed
  bool verified = false;                    ///< the dialect passed verification

  bool success() const { return dialect.has_value(); }
};

class Sniffer {
public:
  /// The sample must stay alive and unchanged while the Sniffer is used.
  Sniffer(const uint8_t* data, size_t len, const SnifferOptions& options = SnifferOptions());

  /**
   * @brief Returns the most probable dialect.
   *
   * Ranked combinations are verified in order and the first that passes is
   * returned with verified = true. When none passes, strict mode gives no
   * guess and lenient mode returns the top ranked combination unverified.
   * Guessed dialects always use fuzzy quoting.
   */
  GuessResult guess_parameters() const;

  /**
   * @brief Ranks every surviving (separator, quote) combination.
   *
   * Never empty: when no separator (or quote) scored, the first candidate
   * (lenient) or 0 (strict) stands in with a zero score. Equal scores keep
   * candidate order, quotes first then separators.
   */
  std::vector<SepQuoteScore> sep_quote_scores() const;

  /// Head of sep_quote_scores() as (separator, quote)
  std::pair<char, char> best_sep_quote() const;

  /// Most probable comment prefix, empty for none
  std::string guess_comment() const;

  /// Most probable escape byte for the given quote, 0 for none
  char guess_escape(char quote) const;

  const SnifferOptions& options() const { return options_; }

private:
  const uint8_t* data_;
  size_t len_;
  SnifferOptions options_;
  DebugTrace trace_;
};

/**
 * @brief Checks that a dialect tokenizes a sample into consistent rows.
 *
 * Comment lines and empty lines are ignored. Passes when there are at least
 * three data rows whose column counts all equal the first row's (greater
 * than one), or exactly two rows with the same count greater than one.
 * An invalid dialect or a read error never verifies.
 */
bool verify_parameters(const uint8_t* data, size_t len, const DialectParameters& dialect);

} // namespace dsvkit

#endif // DSVKIT_SNIFFER_H
