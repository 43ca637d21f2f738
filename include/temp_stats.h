/**
 * @file temp_stats.h
 * @brief Single-pass separator and quote statistics used by the Sniffer.
 */

#ifndef DSVKIT_TEMP_STATS_H
#define DSVKIT_TEMP_STATS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace dsvkit {

/// Score added to a quote that is the very first byte of the sample
constexpr int VERY_FIRST_QUOTE_BONUS = 8;
/// Score added once to the first separator, and once to the first quote
/// following a separator
constexpr int FIRST_BONUS = 4;
/// Score for a separator and a quote right next to each other
constexpr int BESIDE_BONUS = 2;
/// Score for a separator and a quote separated only by spaces
constexpr int SPACE_BONUS = 1;

/**
 * @brief Scores collected for one guess.
 *
 * Separators and quotes keep candidate order; candidates that scored zero
 * are removed, so either list may end up empty. Pair keys are
 * (separator, quote).
 */
struct TempStats {
  std::vector<std::pair<char, int>> separators;
  std::vector<std::pair<char, int>> quotes;
  std::map<std::pair<char, char>, int> pairs;

  int separator_score(char c) const;
  int quote_score(char c) const;
  int pair_score(char separator, char quote) const;
};

/**
 * @brief Scans a sample once and scores separator and quote candidates.
 *
 * A line break acts as a boundary for adjacency rules but never forms a
 * pair. Only plain spaces (not tabs) are skipped when looking for the
 * previous non-space byte. A byte that is both a quote and a separator
 * candidate is treated as a quote.
 */
TempStats collect_temp_stats(const uint8_t* data, size_t len, const std::vector<char>& separators,
                             const std::vector<char>& quotes);

} // namespace dsvkit

#endif // DSVKIT_TEMP_STATS_H
