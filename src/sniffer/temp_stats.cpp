#include "temp_stats.h"

#include <algorithm>
#include <array>

namespace dsvkit {

namespace {

int score_of(const std::vector<std::pair<char, int>>& scores, char c) {
  for (const auto& entry : scores) {
    if (entry.first == c) {
      return entry.second;
    }
  }
  return 0;
}

// Candidate index for every byte value, -1 when the byte is not a candidate
std::array<int, 256> index_table(const std::vector<char>& candidates,
                                 std::vector<std::pair<char, int>>& scores) {
  std::array<int, 256> table;
  table.fill(-1);
  for (char c : candidates) {
    unsigned char u = static_cast<unsigned char>(c);
    if (table[u] < 0) {
      table[u] = static_cast<int>(scores.size());
      scores.emplace_back(c, 0);
    }
  }
  return table;
}

void drop_zero_scores(std::vector<std::pair<char, int>>& scores) {
  scores.erase(std::remove_if(scores.begin(), scores.end(),
                              [](const std::pair<char, int>& e) { return e.second == 0; }),
               scores.end());
}

} // namespace

int TempStats::separator_score(char c) const { return score_of(separators, c); }

int TempStats::quote_score(char c) const { return score_of(quotes, c); }

int TempStats::pair_score(char separator, char quote) const {
  auto it = pairs.find(std::make_pair(separator, quote));
  return it == pairs.end() ? 0 : it->second;
}

TempStats collect_temp_stats(const uint8_t* data, size_t len, const std::vector<char>& separators,
                             const std::vector<char>& quotes) {
  TempStats stats;
  const std::array<int, 256> sep_index = index_table(separators, stats.separators);
  const std::array<int, 256> quote_index = index_table(quotes, stats.quotes);

  if (len > 0) {
    const char newline = '\n';

    bool first_sep = true;
    bool first_quote = true;

    // Start of data behaves like the byte after a line break
    char prev_char = newline;
    bool prev_char_is_sep = true;
    bool prev_char_is_quote = false;

    char prev_non_space = newline;
    bool prev_non_space_is_sep = true;
    bool prev_non_space_is_quote = false;

    if (quote_index[data[0]] >= 0) {
      stats.quotes[quote_index[data[0]]].second += VERY_FIRST_QUOTE_BONUS;
    }

    for (size_t i = 0; i < len; ++i) {
      const char c = static_cast<char>(data[i]);
      const int q = quote_index[data[i]];
      if (q >= 0) {
        int& score = stats.quotes[q].second;
        if (first_quote && (prev_char_is_sep || prev_non_space_is_sep)) {
          score += FIRST_BONUS;
          first_quote = false;
        }
        if (prev_char_is_sep) {
          score += BESIDE_BONUS;
          if (prev_char != newline) {
            stats.pairs[std::make_pair(prev_char, c)] += BESIDE_BONUS;
          }
        }
        if (prev_non_space_is_sep) {
          score += SPACE_BONUS;
          if (prev_non_space != newline) {
            stats.pairs[std::make_pair(prev_non_space, c)] += SPACE_BONUS;
          }
        }
        prev_char = prev_non_space = c;
        prev_char_is_sep = prev_non_space_is_sep = false;
        prev_char_is_quote = prev_non_space_is_quote = true;
        continue;
      }

      const int s = sep_index[data[i]];
      if (s >= 0) {
        int& score = stats.separators[s].second;
        ++score;
        if (first_sep) {
          score += FIRST_BONUS;
          first_sep = false;
        }
        if (prev_char_is_quote) {
          score += BESIDE_BONUS;
          stats.pairs[std::make_pair(c, prev_char)] += BESIDE_BONUS;
        }
        if (prev_non_space_is_quote) {
          score += SPACE_BONUS;
          stats.pairs[std::make_pair(c, prev_non_space)] += SPACE_BONUS;
        }
        prev_char = prev_non_space = c;
        prev_char_is_sep = prev_non_space_is_sep = true;
        prev_char_is_quote = prev_non_space_is_quote = false;
        continue;
      }

      prev_char = c;
      prev_char_is_sep = c == newline;
      prev_char_is_quote = false;
      if (c != ' ') {
        prev_non_space = c;
        prev_non_space_is_sep = c == newline;
        prev_non_space_is_quote = false;
      }
    }
  }

  drop_zero_scores(stats.separators);
  drop_zero_scores(stats.quotes);
  return stats;
}

} // namespace dsvkit
