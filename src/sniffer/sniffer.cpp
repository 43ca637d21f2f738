#include "sniffer.h"

#include "temp_stats.h"
#include "tokenizer.h"

#include <algorithm>
#include <sstream>
#include <string_view>

namespace dsvkit {

namespace {

/// Score if the sample starts with the comment prefix
constexpr int COMMENT_START_BONUS = 10;
/// Score per line starting with the prefix
constexpr int COMMENT_BONUS = 1;
/// Score per line starting with the prefix followed by a space
constexpr int COMMENT_SPACE_BONUS = 2;

char resolve_escape(char escape, char quote) {
  return escape == ESCAPE_SAME_AS_QUOTE ? quote : escape;
}

size_t count_occurrences(std::string_view haystack, const std::string& needle) {
  size_t count = 0;
  size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    ++count;
    pos = haystack.find(needle, pos + needle.size());
  }
  return count;
}

} // namespace

Sniffer::Sniffer(const uint8_t* data, size_t len, const SnifferOptions& options)
    : data_(data), len_(len), options_(options), trace_(options.debug) {
  trace_.dump_buffer("sample", data_, len_);
}

std::vector<SepQuoteScore> Sniffer::sep_quote_scores() const {
  TempStats stats = collect_temp_stats(data_, len_, options_.separators, options_.quotes);

  if (stats.separators.empty()) {
    char fallback = (!options_.separators.empty() && !options_.strict) ? options_.separators[0] : '\0';
    stats.separators.emplace_back(fallback, 0);
    trace_.log_decision("no separator scored", options_.strict ? "strict: none" : "lenient: first candidate");
  }
  if (stats.quotes.empty()) {
    char fallback = (!options_.quotes.empty() && !options_.strict) ? options_.quotes[0] : '\0';
    stats.quotes.emplace_back(fallback, 0);
    trace_.log_decision("no quote scored", options_.strict ? "strict: none" : "lenient: first candidate");
  }

  std::vector<SepQuoteScore> scores;
  scores.reserve(stats.separators.size() * stats.quotes.size());
  for (const auto& quote : stats.quotes) {
    for (const auto& sep : stats.separators) {
      int combined = quote.second + sep.second + stats.pair_score(sep.first, quote.first);
      scores.push_back({sep.first, quote.first, combined});
    }
  }
  std::stable_sort(scores.begin(), scores.end(),
                   [](const SepQuoteScore& a, const SepQuoteScore& b) { return a.score > b.score; });
  return scores;
}

std::pair<char, char> Sniffer::best_sep_quote() const {
  std::vector<SepQuoteScore> scores = sep_quote_scores();
  return std::make_pair(scores.front().separator, scores.front().quote);
}

std::string Sniffer::guess_comment() const {
  if (options_.comments.empty()) {
    return std::string();
  }
  std::string_view sample(reinterpret_cast<const char*>(data_), len_);

  int best_score = 0;
  const std::string* best = nullptr;
  for (const std::string& prefix : options_.comments) {
    if (prefix.empty()) {
      continue;
    }
    int score = 0;
    if (sample.substr(0, prefix.size()) == prefix) {
      score += COMMENT_START_BONUS;
    }
    std::string line_start = "\n" + prefix;
    score += static_cast<int>(count_occurrences(sample, line_start)) * COMMENT_BONUS;
    score += static_cast<int>(count_occurrences(sample, line_start + " ")) * COMMENT_SPACE_BONUS;
    trace_.log("comment candidate \"%s\" score=%d", prefix.c_str(), score);
    if (score > best_score) {
      best_score = score;
      best = &prefix;
    }
  }

  if (best == nullptr) {
    return options_.strict ? std::string() : options_.comments[0];
  }
  return *best;
}

char Sniffer::guess_escape(char quote) const {
  if (options_.escapes.empty()) {
    return '\0';
  }
  if (options_.escapes.size() == 1 && !options_.strict) {
    return resolve_escape(options_.escapes[0], quote);
  }

  // Candidate order is kept so that ties go to the first candidate
  std::vector<std::pair<char, int>> scores;
  for (char c : options_.escapes) {
    char resolved = resolve_escape(c, quote);
    bool seen = std::any_of(scores.begin(), scores.end(),
                            [resolved](const std::pair<char, int>& e) { return e.first == resolved; });
    if (!seen) {
      scores.emplace_back(resolved, 0);
    }
  }

  const char* sample = reinterpret_cast<const char*>(data_);
  for (size_t i = 1; i < len_; ++i) {
    if (sample[i] != quote) {
      continue;
    }
    for (auto& entry : scores) {
      if (entry.first == sample[i - 1]) {
        ++entry.second;
        break;
      }
    }
  }

  char escape = scores.front().first;
  int best_score = 0;
  for (const auto& entry : scores) {
    trace_.log_score("escape", entry.first, entry.second);
    if (entry.second > best_score) {
      best_score = entry.second;
      escape = entry.first;
    }
  }
  if (best_score == 0 && options_.strict) {
    return '\0';
  }
  return escape;
}

GuessResult Sniffer::guess_parameters() const {
  GuessResult result;
  const std::string comment = guess_comment();
  const std::vector<SepQuoteScore> scores = sep_quote_scores();

  std::optional<DialectParameters> first;
  for (const SepQuoteScore& candidate : scores) {
    DialectParameters params;
    params.separator = candidate.separator;
    params.quote = candidate.quote;
    params.escape = guess_escape(candidate.quote);
    params.comment = comment;
    params.quote_mode = QuoteMode::FUZZY;

    bool verified = verify_parameters(data_, len_, params);
    trace_.log_candidate(candidate.separator, candidate.quote, candidate.score, verified);
    if (verified) {
      result.dialect = params;
      result.verified = true;
      return result;
    }
    if (!first) {
      first = params;
    }
  }

  if (!options_.strict) {
    trace_.log_decision("no candidate verified", "lenient: returning the top ranked candidate");
    result.dialect = first;
  } else {
    trace_.log_decision("no candidate verified", "strict: no guess");
  }
  return result;
}

bool verify_parameters(const uint8_t* data, size_t len, const DialectParameters& dialect) {
  if (!dialect.validation_error().empty()) {
    return false;
  }

  std::istringstream input(std::string(reinterpret_cast<const char*>(data), len));
  Tokenizer tokenizer(input, dialect);

  size_t num_cols = 0;
  size_t num_rows = 0;
  size_t cols_in_row = 0;
  while (tokenizer.next()) {
    if (tokenizer.is_comment() || tokenizer.is_empty_line()) {
      continue;
    }
    if (tokenizer.at_row_start()) {
      if (num_rows > 1 && cols_in_row != num_cols) {
        return false;
      }
      ++num_rows;
      cols_in_row = 0;
    }
    if (num_rows == 1) {
      ++num_cols;
    } else {
      ++cols_in_row;
    }
  }
  if (tokenizer.has_error()) {
    return false;
  }

  if (num_rows > 2 && num_cols > 1) {
    return true;
  }
  // Exactly two rows: the last one is checked here
  return num_rows == 2 && num_cols > 1 && cols_in_row == num_cols;
}

} // namespace dsvkit
