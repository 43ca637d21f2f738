#include "collectors.h"

namespace dsvkit {

namespace {

bool is_blank(char c) { return c == ' ' || c == '\t'; }

} // namespace

std::string_view remove_terminator(std::string_view piece) {
  if (piece.size() > 1 && piece[piece.size() - 1] == '\n' && piece[piece.size() - 2] == '\r') {
    return piece.substr(0, piece.size() - 2);
  }
  if (piece.empty()) {
    return piece;
  }
  return piece.substr(0, piece.size() - 1);
}

bool ends_with_unescaped_quote(std::string_view data, char quote, char escape) {
  if (data.empty() || data.back() != quote) {
    return false;
  }
  // Count the escape bytes right before the candidate closing quote
  bool escaped = false;
  for (size_t i = data.size() - 1; i > 0 && data[i - 1] == escape; --i) {
    escaped = !escaped;
  }
  return !escaped;
}

void unescape_quotes(std::string& value, char quote, char escape) {
  if (value.empty() || escape == '\0') {
    return;
  }
  size_t out = 0;
  size_t i = 0;
  const size_t n = value.size();
  while (i < n) {
    if (value[i] == escape && i + 1 < n && value[i + 1] == quote) {
      value[out++] = quote;
      i += 2;
    } else {
      value[out++] = value[i++];
    }
  }
  value.resize(out);
}

Collector Collector::comment(const std::string& prefix) {
  return Collector(CollectorKind::COMMENT, prefix, '\0', '\0');
}

Collector Collector::quote(QuoteMode mode, char quote, char escape) {
  CollectorKind kind =
      mode == QuoteMode::STRICT ? CollectorKind::STRICT_QUOTE : CollectorKind::FUZZY_QUOTE;
  return Collector(kind, std::string(), quote, escape);
}

CollectResult Collector::start(std::string_view piece) const {
  switch (kind_) {
  case CollectorKind::COMMENT:
    if (piece.size() >= prefix_.size() && piece.compare(0, prefix_.size(), prefix_) == 0) {
      return {piece.substr(prefix_.size()), true};
    }
    return {piece, false};

  case CollectorKind::STRICT_QUOTE:
    if (!piece.empty() && piece[0] == quote_) {
      return {piece.substr(1), true};
    }
    return {piece, false};

  case CollectorKind::FUZZY_QUOTE: {
    size_t i = 0;
    while (i < piece.size() && is_blank(piece[i])) {
      ++i;
    }
    if (i < piece.size() && piece[i] == quote_) {
      return {piece.substr(i + 1), true};
    }
    return {piece, false};
  }
  }
  return {piece, false};
}

CollectResult Collector::end(std::string_view piece) const {
  switch (kind_) {
  case CollectorKind::COMMENT:
    if (!piece.empty() && piece.back() == '\n') {
      return {remove_terminator(piece), true};
    }
    return {piece, false};

  case CollectorKind::STRICT_QUOTE: {
    CollectResult r = end_quoted(remove_terminator(piece));
    return r.matched ? r : CollectResult{piece, false};
  }

  case CollectorKind::FUZZY_QUOTE: {
    std::string_view content = remove_terminator(piece);
    while (!content.empty() && is_blank(content.back())) {
      content.remove_suffix(1);
    }
    CollectResult r = end_quoted(content);
    return r.matched ? r : CollectResult{piece, false};
  }
  }
  return {piece, false};
}

bool Collector::closed_early(std::string_view piece) const {
  if (kind_ != CollectorKind::STRICT_QUOTE) {
    return false;
  }
  std::string_view content = remove_terminator(piece);
  for (size_t i = 0; i < content.size(); ++i) {
    if (escape_ != '\0' && content[i] == escape_ && i + 1 < content.size() &&
        content[i + 1] == quote_) {
      ++i;
    } else if (content[i] == quote_) {
      return true;
    }
  }
  return false;
}

CollectResult Collector::end_quoted(std::string_view content) const {
  if (ends_with_unescaped_quote(content, quote_, escape_)) {
    content.remove_suffix(1);
    return {content, true};
  }
  return {content, false};
}

} // namespace dsvkit
