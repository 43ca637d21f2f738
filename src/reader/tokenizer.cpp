#include "tokenizer.h"

namespace dsvkit {

Tokenizer::Tokenizer(std::istream& input, const DialectParameters& dialect,
                     const TokenizerOptions& options)
    : dialect_(dialect),
      splitter_(input, dialect.separator, options.chunk_size, options.max_piece_size),
      trace_(options.debug) {
  dialect_.validate();

  if (!dialect_.comment.empty()) {
    comment_collector_ = Collector::comment(dialect_.comment);
  }
  if (dialect_.quote != '\0') {
    quote_collector_ = Collector::quote(dialect_.quote_mode, dialect_.quote, dialect_.escape);
  }
  if (trace_.verbose()) {
    trace_.log_str(("tokenizer " + dialect_.to_string()).c_str());
  }
}

bool Tokenizer::empty_content(std::string_view value) const {
  switch (dialect_.separator) {
  case ' ':
    return value.empty();
  case '\t':
    return value.find_first_not_of(' ') == std::string_view::npos;
  default:
    return value.find_first_not_of(" \t") == std::string_view::npos;
  }
}

bool Tokenizer::next() {
  if (has_error()) {
    return false;
  }

  current_ = Field();
  current_.offset = next_offset_;
  current_.at_row_start = last_row_end_;

  const Collector* active = nullptr;
  std::string_view view;
  bool owned = false;
  bool ready = false;
  size_t raw_length = 0;

  // A field completed by its first piece is served straight from the
  // splitter buffer; anything longer is copied before the next read.
  auto take = [&](std::string_view data, bool done) {
    if (owned) {
      value_.append(data.data(), data.size());
    } else if (done) {
      view = data;
    } else {
      value_.assign(data.data(), data.size());
      owned = true;
    }
  };

  std::string_view piece;
  while (splitter_.next(piece)) {
    raw_length += piece.size();
    current_.at_row_end = piece.back() == '\n';

    if (active != nullptr) {
      CollectResult r = active->end(piece);
      if (!r.matched && active->closed_early(piece)) {
        // Strict quote closed before the terminator: the field is plain text
        std::string_view rest = remove_terminator(piece);
        value_.insert(value_.begin(), dialect_.quote);
        value_.append(rest.data(), rest.size());
        current_.is_quoted = false;
        ready = true;
        break;
      }
      take(r.data, r.matched);
      if (!r.matched) {
        continue;
      }
      ready = true;
      break;
    }

    if (current_.at_row_start && comment_collector_) {
      CollectResult r = comment_collector_->start(piece);
      if (r.matched) {
        current_.is_comment = true;
        r = comment_collector_->end(r.data);
        take(r.data, r.matched);
        if (!r.matched) {
          active = &*comment_collector_;
          continue;
        }
        ready = true;
        break;
      }
    }

    if (quote_collector_) {
      CollectResult r = quote_collector_->start(piece);
      if (r.matched) {
        current_.is_quoted = true;
        r = quote_collector_->end(r.data);
        if (!r.matched && quote_collector_->closed_early(r.data)) {
          current_.is_quoted = false;
          take(remove_terminator(piece), true);
          ready = true;
          break;
        }
        take(r.data, r.matched);
        if (!r.matched) {
          active = &*quote_collector_;
          continue;
        }
        ready = true;
        break;
      }
    }

    take(remove_terminator(piece), true);
    ready = true;
    break;
  }

  if (!ready) {
    if (has_error()) {
      if (trace_.verbose()) {
        trace_.log_str(("tokenizer stopped: " + error()->to_string()).c_str());
      }
      return false;
    }
    if (active == nullptr) {
      return false;
    }
    // Input ended inside a comment or quoted field: deliver what was collected
    current_.at_row_end = true;
    trace_.log("unterminated %s at byte %zu delivered as final field",
               current_.is_comment ? "comment" : "quoted field", current_.offset);
  }

  next_offset_ += raw_length;
  last_row_end_ = current_.at_row_end;

  if (owned) {
    view = value_;
  }
  if (current_.is_quoted && dialect_.escape != '\0' &&
      view.find(dialect_.escape) != std::string_view::npos) {
    if (!owned) {
      value_.assign(view.data(), view.size());
      owned = true;
    }
    unescape_quotes(value_, dialect_.quote, dialect_.escape);
    view = value_;
  }

  current_.data = view;
  current_.is_empty_line =
      current_.at_row_start && current_.at_row_end && empty_content(current_.data);
  return true;
}

bool Tokenizer::next_row(std::vector<std::string>& row) {
  row.clear();
  bool in_row = false;
  while (next()) {
    if (!in_row) {
      if (current_.is_comment || current_.is_empty_line) {
        continue;
      }
      in_row = true;
    }
    row.emplace_back(current_.data);
    if (current_.at_row_end) {
      return true;
    }
  }
  return in_row && !has_error();
}

} // namespace dsvkit
