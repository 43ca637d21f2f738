#include "chunk_splitter.h"

#include "dsvkit/piece_scan.h"

#include <algorithm>
#include <cstring>
#include <exception>

namespace dsvkit {

ChunkSplitter::ChunkSplitter(std::istream& input, char separator, size_t chunk_size,
                             size_t max_piece_size)
    : input_(&input), separator_(separator == '\0' ? '\n' : separator),
      chunk_size_(chunk_size > 0 ? chunk_size : DSVKIT_CHUNK_SIZE),
      max_piece_size_(max_piece_size) {}

bool ChunkSplitter::next(std::string_view& piece) {
  if (error_) {
    return false;
  }

  while (true) {
    size_t avail = end_ - begin_;

    if (scanned_ < avail) {
      const char* from = buffer_.data() + begin_ + scanned_;
      size_t pos = scanned_ + find_terminator(from, avail - scanned_, separator_);
      if (pos < avail) {
        piece = std::string_view(buffer_.data() + begin_, pos + 1);
        begin_ += pos + 1;
        consumed_ += pos + 1;
        scanned_ = 0;
        row_open_ = piece.back() != '\n';
        return true;
      }
      scanned_ = avail;
    }

    if (eof_) {
      if (avail == 0) {
        if (!row_open_) {
          return false;
        }
        // Stream ended right after a separator: close the row with an empty field
        buffer_.resize(std::max<size_t>(buffer_.size(), 1));
        buffer_[0] = '\n';
        begin_ = end_ = 0;
        piece = std::string_view(buffer_.data(), 1);
        row_open_ = false;
        return true;
      }
      // Last piece of the stream has no terminator: close it with '\n'
      if (end_ == buffer_.size()) {
        buffer_.push_back('\n');
      } else {
        buffer_[end_] = '\n';
      }
      ++end_;
      piece = std::string_view(buffer_.data() + begin_, avail + 1);
      consumed_ += avail;
      begin_ = end_;
      scanned_ = 0;
      row_open_ = false;
      return true;
    }

    if (unlikely(avail >= max_piece_size_)) {
      error_.emplace(ErrorCode::FIELD_TOO_LARGE, ErrorSeverity::FATAL, consumed_,
                     "Piece exceeds maximum size of " + std::to_string(max_piece_size_) +
                         " bytes without a separator or line break");
      return false;
    }

    if (!fill()) {
      return false;
    }
  }
}

bool ChunkSplitter::fill() {
  size_t avail = end_ - begin_;
  if (begin_ > 0) {
    if (avail > 0) {
      std::memmove(buffer_.data(), buffer_.data() + begin_, avail);
    }
    begin_ = 0;
    end_ = avail;
  }
  // One spare byte for the synthetic line break
  if (buffer_.size() < end_ + chunk_size_ + 1) {
    buffer_.resize(end_ + chunk_size_ + 1);
  }

  std::streamsize bytes_read = 0;
  try {
    input_->read(buffer_.data() + end_, static_cast<std::streamsize>(chunk_size_));
    bytes_read = input_->gcount();
  } catch (const std::exception& e) {
    error_.emplace(ErrorCode::IO_ERROR, ErrorSeverity::FATAL, consumed_ + avail,
                   std::string("Read failed: ") + e.what());
    return false;
  }

  if (input_->bad()) {
    error_.emplace(ErrorCode::IO_ERROR, ErrorSeverity::FATAL, consumed_ + avail,
                   "Read failed: stream is in a bad state");
    return false;
  }

  end_ += static_cast<size_t>(bytes_read);
  if (bytes_read == 0 || !*input_) {
    eof_ = true;
  }
  return true;
}

} // namespace dsvkit
