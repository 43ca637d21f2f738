#pragma once

// Terminator search used by the chunk splitter.
//
// A piece ends at the first separator or '\n'. The search runs on Google
// Highway vectors with runtime dispatch; short inputs stay scalar.

#include <cstddef>

namespace dsvkit {

// Defined in src/parser/piece_scan.cpp
size_t find_terminator_simd(const char* data, size_t len, char separator);

namespace detail {

constexpr size_t SIMD_MIN_SIZE = 64;

inline size_t find_terminator_scalar(const char* data, size_t len, char separator) {
  for (size_t i = 0; i < len; ++i) {
    if (data[i] == '\n' || data[i] == separator) {
      return i;
    }
  }
  return len;
}

} // namespace detail

// Returns the index of the first separator or '\n' in data[0, len), or len
// when there is none. A separator of '\n' or 0 searches line breaks only.
inline size_t find_terminator(const char* data, size_t len, char separator) {
  if (separator == '\0') {
    separator = '\n';
  }
  if (len >= detail::SIMD_MIN_SIZE) {
    return find_terminator_simd(data, len, separator);
  }
  return detail::find_terminator_scalar(data, len, separator);
}

} // namespace dsvkit
