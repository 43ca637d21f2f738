// Terminator search using Google Highway.
//
// This file is included multiple times by piece_scan.cpp with different
// SIMD targets defined by Highway's foreach_target.h mechanism.

#if defined(DSVKIT_PIECE_SCAN_INL_H_) == defined(HWY_TARGET_TOGGLE)
#ifdef DSVKIT_PIECE_SCAN_INL_H_
#undef DSVKIT_PIECE_SCAN_INL_H_
#else
#define DSVKIT_PIECE_SCAN_INL_H_
#endif

#include "hwy/highway.h"

#include <cstddef>
#include <cstdint>

HWY_BEFORE_NAMESPACE();
namespace dsvkit {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// Index of the first separator or '\n' in data[0, len), len if none.
HWY_NOINLINE size_t FindTerminatorImpl(const char* data, size_t len, char separator) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data);
  const hn::ScalableTag<uint8_t> d;
  const size_t N = hn::Lanes(d);
  const auto newline = hn::Set(d, static_cast<uint8_t>('\n'));
  const auto sep = hn::Set(d, static_cast<uint8_t>(separator));

  size_t i = 0;
  for (; i + N <= len; i += N) {
    auto block = hn::LoadU(d, bytes + i);
    auto match = hn::Or(hn::Eq(block, newline), hn::Eq(block, sep));
    intptr_t pos = hn::FindFirstTrue(d, match);
    if (pos >= 0) {
      return i + static_cast<size_t>(pos);
    }
  }

  // Scalar tail
  for (; i < len; ++i) {
    if (bytes[i] == '\n' || bytes[i] == static_cast<uint8_t>(separator)) {
      return i;
    }
  }
  return len;
}

} // namespace HWY_NAMESPACE
} // namespace dsvkit
HWY_AFTER_NAMESPACE();

#endif // DSVKIT_PIECE_SCAN_INL_H_
