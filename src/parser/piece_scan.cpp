// Terminator search using Google Highway.
//
// This file uses Highway's dynamic dispatch to select the optimal
// implementation at runtime based on CPU capabilities.

#include "dsvkit/piece_scan.h"

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "parser/piece_scan-inl.h"
#include "hwy/foreach_target.h"
#include "parser/piece_scan-inl.h"

// Generate dispatch tables and public API (only once)
#if HWY_ONCE

namespace dsvkit {

HWY_EXPORT(FindTerminatorImpl);

size_t find_terminator_simd(const char* data, size_t len, char separator) {
  return HWY_DYNAMIC_DISPATCH(FindTerminatorImpl)(data, len, separator);
}

} // namespace dsvkit

#endif // HWY_ONCE
