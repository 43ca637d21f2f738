/**
 * @file fuzz_sniffer.cpp
 * @brief LibFuzzer target for fuzz testing dialect guessing.
 */

#include "preamble.h"
#include "sniffer.h"

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size == 0)
    return 0;
  // 16KB limit: the sniffer only looks at a sample, so a smaller limit
  // allows faster fuzzing without losing coverage
  constexpr size_t MAX_INPUT_SIZE = 16 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  size_t skip = dsvkit::preamble_length(data, size);
  if (skip > size)
    __builtin_trap();

  for (bool strict : {false, true}) {
    dsvkit::SnifferOptions options;
    options.strict = strict;
    dsvkit::Sniffer sniffer(data, size, options);
    dsvkit::GuessResult result = sniffer.guess_parameters();
    // A verified guess always passes verification again
    if (result.verified && !dsvkit::verify_parameters(data, size, *result.dialect))
      __builtin_trap();
    if (!strict && !result.success())
      __builtin_trap();
  }
  return 0;
}
