/**
 * @file fuzz_tokenizer.cpp
 * @brief LibFuzzer target for fuzz testing the tokenizer.
 *
 * The first input byte selects the dialect, the rest is tokenized with a
 * small chunk size so that fields routinely span reads.
 */

#include "tokenizer.h"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size < 2)
    return 0;
  // 64KB limit to keep iterations fast
  constexpr size_t MAX_INPUT_SIZE = 64 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  const uint8_t selector = data[0];
  static const char separators[] = {',', ';', '\t', '|', ' ', '\n', '\0', 'x'};
  static const char escapes[] = {'"', '\\', '\0', '\''};

  dsvkit::DialectParameters dialect;
  dialect.separator = separators[selector & 0x7];
  dialect.escape = escapes[(selector >> 3) & 0x3];
  dialect.quote_mode = (selector & 0x20) ? dsvkit::QuoteMode::STRICT : dsvkit::QuoteMode::FUZZY;
  if (selector & 0x40)
    dialect.comment.clear();
  if (!dialect.validation_error().empty())
    return 0;

  dsvkit::TokenizerOptions options;
  options.chunk_size = 7;

  std::istringstream input(std::string(reinterpret_cast<const char*>(data + 1), size - 1));
  dsvkit::Tokenizer tokenizer(input, dialect, options);

  size_t fields = 0;
  bool last_row_end = true;
  while (tokenizer.next()) {
    // Every field after a row end starts a new row
    if (tokenizer.at_row_start() != last_row_end)
      __builtin_trap();
    last_row_end = tokenizer.at_row_end();
    ++fields;
  }
  if (fields > 0 && !last_row_end)
    __builtin_trap();

  return 0;
}
