/**
 * @file fuzz_roundtrip.cpp
 * @brief LibFuzzer target checking that written fields read back unchanged.
 *
 * The input is cut into fields at 0x00 bytes and into rows at 0x01 bytes.
 */

#include "tokenizer.h"
#include "writer.h"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  constexpr size_t MAX_INPUT_SIZE = 16 * 1024;
  if (size > MAX_INPUT_SIZE)
    size = MAX_INPUT_SIZE;

  std::vector<std::vector<std::string>> rows(1);
  rows.back().emplace_back();
  for (size_t i = 0; i < size; ++i) {
    char c = static_cast<char>(data[i]);
    if (c == '\x00') {
      rows.back().emplace_back();
    } else if (c == '\x01') {
      rows.emplace_back();
      rows.back().emplace_back();
    } else {
      rows.back().back() += c;
    }
  }

  std::ostringstream out;
  {
    dsvkit::Writer writer(out);
    for (const auto& row : rows) {
      for (const auto& field : row) {
        writer.write_field(field);
      }
      writer.new_row();
    }
    writer.flush();
  }

  dsvkit::DialectParameters dialect;
  dialect.quote_mode = dsvkit::QuoteMode::STRICT;
  std::istringstream in(out.str());
  dsvkit::Tokenizer tokenizer(in, dialect);

  size_t r = 0;
  size_t f = 0;
  while (tokenizer.next()) {
    if (r >= rows.size() || f >= rows[r].size() || tokenizer.field() != rows[r][f])
      __builtin_trap();
    if (tokenizer.at_row_end()) {
      if (f + 1 != rows[r].size())
        __builtin_trap();
      ++r;
      f = 0;
    } else {
      ++f;
    }
  }
  if (r != rows.size())
    __builtin_trap();
  return 0;
}
