#include "preamble.h"

namespace dsvkit {

size_t bom_length(const uint8_t* data, size_t len) {
  if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
    return 3;
  }
  return 0;
}

size_t preamble_length(const uint8_t* data, size_t len) {
  const size_t bom = bom_length(data, len);
  data += bom;
  len -= bom;

  // i is one past the last byte still considered
  size_t i = len;
  while (i > 0) {
    uint8_t c = data[i - 1];
    if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
      break;
    }
    --i;
  }

  bool in_empty_line = false;
  size_t line_start = i;
  for (; i > 0; --i) {
    uint8_t c = data[i - 1];
    if (c == '\n') {
      if (in_empty_line) {
        return line_start + bom;
      }
      in_empty_line = true;
      line_start = i;
    } else if (c != ' ' && c != '\t') {
      in_empty_line = false;
    }
  }
  return in_empty_line ? line_start + bom : bom;
}

} // namespace dsvkit
