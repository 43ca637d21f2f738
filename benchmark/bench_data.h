#ifndef DSVKIT_BENCH_DATA_H
#define DSVKIT_BENCH_DATA_H

#include <cstddef>
#include <sstream>
#include <string>

// Generate delimited data of specified size. Every quote_every-th field is
// quoted and carries an embedded separator and a doubled quote.
inline std::string generate_dsv_data(size_t rows, size_t cols, char sep = ',',
                                     size_t quote_every = 0) {
  std::ostringstream oss;
  // Header
  for (size_t c = 0; c < cols; ++c) {
    if (c > 0) oss << sep;
    oss << "col" << c;
  }
  oss << '\n';
  // Data rows
  size_t n = 0;
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c, ++n) {
      if (c > 0) oss << sep;
      if (quote_every > 0 && n % quote_every == 0) {
        oss << "\"v" << r << sep << "\"\"" << c << "\"";
      } else {
        oss << "value" << r << "_" << c;
      }
    }
    oss << '\n';
  }
  return oss.str();
}

#endif // DSVKIT_BENCH_DATA_H
