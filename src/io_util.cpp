#include "io_util.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace dsvkit {

namespace {

constexpr size_t READ_BLOCK = 64 * 1024;

} // namespace

std::string read_prefix(std::istream& input, size_t max_bytes) {
  std::string data;
  while (data.size() < max_bytes) {
    size_t want = std::min(READ_BLOCK, max_bytes - data.size());
    size_t old_size = data.size();
    data.resize(old_size + want);
    input.read(&data[old_size], static_cast<std::streamsize>(want));
    data.resize(old_size + static_cast<size_t>(input.gcount()));
    if (input.bad()) {
      throw std::runtime_error("could not read the data");
    }
    if (!input) {
      break;
    }
  }
  return data;
}

std::string load_sample(const std::string& filename, size_t max_bytes) {
  std::ifstream input(filename, std::ios::binary);
  if (!input) {
    throw std::runtime_error("could not open file");
  }
  return read_prefix(input, max_bytes);
}

std::string read_all(std::istream& input) {
  std::string data;
  char block[READ_BLOCK];
  while (input) {
    input.read(block, sizeof(block));
    data.append(block, static_cast<size_t>(input.gcount()));
  }
  if (input.bad()) {
    throw std::runtime_error(&input == &std::cin ? "could not read from stdin"
                                                  : "could not read the data");
  }
  return data;
}

} // namespace dsvkit
