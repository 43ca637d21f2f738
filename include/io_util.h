/**
 * @file io_util.h
 * @brief Helpers to load samples and whole inputs for the sniffer and the CLI.
 *
 * The Tokenizer streams its input and never needs these; they exist for the
 * Sniffer, which works on a bounded, re-scannable buffer.
 */

#ifndef DSVKIT_IO_UTIL_H
#define DSVKIT_IO_UTIL_H

#include <cstddef>
#include <istream>
#include <string>

namespace dsvkit {

/**
 * @brief Reads at most max_bytes from the start of a file.
 *
 * @throws std::runtime_error If the file cannot be opened ("could not open file")
 *         or a read fails ("could not read the data").
 */
std::string load_sample(const std::string& filename, size_t max_bytes);

/**
 * @brief Reads at most max_bytes from a stream, leaving it positioned after
 *        the bytes read.
 *
 * @throws std::runtime_error If the stream reports a read failure.
 */
std::string read_prefix(std::istream& input, size_t max_bytes);

/**
 * @brief Reads a stream to its end.
 *
 * Used for standard input, which cannot be rewound after sniffing.
 *
 * @throws std::runtime_error If the stream reports a read failure
 *         ("could not read from stdin" for std::cin).
 */
std::string read_all(std::istream& input);

} // namespace dsvkit

#endif // DSVKIT_IO_UTIL_H
