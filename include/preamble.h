/**
 * @file preamble.h
 * @brief Locates a UTF-8 byte order mark and a free-text preamble.
 *
 * Some exports put a title or a few notes above the table, separated from it
 * by a blank line. preamble_length() returns the offset at which tabular
 * data is expected to start so that the caller can skip those lines before
 * sniffing or tokenizing.
 */

#ifndef DSVKIT_PREAMBLE_H
#define DSVKIT_PREAMBLE_H

#include <cstddef>
#include <cstdint>

namespace dsvkit {

/// Returns 3 if data starts with the UTF-8 BOM (EF BB BF), otherwise 0.
size_t bom_length(const uint8_t* data, size_t len);

/**
 * @brief Estimates the number of bytes before the table.
 *
 * Trailing whitespace is ignored. The result is the offset just past the
 * last blank line (spaces and tabs only) that is followed by a non-blank
 * line; the start of the buffer counts as a line boundary. Without such a
 * line only the BOM, if any, is skipped. The BOM is always part of the
 * preamble.
 */
size_t preamble_length(const uint8_t* data, size_t len);

} // namespace dsvkit

#endif // DSVKIT_PREAMBLE_H
