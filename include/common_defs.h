#ifndef DSVKIT_COMMON_DEFS_H
#define DSVKIT_COMMON_DEFS_H

// Default number of bytes pulled from the source per read.
#define DSVKIT_CHUNK_SIZE (64 * 1024)

// Longest piece (bytes between two terminators) the splitter will buffer.
#define DSVKIT_MAX_PIECE_SIZE (16 * 1024 * 1024)

// Bytes of a source inspected by the sniffer when no size is given.
#define DSVKIT_SAMPLE_SIZE 10240

#ifdef _MSC_VER

#ifndef likely
#define likely(x) x
#endif
#ifndef unlikely
#define unlikely(x) x
#endif

#else

#ifndef likely
#define likely(x) __builtin_expect(!!(x), 1)
#endif
#ifndef unlikely
#define unlikely(x) __builtin_expect(!!(x), 0)
#endif

#endif // _MSC_VER

#endif // DSVKIT_COMMON_DEFS_H
