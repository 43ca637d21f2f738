/**
 * @file dsvkit.h
 * @brief dsvkit - Streaming tokenizer, writer and dialect sniffer for delimited text.
 * @version 0.1.0
 *
 * This is the main public header for the dsvkit library. Include this single
 * header to access all public functionality.
 */

#ifndef DSVKIT_H
#define DSVKIT_H

#define DSVKIT_VERSION_MAJOR 0
#define DSVKIT_VERSION_MINOR 1
#define DSVKIT_VERSION_PATCH 0
#define DSVKIT_VERSION_STRING "0.1.0"

#include "common_defs.h"
#include "debug.h"
#include "dialect.h"
#include "error.h"
#include "io_util.h"
#include "preamble.h"
#include "sniffer.h"
#include "tokenizer.h"
#include "writer.h"

#endif // DSVKIT_H
