
#pragma once

#include "shl/number_types.hpp"

/* book structure:
 * [header block (BOOK_HEADER_SIZE bytes)
 *   header record (see book_record.hpp), zero padded
 *     u32 format magic BOOK_V1_MAGIC
 *     u32 user magic
 * ]
 * [chapters
 *   chapter contents, back to back in write order, no padding
 * ]
 * [table of contents
 *   toc record (see book_record.hpp)
 *     [entry 1
 *       u64 id
 *       optional span: u64 offset, u64 length
 *     ]
 *     [entry 2 ...]
 * ]
 * [toc length
 *   u64 big endian, size of the toc record that precedes it
 * ]
 *
 * There is no checksum over any of these.
 */

#define BOOK_V1_MAGIC        0xFF330001u
#define BOOK_HEADER_SIZE     4096
#define BOOK_TOC_LENGTH_SIZE 8
#define BOOK_MAX_TOC_SIZE    0x4000000 // 64MB

#define BOOK_ERROR_INVALID_FORMAT     1
#define BOOK_ERROR_TOC_SIZE_EXCEEDED  2
#define BOOK_ERROR_NO_SUCH_CHAPTER    3
#define BOOK_ERROR_CHAPTER_OPEN       4
#define BOOK_ERROR_WRITER_FINISHED    5
#define BOOK_ERROR_SHORT_READ         6
#define BOOK_ERROR_CHAPTER_CLOSED     7
#define BOOK_ERROR_SHORT_WRITE        8

struct book_file_header
{
    u32 magic;
    u32 user_magic;
};

// a span is never empty, a chapter without content has no span.
struct book_file_span
{
    u64 offset;
    u64 length;
};

struct book_toc_entry
{
    u64 id;
    bool has_span;
    book_file_span span;
};

// returns false if length is 0, in which case out is left untouched.
bool book_file_span_from(u64 offset, u64 length, book_file_span *out);
