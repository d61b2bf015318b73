
#pragma once

/* range_reader.hpp

A reader restricted to the byte range [start, start + length) of an io handle.
Used to read chapter contents and to decode the table of contents without
ever reading past the boundaries of either.

The reader keeps its own cursor and seeks the handle to it before every read,
so the position of the handle in between reads does not matter. The handle is
borrowed, not owned. Readers sharing a handle must not be used from different
threads at the same time.
 */

#include "shl/io.hpp"
#include "shl/error.hpp"
#include "shl/memory_stream.hpp"
#include "shl/number_types.hpp"

struct book_range_reader
{
    io_handle handle;
    s64 start;
    s64 length;
    s64 position; // relative to start
};

// binds the range, does not seek or read.
void init(book_range_reader *reader, io_handle h, s64 start, s64 length);

// a zero length range that never touches any handle.
void book_range_reader_empty(book_range_reader *reader);

/* reads up to size bytes from the current position, clamped to the end of the range.
   returns the number of bytes read, 0 once the range is exhausted, -1 on error.
 */
s64 book_range_reader_read(book_range_reader *reader, void *out, s64 size, error *err = nullptr);

// reads exactly size bytes or fails with BOOK_ERROR_SHORT_READ
bool book_range_reader_read_exact(book_range_reader *reader, void *out, s64 size, error *err = nullptr);

// reads everything from the current position to the end of the range into out.
// out is initialized by this function, the caller frees it, also on failure.
bool book_range_reader_read_all(book_range_reader *reader, memory_stream *out, error *err = nullptr);

// moves the position forward, returns false if that would leave the range
bool book_range_reader_skip(book_range_reader *reader, s64 count);

s64 book_range_reader_tell(const book_range_reader *reader);
s64 book_range_reader_remaining(const book_range_reader *reader);
