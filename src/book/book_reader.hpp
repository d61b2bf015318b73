
#pragma once

/* book_reader.hpp

Defines structs and functions for opening book files and reading chapters
from them.

Opening reads the header block and the table of contents; chapter contents
are only read on request, through a range reader over the chapter.
Chapter readers share the handle of the book reader and seek it themselves,
so one book reader and its chapter readers must stay on one thread.
*/

#include "shl/io.hpp"
#include "shl/error.hpp"
#include "shl/memory_stream.hpp"

#include "book/bookfile.hpp"
#include "book/book_record.hpp"
#include "book/range_reader.hpp"

// only obtainable from book_reader_find_chapter or book_reader_chapter_at
struct book_chapter_index
{
    s64 value;
};

struct book_reader
{
    io_handle handle;
    bool owns_handle;
    s64 file_size;
    s64 toc_offset;
    book_file_header header;
    book_toc toc;
};

void init(book_reader *reader);
void free(book_reader *reader);

// h is borrowed and must stay open while the reader is used
bool book_reader_open(book_reader *reader, io_handle h, error *err = nullptr);
bool book_reader_open_path(book_reader *reader, const char *path, error *err = nullptr);

s64 book_reader_chapter_count(const book_reader *reader);
u32 book_reader_user_magic(const book_reader *reader);

// Gets the first chapter with the given id, returns false if not found, true if found.
// Chapter ids are not unique.
bool book_reader_find_chapter(const book_reader *reader, u64 id, book_chapter_index *out);

// Gets the index of the nth chapter in write order, fails with BOOK_ERROR_NO_SUCH_CHAPTER if out of range
bool book_reader_chapter_at(const book_reader *reader, s64 n, book_chapter_index *out, error *err = nullptr);

bool book_reader_get_entry(const book_reader *reader, book_chapter_index index, book_toc_entry *out, error *err = nullptr);

bool book_reader_chapter_reader(book_reader *reader, book_chapter_index index, book_range_reader *out, error *err = nullptr);

// reads the entire chapter into out, the caller frees out
bool book_reader_read_chapter(book_reader *reader, book_chapter_index index, memory_stream *out, error *err = nullptr);
