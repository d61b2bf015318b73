
#pragma once

/* book_writer.hpp

Used to create book files from code.

A book is written front to back: the header block when the writer is opened,
then one chapter after another, then the table of contents when the writer is
finished. Only one chapter can be open at a time.

    book_writer writer{};
    defer { free(&writer); };

    if (!book_writer_open_path(&writer, "out.book", my_magic, err))
        return false;

    book_chapter_writer chapter{};
    defer { free(&chapter, err); };

    if (!book_writer_new_chapter(&writer, 22, &chapter, err))
        return false;

    if (!book_chapter_write(&chapter, data, size, err))
        return false;

    if (!book_chapter_close(&chapter, err))
        return false;

    return book_writer_finish(&writer, err);
 */

#include "shl/io.hpp"
#include "shl/error.hpp"
#include "book/bookfile.hpp"
#include "book/book_record.hpp"

struct book_writer
{
    io_handle handle;
    bool owns_handle;
    s64 current_offset;
    book_file_header header;
    book_toc toc;
    bool chapter_open;
    bool finished;
};

void init(book_writer *writer);
void free(book_writer *writer);

// writes the header block at the start of h. h is borrowed and must stay open until the writer is finished.
bool book_writer_open(book_writer *writer, io_handle h, u32 user_magic, error *err = nullptr);
// creates or truncates the file at path, the writer owns the handle.
bool book_writer_open_path(book_writer *writer, const char *path, u32 user_magic, error *err = nullptr);

/* writes the table of contents and its length.
   the writer cannot be used afterwards. a borrowed handle is left at the end
   of the file, an owned handle is closed.
 */
bool book_writer_finish(book_writer *writer, error *err = nullptr);

struct book_chapter_writer
{
    book_writer *book;
    u64 id;
    s64 offset;
    s64 length;
    bool closed;
};

/* starts a new chapter at the end of the book.
   fails with BOOK_ERROR_CHAPTER_OPEN while another chapter of the same book
   has not been closed or freed.
 */
bool book_writer_new_chapter(book_writer *writer, u64 id, book_chapter_writer *out, error *err = nullptr);

bool book_chapter_write(book_chapter_writer *chapter, const void *data, s64 size, error *err = nullptr);
bool book_chapter_write(book_chapter_writer *chapter, const char *str, error *err = nullptr);

// adds the chapter to the table of contents. closing a closed chapter does nothing.
bool book_chapter_close(book_chapter_writer *chapter, error *err = nullptr);

/* releases the chapter. a chapter that has content but was never closed is a
   programming error and aborts the program, unless pending already holds an
   error, in which case the chapter is dropped without a toc entry.
 */
void free(book_chapter_writer *chapter, const error *pending = nullptr);
