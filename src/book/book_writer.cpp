
#include <stdio.h>
#include <stdlib.h>

#include "shl/assert.hpp"
#include "shl/array.hpp"
#include "shl/defer.hpp"
#include "shl/memory.hpp"
#include "shl/string.hpp"
#include "book/book_writer.hpp"

[[noreturn]] static void _fatal(const char *msg)
{
    fprintf(stderr, "book_writer: %s\n", msg);
    abort();
}

// io_write may write less than asked for.
// out_written holds what reached the handle, also on failure.
static bool _write_all(io_handle h, const void *data, s64 size, s64 *out_written, error *err)
{
    const char *src = (const char*)data;
    *out_written = 0;

    while (*out_written < size)
    {
        s64 n = io_write(h, src + *out_written, size - *out_written, err);

        if (n < 0)
            return false;

        if (n == 0)
        {
            format_error(err, BOOK_ERROR_SHORT_WRITE, "could not write %x remaining bytes", size - *out_written);
            return false;
        }

        *out_written += n;
    }

    return true;
}

void init(book_writer *writer)
{
    assert(writer != nullptr);

    fill_memory(writer, 0);
    writer->handle = INVALID_IO_HANDLE;
    init(&writer->toc);
}

void free(book_writer *writer)
{
    assert(writer != nullptr);

    if (writer->owns_handle && writer->handle != INVALID_IO_HANDLE)
        io_close(writer->handle);

    free(&writer->toc);

    fill_memory(writer, 0);
    writer->handle = INVALID_IO_HANDLE;
}

static bool _write_header(book_writer *writer, error *err)
{
    array<u8> buf{};
    defer { free(&buf); };

    book_record_encode(&writer->header, &buf);

    if (buf.size > BOOK_HEADER_SIZE)
        _fatal("serialized header exceeds the header block size");

    s64 used = buf.size;
    resize(&buf, BOOK_HEADER_SIZE);
    fill_memory(buf.data + used, 0, BOOK_HEADER_SIZE - used);

    if (io_seek(writer->handle, 0, IO_SEEK_SET, err) < 0)
        return false;

    s64 written = 0;
    bool ok = _write_all(writer->handle, buf.data, buf.size, &written, err);
    writer->current_offset = written;

    return ok;
}

bool book_writer_open(book_writer *writer, io_handle h, u32 user_magic, error *err)
{
    assert(writer != nullptr);
    assert(h != INVALID_IO_HANDLE);

    init(writer);

    writer->handle = h;
    writer->owns_handle = false;
    writer->header.magic = BOOK_V1_MAGIC;
    writer->header.user_magic = user_magic;

    return _write_header(writer, err);
}

bool book_writer_open_path(book_writer *writer, const char *path, u32 user_magic, error *err)
{
    assert(writer != nullptr);
    assert(path != nullptr);

    io_handle h = io_open(path, open_mode::WriteTrunc, err);

    if (h == INVALID_IO_HANDLE)
        return false;

    if (!book_writer_open(writer, h, user_magic, err))
    {
        io_close(h);
        writer->handle = INVALID_IO_HANDLE;
        return false;
    }

    writer->owns_handle = true;
    return true;
}

bool book_writer_finish(book_writer *writer, error *err)
{
    assert(writer != nullptr);

    if (writer->finished)
    {
        set_error(err, BOOK_ERROR_WRITER_FINISHED, "book_writer_finish: book was already finished");
        return false;
    }

    if (writer->chapter_open)
    {
        set_error(err, BOOK_ERROR_CHAPTER_OPEN, "book_writer_finish: a chapter is still open");
        return false;
    }

    array<u8> buf{};
    defer { free(&buf); };

    book_record_encode(&writer->toc, &buf);

    // the toc length has a fixed size at a fixed position relative to the end of the file
    u64 toc_length = (u64)buf.size;

    for (int shift = 56; shift >= 0; shift -= 8)
        add_at_end(&buf, (u8)(toc_length >> shift));

    s64 written = 0;
    bool ok = _write_all(writer->handle, buf.data, buf.size, &written, err);
    writer->current_offset += written;

    if (!ok)
        return false;

    writer->finished = true;

    if (writer->owns_handle)
    {
        io_close(writer->handle);
        writer->handle = INVALID_IO_HANDLE;
        writer->owns_handle = false;
    }

    return true;
}

bool book_writer_new_chapter(book_writer *writer, u64 id, book_chapter_writer *out, error *err)
{
    assert(writer != nullptr);
    assert(out != nullptr);

    if (writer->finished)
    {
        set_error(err, BOOK_ERROR_WRITER_FINISHED, "book_writer_new_chapter: book was already finished");
        return false;
    }

    if (writer->chapter_open)
    {
        format_error(err, BOOK_ERROR_CHAPTER_OPEN, "book_writer_new_chapter: cannot start chapter %x while another chapter is open", id);
        return false;
    }

    out->book = writer;
    out->id = id;
    out->offset = writer->current_offset;
    out->length = 0;
    out->closed = false;

    writer->chapter_open = true;

    return true;
}

bool book_chapter_write(book_chapter_writer *chapter, const void *data, s64 size, error *err)
{
    assert(chapter != nullptr);
    assert(chapter->book != nullptr);
    assert(data != nullptr || size == 0);

    if (chapter->closed)
    {
        format_error(err, BOOK_ERROR_CHAPTER_CLOSED, "book_chapter_write: chapter %x is closed", chapter->id);
        return false;
    }

    // bytes that made it to disk belong to the chapter, even if the write failed
    s64 written = 0;
    bool ok = _write_all(chapter->book->handle, data, size, &written, err);

    chapter->length += written;
    chapter->book->current_offset += written;

    return ok;
}

bool book_chapter_write(book_chapter_writer *chapter, const char *str, error *err)
{
    assert(str != nullptr);

    return book_chapter_write(chapter, str, string_length(str), err);
}

bool book_chapter_close(book_chapter_writer *chapter, error *)
{
    assert(chapter != nullptr);
    assert(chapter->book != nullptr);

    if (chapter->closed)
        return true;

    // writes go straight to the handle, nothing is buffered here
    book_toc_entry entry{};
    entry.id = chapter->id;
    entry.has_span = book_file_span_from((u64)chapter->offset, (u64)chapter->length, &entry.span);

    book_toc_add(&chapter->book->toc, &entry);

    chapter->closed = true;
    chapter->book->chapter_open = false;

    return true;
}

void free(book_chapter_writer *chapter, const error *pending)
{
    assert(chapter != nullptr);

    if (chapter->book == nullptr || chapter->closed)
    {
        fill_memory(chapter, 0);
        return;
    }

    if (chapter->length != 0 && (pending == nullptr || pending->error_code == 0))
        _fatal("chapter was freed without calling book_chapter_close");

    chapter->book->chapter_open = false;
    fill_memory(chapter, 0);
}
