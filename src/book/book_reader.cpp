
#include "shl/assert.hpp"
#include "shl/memory.hpp"

#include "book/book_reader.hpp"

void init(book_reader *reader)
{
    assert(reader != nullptr);

    fill_memory(reader, 0);
    reader->handle = INVALID_IO_HANDLE;
    init(&reader->toc);
}

void free(book_reader *reader)
{
    assert(reader != nullptr);

    if (reader->owns_handle && reader->handle != INVALID_IO_HANDLE)
        io_close(reader->handle);

    free(&reader->toc);

    fill_memory(reader, 0);
    reader->handle = INVALID_IO_HANDLE;
}

static bool _read_header(book_reader *reader, error *err)
{
    book_range_reader header_reader{};
    init(&header_reader, reader->handle, 0, BOOK_HEADER_SIZE);

    if (!book_record_decode(&header_reader, &reader->header, err))
        return false;

    if (reader->header.magic != BOOK_V1_MAGIC)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "book_reader_open: invalid book magic number %x", reader->header.magic);
        return false;
    }

    return true;
}

static bool _read_toc(book_reader *reader, error *err)
{
    u8 len_buf[BOOK_TOC_LENGTH_SIZE];
    s64 toc_end = reader->file_size - BOOK_TOC_LENGTH_SIZE;

    book_range_reader len_reader{};
    init(&len_reader, reader->handle, toc_end, BOOK_TOC_LENGTH_SIZE);

    if (!book_range_reader_read_exact(&len_reader, len_buf, BOOK_TOC_LENGTH_SIZE, err))
        return false;

    u64 toc_length = 0;

    for (int i = 0; i < BOOK_TOC_LENGTH_SIZE; ++i)
        toc_length = (toc_length << 8) | len_buf[i];

    if (toc_length > BOOK_MAX_TOC_SIZE)
    {
        format_error(err, BOOK_ERROR_TOC_SIZE_EXCEEDED, "book_reader_open: toc size %x exceeds maximum %x", toc_length, (u64)BOOK_MAX_TOC_SIZE);
        return false;
    }

    if (toc_length > (u64)(toc_end - BOOK_HEADER_SIZE))
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "book_reader_open: toc size %x outside bounds of book (%x)", toc_length, reader->file_size);
        return false;
    }

    reader->toc_offset = toc_end - (s64)toc_length;

    book_range_reader toc_reader{};
    init(&toc_reader, reader->handle, reader->toc_offset, (s64)toc_length);

    if (!book_record_decode(&toc_reader, &reader->toc, err))
        return false;

    if (book_range_reader_remaining(&toc_reader) != 0)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "book_reader_open: %x unused bytes after toc", book_range_reader_remaining(&toc_reader));
        return false;
    }

    // chapters live between the header block and the toc
    u64 chapters_end = (u64)reader->toc_offset;

    for (s64 i = 0; i < reader->toc.entries.size; ++i)
    {
        const book_toc_entry *entry = reader->toc.entries.data + i;

        if (!entry->has_span)
            continue;

        if (entry->span.offset < BOOK_HEADER_SIZE
         || entry->span.offset > chapters_end
         || entry->span.length > chapters_end - entry->span.offset)
        {
            format_error(err, BOOK_ERROR_INVALID_FORMAT, "book_reader_open: chapter %x (%x + %x) outside bounds of chapters (%x)",
                         entry->id, entry->span.offset, entry->span.length, chapters_end);
            return false;
        }
    }

    return true;
}

bool book_reader_open(book_reader *reader, io_handle h, error *err)
{
    assert(reader != nullptr);
    assert(h != INVALID_IO_HANDLE);

    init(reader);
    reader->handle = h;

    reader->file_size = io_seek(h, 0, IO_SEEK_END, err);

    if (reader->file_size < 0)
        return false;

    if (reader->file_size < BOOK_HEADER_SIZE + BOOK_TOC_LENGTH_SIZE)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "book_reader_open: book size (%x) smaller than header and toc length (%x)",
                     reader->file_size, (s64)(BOOK_HEADER_SIZE + BOOK_TOC_LENGTH_SIZE));
        return false;
    }

    if (!_read_header(reader, err) || !_read_toc(reader, err))
    {
        free(&reader->toc);
        init(&reader->toc);
        return false;
    }

    return true;
}

bool book_reader_open_path(book_reader *reader, const char *path, error *err)
{
    assert(reader != nullptr);
    assert(path != nullptr);

    io_handle h = io_open(path, open_mode::Read, err);

    if (h == INVALID_IO_HANDLE)
        return false;

    if (!book_reader_open(reader, h, err))
    {
        io_close(h);
        reader->handle = INVALID_IO_HANDLE;
        return false;
    }

    reader->owns_handle = true;
    return true;
}

s64 book_reader_chapter_count(const book_reader *reader)
{
    assert(reader != nullptr);

    return reader->toc.entries.size;
}

u32 book_reader_user_magic(const book_reader *reader)
{
    assert(reader != nullptr);

    return reader->header.user_magic;
}

bool book_reader_find_chapter(const book_reader *reader, u64 id, book_chapter_index *out)
{
    assert(reader != nullptr);
    assert(out != nullptr);

    for (s64 i = 0; i < reader->toc.entries.size; ++i)
    {
        if (reader->toc.entries.data[i].id == id)
        {
            out->value = i;
            return true;
        }
    }

    return false;
}

bool book_reader_chapter_at(const book_reader *reader, s64 n, book_chapter_index *out, error *err)
{
    assert(reader != nullptr);
    assert(out != nullptr);

    if (n < 0 || n >= reader->toc.entries.size)
    {
        format_error(err, BOOK_ERROR_NO_SUCH_CHAPTER, "book_reader_chapter_at: no chapter %x, book has %x", n, reader->toc.entries.size);
        return false;
    }

    out->value = n;
    return true;
}

bool book_reader_get_entry(const book_reader *reader, book_chapter_index index, book_toc_entry *out, error *err)
{
    assert(reader != nullptr);
    assert(out != nullptr);

    if (index.value < 0 || index.value >= reader->toc.entries.size)
    {
        format_error(err, BOOK_ERROR_NO_SUCH_CHAPTER, "book_reader_get_entry: no chapter at index %x", index.value);
        return false;
    }

    *out = reader->toc.entries.data[index.value];
    return true;
}

bool book_reader_chapter_reader(book_reader *reader, book_chapter_index index, book_range_reader *out, error *err)
{
    assert(reader != nullptr);
    assert(out != nullptr);

    book_toc_entry entry{};

    if (!book_reader_get_entry(reader, index, &entry, err))
        return false;

    if (!entry.has_span)
    {
        // no io necessary
        book_range_reader_empty(out);
        return true;
    }

    if (io_seek(reader->handle, (s64)entry.span.offset, IO_SEEK_SET, err) < 0)
        return false;

    init(out, reader->handle, (s64)entry.span.offset, (s64)entry.span.length);
    return true;
}

bool book_reader_read_chapter(book_reader *reader, book_chapter_index index, memory_stream *out, error *err)
{
    assert(reader != nullptr);
    assert(out != nullptr);

    book_range_reader chapter{};

    if (!book_reader_chapter_reader(reader, index, &chapter, err))
        return false;

    return book_range_reader_read_all(&chapter, out, err);
}
