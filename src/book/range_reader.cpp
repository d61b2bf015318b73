
#include "shl/assert.hpp"
#include "shl/memory.hpp"

#include "book/bookfile.hpp"
#include "book/range_reader.hpp"

void init(book_range_reader *reader, io_handle h, s64 start, s64 length)
{
    assert(reader != nullptr);
    assert(start >= 0);
    assert(length >= 0);

    reader->handle = h;
    reader->start = start;
    reader->length = length;
    reader->position = 0;
}

void book_range_reader_empty(book_range_reader *reader)
{
    assert(reader != nullptr);

    reader->handle = INVALID_IO_HANDLE;
    reader->start = 0;
    reader->length = 0;
    reader->position = 0;
}

s64 book_range_reader_read(book_range_reader *reader, void *out, s64 size, error *err)
{
    assert(reader != nullptr);
    assert(out != nullptr || size == 0);
    assert(size >= 0);

    s64 remaining = reader->length - reader->position;

    if (size > remaining)
        size = remaining;

    if (size <= 0)
        return 0;

    if (io_seek(reader->handle, reader->start + reader->position, IO_SEEK_SET, err) < 0)
        return -1;

    s64 bytes_read = io_read(reader->handle, (char*)out, size, err);

    if (bytes_read < 0)
        return -1;

    reader->position += bytes_read;

    return bytes_read;
}

bool book_range_reader_read_exact(book_range_reader *reader, void *out, s64 size, error *err)
{
    assert(reader != nullptr);

    char *dst = (char*)out;
    s64 total = 0;

    while (total < size)
    {
        s64 n = book_range_reader_read(reader, dst + total, size - total, err);

        if (n < 0)
            return false;

        if (n == 0)
        {
            format_error(err, BOOK_ERROR_SHORT_READ, "range_reader: expected %x bytes at offset %x, got %x",
                         size, reader->start + reader->position - total, total);
            return false;
        }

        total += n;
    }

    return true;
}

bool book_range_reader_read_all(book_range_reader *reader, memory_stream *out, error *err)
{
    assert(reader != nullptr);
    assert(out != nullptr);

    s64 remaining = book_range_reader_remaining(reader);

    if (remaining == 0)
    {
        fill_memory(out, 0);
        return true;
    }

    init(out, remaining);

    return book_range_reader_read_exact(reader, out->data, remaining, err);
}

bool book_range_reader_skip(book_range_reader *reader, s64 count)
{
    assert(reader != nullptr);
    assert(count >= 0);

    if (count > book_range_reader_remaining(reader))
        return false;

    reader->position += count;
    return true;
}

s64 book_range_reader_tell(const book_range_reader *reader)
{
    assert(reader != nullptr);

    return reader->position;
}

s64 book_range_reader_remaining(const book_range_reader *reader)
{
    assert(reader != nullptr);

    return reader->length - reader->position;
}
