
#include "t1/t1.hpp"
#include "fs/path.hpp"
#include "shl/array.hpp"
#include "shl/error.hpp"
#include "shl/io.hpp"
#include "shl/memory.hpp"
#include "shl/memory_stream.hpp"
#include "shl/string.hpp"
#include "shl/defer.hpp"
#include "book/bookfile.hpp"
#include "book/book_record.hpp"
#include "book/range_reader.hpp"

fs::path out_file{};

void setup()
{
    fs::path exe_dir{};
    defer { fs::free(&exe_dir); };

    fs::get_executable_directory_path(&exe_dir);

    fs::set_current_path(exe_dir);

    fs::set_path(&out_file, exe_dir);
    fs::append_path(&out_file, "tmp.record");
}

void cleanup()
{
    fs::free(&out_file);
}

static bool _write_raw_file(const char *path, const void *data, s64 size, error *err)
{
    io_handle h = io_open(path, open_mode::WriteTrunc, err);

    if (h == INVALID_IO_HANDLE)
        return false;

    defer { io_close(h); };

    return io_write(h, (const char*)data, size, err) == size;
}

static void _put_u32_at(array<u8> *bytes, s64 pos, u32 val)
{
    for (int i = 0; i < 4; ++i)
        bytes->data[pos + i] = (u8)(val >> (24 - i * 8));
}

define_test(range_reader_clamps_reads_to_range)
{
    error err{};
    assert_equal(_write_raw_file(out_file.c_str(), "0123456789", 10, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    book_range_reader reader{};
    init(&reader, h, 2, 5);

    char buf[16] = {0};

    assert_equal(book_range_reader_read(&reader, buf, 3, &err), 3);
    assert_equal(compare_strings(buf, "234", 3), 0);
    assert_equal(book_range_reader_tell(&reader), 3);
    assert_equal(book_range_reader_remaining(&reader), 2);

    // moving the handle does not move the reader
    io_seek(h, 0, IO_SEEK_SET, &err);

    assert_equal(book_range_reader_read(&reader, buf, 16, &err), 2);
    assert_equal(compare_strings(buf, "56", 2), 0);

    assert_equal(book_range_reader_read(&reader, buf, 16, &err), 0);
    assert_equal(book_range_reader_remaining(&reader), 0);
    assert_equal(err.error_code, 0);
}

define_test(range_reader_read_exact_fails_past_range)
{
    error err{};
    assert_equal(_write_raw_file(out_file.c_str(), "0123456789", 10, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    book_range_reader reader{};
    init(&reader, h, 6, 3);

    char buf[16] = {0};

    assert_equal(book_range_reader_read_exact(&reader, buf, 4, &err), false);
    assert_equal(err.error_code, BOOK_ERROR_SHORT_READ);
    assert_equal(compare_strings(buf, "678", 3), 0);
}

define_test(range_reader_skip_and_read_all)
{
    error err{};
    assert_equal(_write_raw_file(out_file.c_str(), "0123456789", 10, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    book_range_reader reader{};
    init(&reader, h, 1, 8);

    assert_equal(book_range_reader_skip(&reader, 9), false);
    assert_equal(book_range_reader_skip(&reader, 3), true);
    assert_equal(book_range_reader_tell(&reader), 3);

    memory_stream mem{};
    defer { free(&mem); };

    assert_equal(book_range_reader_read_all(&reader, &mem, &err), true);
    assert_equal(mem.size, 5);
    assert_equal(compare_strings((char*)mem.data, "45678", 5), 0);
    assert_equal(book_range_reader_remaining(&reader), 0);
}

define_test(empty_range_reader_reads_nothing)
{
    error err{};
    book_range_reader reader{};
    book_range_reader_empty(&reader);

    char buf[4] = {0};

    assert_equal(reader.handle, INVALID_IO_HANDLE);
    assert_equal(book_range_reader_read(&reader, buf, 4, &err), 0);
    assert_equal(book_range_reader_remaining(&reader), 0);

    memory_stream mem{};
    defer { free(&mem); };

    assert_equal(book_range_reader_read_all(&reader, &mem, &err), true);
    assert_equal(mem.size, 0);
    assert_equal(err.error_code, 0);
}

define_test(header_record_decodes_to_written_values)
{
    error err{};
    array<u8> bytes{};
    defer { free(&bytes); };

    book_file_header header{};
    header.magic = BOOK_V1_MAGIC;
    header.user_magic = 0x1234;
    book_record_encode(&header, &bytes);

    assert_equal(bytes.size, (s64)(BOOK_RECORD_PREFIX_SIZE + 8));
    assert_equal(_write_raw_file(out_file.c_str(), bytes.data, bytes.size, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    book_range_reader reader{};
    init(&reader, h, 0, bytes.size);

    book_file_header decoded{};
    assert_equal(book_record_decode(&reader, &decoded, &err), true);
    assert_equal(err.error_code, 0);
    assert_equal(decoded.magic, BOOK_V1_MAGIC);
    assert_equal(decoded.user_magic, 0x1234u);
    assert_equal(book_range_reader_remaining(&reader), 0);
}

define_test(toc_record_decodes_spans_and_empty_chapters)
{
    error err{};
    array<u8> bytes{};
    defer { free(&bytes); };

    book_toc toc{};
    init(&toc);
    defer { free(&toc); };

    book_toc_entry entry{};
    entry.id = 11;
    book_toc_add(&toc, &entry);

    entry.id = 22;
    entry.has_span = book_file_span_from(4096, 18, &entry.span);
    book_toc_add(&toc, &entry);

    book_record_encode(&toc, &bytes);
    assert_equal(bytes.size, 58);
    assert_equal(_write_raw_file(out_file.c_str(), bytes.data, bytes.size, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    book_range_reader reader{};
    init(&reader, h, 0, bytes.size);

    book_toc decoded{};
    init(&decoded);
    defer { free(&decoded); };

    assert_equal(book_record_decode(&reader, &decoded, &err), true);
    assert_equal(err.error_code, 0);
    assert_equal(decoded.entries.size, 2);

    assert_equal(decoded.entries[0].id, 11u);
    assert_equal(decoded.entries[0].has_span, false);

    assert_equal(decoded.entries[1].id, 22u);
    assert_equal(decoded.entries[1].has_span, true);
    assert_equal(decoded.entries[1].span.offset, 4096u);
    assert_equal(decoded.entries[1].span.length, 18u);
}

define_test(span_from_zero_length_is_empty)
{
    book_file_span span{};

    assert_equal(book_file_span_from(100, 0, &span), false);
    assert_equal(span.offset, 0u);
    assert_equal(span.length, 0u);

    assert_equal(book_file_span_from(100, 1, &span), true);
    assert_equal(span.offset, 100u);
    assert_equal(span.length, 1u);
}

define_test(decode_rejects_wrong_record_id)
{
    error err{};
    array<u8> bytes{};
    defer { free(&bytes); };

    book_toc toc{};
    init(&toc);
    defer { free(&toc); };

    book_record_encode(&toc, &bytes);
    assert_equal(_write_raw_file(out_file.c_str(), bytes.data, bytes.size, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    book_range_reader reader{};
    init(&reader, h, 0, bytes.size);

    book_file_header header{};
    assert_equal(book_record_decode(&reader, &header, &err), false);
    assert_equal(err.error_code, BOOK_ERROR_INVALID_FORMAT);
}

define_test(decode_rejects_unknown_versions)
{
    error err{};
    array<u8> bytes{};
    defer { free(&bytes); };

    book_file_header header{};
    header.magic = BOOK_V1_MAGIC;
    book_record_encode(&header, &bytes);

    _put_u32_at(&bytes, 4, BOOK_HEADER_VERSION + 1);
    assert_equal(_write_raw_file(out_file.c_str(), bytes.data, bytes.size, &err), true);

    {
        io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
        assert_not_equal(h, INVALID_IO_HANDLE);
        defer { io_close(h); };

        book_range_reader reader{};
        init(&reader, h, 0, bytes.size);

        assert_equal(book_record_decode(&reader, &header, &err), false);
        assert_equal(err.error_code, BOOK_ERROR_INVALID_FORMAT);
    }

    err = error{};
    _put_u32_at(&bytes, 4, 0);
    assert_equal(_write_raw_file(out_file.c_str(), bytes.data, bytes.size, &err), true);

    {
        io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
        assert_not_equal(h, INVALID_IO_HANDLE);
        defer { io_close(h); };

        book_range_reader reader{};
        init(&reader, h, 0, bytes.size);

        assert_equal(book_record_decode(&reader, &header, &err), false);
        assert_equal(err.error_code, BOOK_ERROR_INVALID_FORMAT);
    }
}

define_test(decode_does_not_read_past_range)
{
    error err{};
    array<u8> bytes{};
    defer { free(&bytes); };

    book_toc toc{};
    init(&toc);
    defer { free(&toc); };

    book_toc_entry entry{};
    entry.id = 5;
    entry.has_span = book_file_span_from(4096, 10, &entry.span);
    book_toc_add(&toc, &entry);

    book_record_encode(&toc, &bytes);
    assert_equal(_write_raw_file(out_file.c_str(), bytes.data, bytes.size, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    // the record is complete in the file, but the range ends before it does
    book_range_reader reader{};
    init(&reader, h, 0, bytes.size - 1);

    book_toc decoded{};
    init(&decoded);
    defer { free(&decoded); };

    assert_equal(book_record_decode(&reader, &decoded, &err), false);
    assert_equal(err.error_code, BOOK_ERROR_INVALID_FORMAT);
}

define_test(decode_rejects_zero_length_span)
{
    error err{};
    array<u8> bytes{};
    defer { free(&bytes); };

    book_toc toc{};
    init(&toc);
    defer { free(&toc); };

    book_toc_entry entry{};
    entry.id = 5;
    entry.has_span = book_file_span_from(4096, 10, &entry.span);
    book_toc_add(&toc, &entry);

    book_record_encode(&toc, &bytes);

    // the span length is the last field of the record
    for (s64 i = bytes.size - 8; i < bytes.size; ++i)
        bytes.data[i] = 0;

    assert_equal(_write_raw_file(out_file.c_str(), bytes.data, bytes.size, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    book_range_reader reader{};
    init(&reader, h, 0, bytes.size);

    book_toc decoded{};
    init(&decoded);
    defer { free(&decoded); };

    assert_equal(book_record_decode(&reader, &decoded, &err), false);
    assert_equal(err.error_code, BOOK_ERROR_INVALID_FORMAT);
}

define_test(decode_rejects_impossible_entry_count)
{
    error err{};
    array<u8> bytes{};
    defer { free(&bytes); };

    book_toc toc{};
    init(&toc);
    defer { free(&toc); };

    book_record_encode(&toc, &bytes);

    // entry count directly follows the prefix
    for (s64 i = BOOK_RECORD_PREFIX_SIZE; i < BOOK_RECORD_PREFIX_SIZE + 8; ++i)
        bytes.data[i] = 0xff;

    assert_equal(_write_raw_file(out_file.c_str(), bytes.data, bytes.size, &err), true);

    io_handle h = io_open(out_file.c_str(), open_mode::Read, &err);
    assert_not_equal(h, INVALID_IO_HANDLE);
    defer { io_close(h); };

    book_range_reader reader{};
    init(&reader, h, 0, bytes.size);

    book_toc decoded{};
    init(&decoded);
    defer { free(&decoded); };

    assert_equal(book_record_decode(&reader, &decoded, &err), false);
    assert_equal(err.error_code, BOOK_ERROR_INVALID_FORMAT);
    assert_equal(decoded.entries.size, 0);
}

define_test_main(setup, cleanup);
