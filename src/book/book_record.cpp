
#include "shl/assert.hpp"
#include "shl/defer.hpp"
#include "shl/memory.hpp"
#include "shl/memory_stream.hpp"

#include "book/book_record.hpp"

bool book_file_span_from(u64 offset, u64 length, book_file_span *out)
{
    assert(out != nullptr);

    if (length == 0)
        return false;

    out->offset = offset;
    out->length = length;
    return true;
}

void init(book_toc *toc)
{
    assert(toc != nullptr);

    init(&toc->entries);
}

void free(book_toc *toc)
{
    assert(toc != nullptr);

    free(&toc->entries);
}

void book_toc_add(book_toc *toc, const book_toc_entry *entry)
{
    assert(toc != nullptr);
    assert(entry != nullptr);

    book_toc_entry *x = add_at_end(&toc->entries);
    *x = *entry;
}

// encoding

static void _put_u8(array<u8> *out, u8 val)
{
    add_at_end(out, val);
}

static void _put_u32(array<u8> *out, u32 val)
{
    for (int shift = 24; shift >= 0; shift -= 8)
        add_at_end(out, (u8)(val >> shift));
}

static void _put_u64(array<u8> *out, u64 val)
{
    for (int shift = 56; shift >= 0; shift -= 8)
        add_at_end(out, (u8)(val >> shift));
}

static s64 _begin_record(array<u8> *out, u32 id, u32 version)
{
    s64 record_start = out->size;

    _put_u32(out, id);
    _put_u32(out, version);
    _put_u64(out, 0); // payload size placeholder

    return record_start;
}

static void _end_record(array<u8> *out, s64 record_start)
{
    s64 payload_start = record_start + BOOK_RECORD_PREFIX_SIZE;
    u64 payload_size = (u64)(out->size - payload_start);
    u8 *dst = out->data + record_start + 8;

    for (int i = 0; i < 8; ++i)
        dst[i] = (u8)(payload_size >> (56 - i * 8));
}

void book_record_encode(const book_file_header *header, array<u8> *out)
{
    assert(header != nullptr);
    assert(out != nullptr);

    s64 start = _begin_record(out, BOOK_RECORD_ID_HEADER, BOOK_HEADER_VERSION);
    _put_u32(out, header->magic);
    _put_u32(out, header->user_magic);
    _end_record(out, start);
}

void book_record_encode(const book_toc *toc, array<u8> *out)
{
    assert(toc != nullptr);
    assert(out != nullptr);

    s64 start = _begin_record(out, BOOK_RECORD_ID_TOC, BOOK_TOC_VERSION);
    _put_u64(out, (u64)toc->entries.size);

    for (s64 i = 0; i < toc->entries.size; ++i)
    {
        const book_toc_entry *entry = toc->entries.data + i;

        _put_u64(out, entry->id);

        if (entry->has_span)
        {
            assert(entry->span.length > 0);

            _put_u8(out, 1);
            _put_u64(out, entry->span.offset);
            _put_u64(out, entry->span.length);
        }
        else
            _put_u8(out, 0);
    }

    _end_record(out, start);
}

// decoding

struct _payload
{
    const u8 *data;
    s64 size;
    s64 position;
};

static bool _take(_payload *p, s64 count, const u8 **out, error *err)
{
    if (p->size - p->position < count)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: payload truncated at %x of %x", p->position, p->size);
        return false;
    }

    *out = p->data + p->position;
    p->position += count;
    return true;
}

static bool _take_u8(_payload *p, u8 *out, error *err)
{
    const u8 *b;

    if (!_take(p, 1, &b, err))
        return false;

    *out = b[0];
    return true;
}

static u64 _be_u64(const u8 *b)
{
    u64 ret = 0;

    for (int i = 0; i < 8; ++i)
        ret = (ret << 8) | b[i];

    return ret;
}

static u32 _be_u32(const u8 *b)
{
    return ((u32)b[0] << 24) | ((u32)b[1] << 16) | ((u32)b[2] << 8) | (u32)b[3];
}

static bool _take_u32(_payload *p, u32 *out, error *err)
{
    const u8 *b;

    if (!_take(p, 4, &b, err))
        return false;

    *out = _be_u32(b);
    return true;
}

static bool _take_u64(_payload *p, u64 *out, error *err)
{
    const u8 *b;

    if (!_take(p, 8, &b, err))
        return false;

    *out = _be_u64(b);
    return true;
}

static bool _decode_header_v1(_payload *p, book_file_header *out, error *err)
{
    if (!_take_u32(p, &out->magic, err))
        return false;

    return _take_u32(p, &out->user_magic, err);
}

static bool _decode_toc_v1(_payload *p, book_toc *out, error *err)
{
    u64 count = 0;

    if (!_take_u64(p, &count, err))
        return false;

    // smallest entry is an id and an empty span flag
    if (count > (u64)(p->size - p->position) / 9)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: toc entry count %x too large for payload of size %x", count, p->size);
        return false;
    }

    for (u64 i = 0; i < count; ++i)
    {
        book_toc_entry entry{};
        u8 has_span = 0;

        if (!_take_u64(p, &entry.id, err))
            return false;

        if (!_take_u8(p, &has_span, err))
            return false;

        if (has_span > 1)
        {
            format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: invalid span flag %x in toc entry %x", (u32)has_span, i);
            return false;
        }

        if (has_span == 1)
        {
            if (!_take_u64(p, &entry.span.offset, err))
                return false;

            if (!_take_u64(p, &entry.span.length, err))
                return false;

            if (entry.span.length == 0)
            {
                format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: toc entry %x has a zero length span", i);
                return false;
            }

            entry.has_span = true;
        }

        book_toc_add(out, &entry);
    }

    return true;
}

typedef bool (*header_decoder)(_payload *p, book_file_header *out, error *err);
typedef bool (*toc_decoder)(_payload *p, book_toc *out, error *err);

// indexed by schema version, each decoder upgrades to the latest struct
static const header_decoder _header_decoders[BOOK_HEADER_VERSION + 1] = {
    nullptr,
    _decode_header_v1
};

static const toc_decoder _toc_decoders[BOOK_TOC_VERSION + 1] = {
    nullptr,
    _decode_toc_v1
};

// reads the record prefix and the entire payload into mem
static bool _read_record(book_range_reader *src, u32 expected_id, u32 latest_version, u32 *out_version, memory_stream *mem, error *err)
{
    u8 prefix[BOOK_RECORD_PREFIX_SIZE];

    if (book_range_reader_remaining(src) < BOOK_RECORD_PREFIX_SIZE)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: %x bytes left, too small for a record", book_range_reader_remaining(src));
        return false;
    }

    if (!book_range_reader_read_exact(src, prefix, BOOK_RECORD_PREFIX_SIZE, err))
        return false;

    u32 id = _be_u32(prefix);
    u32 version = _be_u32(prefix + 4);
    u64 payload_size = _be_u64(prefix + 8);

    if (id != expected_id)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: expected record id %x, got %x", expected_id, id);
        return false;
    }

    if (version == 0 || version > latest_version)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: unsupported version %x of record %x", version, id);
        return false;
    }

    if (payload_size > (u64)book_range_reader_remaining(src))
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: payload size %x exceeds available %x", payload_size, book_range_reader_remaining(src));
        return false;
    }

    book_range_reader payload_reader{};
    init(&payload_reader, src->handle, src->start + src->position, (s64)payload_size);

    if (!book_range_reader_read_all(&payload_reader, mem, err))
        return false;

    book_range_reader_skip(src, (s64)payload_size);
    *out_version = version;

    return true;
}

static bool _check_consumed(const _payload *p, error *err)
{
    if (p->position != p->size)
    {
        format_error(err, BOOK_ERROR_INVALID_FORMAT, "record: %x trailing bytes in payload", p->size - p->position);
        return false;
    }

    return true;
}

bool book_record_decode(book_range_reader *src, book_file_header *out, error *err)
{
    assert(src != nullptr);
    assert(out != nullptr);

    memory_stream mem{};
    defer { free(&mem); };
    u32 version = 0;

    if (!_read_record(src, BOOK_RECORD_ID_HEADER, BOOK_HEADER_VERSION, &version, &mem, err))
        return false;

    _payload p{(const u8*)mem.data, mem.size, 0};

    if (!_header_decoders[version](&p, out, err))
        return false;

    return _check_consumed(&p, err);
}

bool book_record_decode(book_range_reader *src, book_toc *out, error *err)
{
    assert(src != nullptr);
    assert(out != nullptr);

    memory_stream mem{};
    defer { free(&mem); };
    u32 version = 0;

    if (!_read_record(src, BOOK_RECORD_ID_TOC, BOOK_TOC_VERSION, &version, &mem, err))
        return false;

    _payload p{(const u8*)mem.data, mem.size, 0};

    if (!_toc_decoders[version](&p, out, err))
        return false;

    return _check_consumed(&p, err);
}
