
#pragma once

/* book_record.hpp

Versioned encoding of the records stored in a book file: the file header and
the table of contents.

Each record is prefixed with
    u32 record id
    u32 schema version
    u64 payload size
followed by the payload. All integers are big endian.

Decoding accepts every schema version up to the latest one and always yields
the latest in-memory struct; older payloads are upgraded by their decoder.
 */

#include "shl/array.hpp"
#include "shl/error.hpp"
#include "book/bookfile.hpp"
#include "book/range_reader.hpp"

#define BOOK_RECORD_ID_HEADER 1
#define BOOK_RECORD_ID_TOC    2

// latest schema versions
#define BOOK_HEADER_VERSION 1
#define BOOK_TOC_VERSION    1

#define BOOK_RECORD_PREFIX_SIZE 16

struct book_toc
{
    array<book_toc_entry> entries;
};

void init(book_toc *toc);
void free(book_toc *toc);

void book_toc_add(book_toc *toc, const book_toc_entry *entry);

// appends the encoded record to out
void book_record_encode(const book_file_header *header, array<u8> *out);
void book_record_encode(const book_toc *toc, array<u8> *out);

/* decodes one record starting at the current position of src.
   wrong record ids, unknown versions and malformed payloads fail with
   BOOK_ERROR_INVALID_FORMAT.
   out must be initialized.
 */
bool book_record_decode(book_range_reader *src, book_file_header *out, error *err = nullptr);
bool book_record_decode(book_range_reader *src, book_toc *out, error *err = nullptr);
